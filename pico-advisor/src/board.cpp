#include "board.hpp"

const double pieceValue[12] = {
  1.0, 3.5, 3.5, 5.25, 10.0, 200.0,
  -1.0,-3.5,-3.5,-5.25,-10.0,-200.0
};

static const char pieceSymbols[13] = {
  'P','N','B','R','Q','K',
  'p','n','b','r','q','k', EMPTY_SYMBOL
};

char pieceSymbol(Piece p){ return pieceSymbols[p]; }

bool symbolPiece(char c, Piece &p){
  for(int i=WP; i<=NO_PIECE; i++){
    if(pieceSymbols[i]==c){ p=(Piece)i; return true; }
  }
  return false;
}

void clearBoard(Board &b){
  for(int r=0;r<BOARD_SIZE;r++) for(int c=0;c<BOARD_SIZE;c++) b.cells[r][c]=NO_PIECE;
}

bool loadBoard(const String &cells, Board &b){
  if(cells.length()!=BOARD_CELLS) return false;
  clearBoard(b);
  for(int i=0;i<BOARD_CELLS;i++){
    Piece p;
    if(!symbolPiece(cells[i], p)) return false;
    b.cells[i/BOARD_SIZE][i%BOARD_SIZE]=p;
  }
  return true;
}

bool parseColor(const String &token, Color &c){
  if(token=="w" || token=="white"){ c=WHITE; return true; }
  if(token=="b" || token=="black"){ c=BLACK; return true; }
  return false;
}

String serializeBoard(const Board &b){
  String out;
  out.reserve(BOARD_CELLS);
  for(int r=0;r<BOARD_SIZE;r++)
    for(int c=0;c<BOARD_SIZE;c++) out+=pieceSymbol(b.cells[r][c]);
  return out;
}

bool sameBoard(const Board &a, const Board &b){
  for(int r=0;r<BOARD_SIZE;r++)
    for(int c=0;c<BOARD_SIZE;c++) if(a.cells[r][c]!=b.cells[r][c]) return false;
  return true;
}

void printBoard(const Board &b){
  for(int r=0;r<BOARD_SIZE;r++){
    String line(r);
    for(int c=0;c<BOARD_SIZE;c++){ line+=' '; line+=pieceSymbol(b.cells[r][c]); }
    PLATFORM_PRINT(line);
  }
  PLATFORM_PRINT("  0 1 2 3 4 5 6 7");
}
