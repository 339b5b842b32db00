#include "test_util.hpp"

static void testLoadAndSerialize(){
  Board b;
  CHECK(loadBoard(START_CELLS, b));
  CHECK(b.cells[0][4]==WK);
  CHECK(b.cells[0][1]==WN);
  CHECK(b.cells[1][7]==WP);
  CHECK(b.cells[7][3]==BQ);
  CHECK(b.cells[6][0]==BP);
  CHECK(b.cells[4][4]==NO_PIECE);
  CHECK(serializeBoard(b)==String(START_CELLS));
}

static void testRejectsMalformed(){
  Board b;
  CHECK(!loadBoard("RNBQKBNR", b));
  CHECK(!loadBoard(String(START_CELLS) + String("."), b));
  String bad(START_CELLS);
  bad[20]='x';
  CHECK(!loadBoard(bad, b));
  bad[20]=' ';
  CHECK(!loadBoard(bad, b));
}

static void testSymbols(){
  Piece p;
  CHECK(symbolPiece('Q', p) && p==WQ);
  CHECK(symbolPiece('n', p) && p==BN);
  CHECK(symbolPiece('.', p) && p==NO_PIECE);
  CHECK(!symbolPiece('Z', p));
  for(int i=WP; i<=NO_PIECE; i++){
    CHECK(symbolPiece(pieceSymbol((Piece)i), p) && p==(Piece)i);
  }
}

static void testColors(){
  Color c;
  CHECK(parseColor("w", c) && c==WHITE);
  CHECK(parseColor("b", c) && c==BLACK);
  CHECK(parseColor("white", c) && c==WHITE);
  CHECK(parseColor("black", c) && c==BLACK);
  CHECK(!parseColor("x", c));
  CHECK(!parseColor("", c));
  CHECK(opposite(WHITE)==BLACK);
  CHECK(isColor(WK, WHITE) && !isColor(WK, BLACK));
  CHECK(!isColor(NO_PIECE, WHITE) && !isColor(NO_PIECE, BLACK));
}

static void testSameBoard(){
  Board a = boardFrom(START_CELLS);
  Board b = boardFrom(START_CELLS);
  CHECK(sameBoard(a, b));
  b.cells[3][3]=WQ;
  CHECK(!sameBoard(a, b));
}

int main(){
  testLoadAndSerialize();
  testRejectsMalformed();
  testSymbols();
  testColors();
  testSameBoard();
  return finish("test_board");
}
