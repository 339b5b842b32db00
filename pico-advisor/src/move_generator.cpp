#include "move_generator.hpp"

static const int rookDirs[4][2]   = { {1,0}, {-1,0}, {0,1}, {0,-1} };
static const int bishopDirs[4][2] = { {-1,-1}, {-1,1}, {1,-1}, {1,1} };
static const int knightJumps[8][2] = {
  {-2,-1}, {-2,1}, {-1,-2}, {-1,2}, {1,-2}, {1,2}, {2,-1}, {2,1}
};
static const int kingSteps[8][2] = {
  {-1,-1}, {-1,0}, {-1,1}, {0,-1}, {0,1}, {1,-1}, {1,0}, {1,1}
};

void addChange(const Board &b, Move &m, int r, int c, Piece piece){
  Change &ch = m.changes[m.count++];
  ch.row=(uint8_t)r; ch.col=(uint8_t)c;
  ch.piece=piece;
  ch.prev=b.cells[r][c];
}

void addMove(MoveList &list, const Move &m){ list.push_back(m); }
void addMoveFront(MoveList &list, const Move &m){ list.insert(list.begin(), m); }

void makeMove(Board &b, const Move &m){
  for(int i=0;i<m.count;i++){ const Change &ch=m.changes[i]; b.cells[ch.row][ch.col]=ch.piece; }
}

void unmakeMove(Board &b, const Move &m){
  for(int i=m.count-1;i>=0;i--){ const Change &ch=m.changes[i]; b.cells[ch.row][ch.col]=ch.prev; }
}

static Move buildMove(const Board &b, int fr, int fc, int tr, int tc, Piece placed){
  Move m; m.count=0;
  addChange(b, m, tr, tc, placed);
  addChange(b, m, fr, fc, NO_PIECE);
  return m;
}

static bool slides(Piece p){
  return !(p==WN || p==BN || isKing(p));
}

void addMoveInDir(const Board &b, MoveList &list, Color color, int r, int c, int dr, int dc){
  Piece mover = b.cells[r][c];
  for(int depth=1; ; depth++){
    int r1 = r + depth*dr, c1 = c + depth*dc;
    if(!onBoard(r1,c1)) return;
    Piece target = b.cells[r1][c1];
    if(isColor(target, color)) return;
    if(target!=NO_PIECE){
      Move m = buildMove(b, r, c, r1, c1, mover);
      if(absValue(target) > absValue(mover)) addMoveFront(list, m);
      else addMove(list, m);
      return;
    }
    addMove(list, buildMove(b, r, c, r1, c1, mover));
    if(!slides(mover)) return;
  }
}

static void pawnMoves(const Board &b, MoveList &list, Color color, int r, int c){
  int dir = color==WHITE ? 1 : -1;
  int homeRow = color==WHITE ? 1 : 6;
  int lastRow = color==WHITE ? 7 : 0;
  int r1 = r + dir;
  if(!onBoard(r1,c)) return;
  Piece placed = r1==lastRow ? queenOf(color) : pawnOf(color);
  Color enemy = opposite(color);

  // diagonal captures always go first
  if(c+1<BOARD_SIZE && isColor(b.cells[r1][c+1], enemy))
    addMoveFront(list, buildMove(b, r, c, r1, c+1, placed));
  if(c-1>=0 && isColor(b.cells[r1][c-1], enemy))
    addMoveFront(list, buildMove(b, r, c, r1, c-1, placed));

  if(b.cells[r1][c]==NO_PIECE){
    addMove(list, buildMove(b, r, c, r1, c, placed));
    int r2 = r + 2*dir;
    if(r==homeRow && b.cells[r2][c]==NO_PIECE)
      addMove(list, buildMove(b, r, c, r2, c, pawnOf(color)));
  }
}

static void slideMoves(const Board &b, MoveList &list, Color color, int r, int c, const int dirs[][2], int n){
  for(int i=0;i<n;i++) addMoveInDir(b, list, color, r, c, dirs[i][0], dirs[i][1]);
}

void generateMoves(const Board &b, Color color, MoveList &list){
  list.clear();
  for(int r=0;r<BOARD_SIZE;r++){
    for(int c=0;c<BOARD_SIZE;c++){
      Piece p = b.cells[r][c];
      if(!isColor(p, color)) continue;
      switch(color==WHITE ? p : (Piece)(p-BP)){
        case WP: pawnMoves(b, list, color, r, c); break;
        case WR: slideMoves(b, list, color, r, c, rookDirs, 4); break;
        case WB: slideMoves(b, list, color, r, c, bishopDirs, 4); break;
        case WQ:
          slideMoves(b, list, color, r, c, rookDirs, 4);
          slideMoves(b, list, color, r, c, bishopDirs, 4);
          break;
        case WN: slideMoves(b, list, color, r, c, knightJumps, 8); break;
        case WK: slideMoves(b, list, color, r, c, kingSteps, 8); break;
        default: break;
      }
    }
  }
}
