#include "evaluation.hpp"

const double squareBonus[BOARD_SIZE][BOARD_SIZE] = {
  { 0, 0,    0,   0,   0,   0,   0,    0 },
  { 0, 0,    0,   0,   0,   0,   0,    0 },
  { 0, 0.25, 0.5, 0.5, 0.5, 0.5, 0.25, 0 },
  { 0, 0.25, 0.5, 1.0, 1.0, 0.5, 0.25, 0 },
  { 0, 0.25, 0.5, 1.0, 1.0, 0.5, 0.25, 0 },
  { 0, 0.25, 0.5, 0.5, 0.5, 0.5, 0.25, 0 },
  { 0, 0,    0,   0,   0,   0,   0,    0 },
  { 0, 0,    0,   0,   0,   0,   0,    0 }
};

double material(const Board &b, Color principal){
  double s=0;
  for(int r=0;r<BOARD_SIZE;r++)
    for(int c=0;c<BOARD_SIZE;c++)
      if(b.cells[r][c]!=NO_PIECE) s += pieceValue[b.cells[r][c]];
  return principal==WHITE ? s : -s;
}

// Principal pawns guarded by an own pawn one rank behind, counted only on the principal's plies.
double pawnStructure(const Board &b, const SearchNode &node, Color principal){
  if(!node.principalToMove) return 0;
  Piece pawn = pawnOf(principal);
  int behind = principal==WHITE ? -1 : 1;
  double pts=0;
  for(int r=0;r<BOARD_SIZE;r++){
    for(int c=0;c<BOARD_SIZE;c++){
      if(b.cells[r][c]!=pawn) continue;
      int br = r + behind;
      if(onBoard(br,c-1) && b.cells[br][c-1]==pawn) pts += 1;
      if(onBoard(br,c+1) && b.cells[br][c+1]==pawn) pts += 1;
    }
  }
  return pts;
}

double mobility(const Board &b, SearchNode &node, Color principal){
  double m=0;
  std::vector<SearchNode> &children = getChildren(node, b, principal);
  for(size_t i=0;i<children.size();i++){
    const Move &mv = children[i].move;
    for(int j=0;j<mv.count;j++){
      const Change &ch = mv.changes[j];
      if(ch.piece==NO_PIECE || isKing(ch.piece)) continue;
      m += squareBonus[ch.row][ch.col];
    }
  }
  return node.principalToMove ? m : -m;
}

double evaluate(const Board &b, SearchNode &node, Color principal){
  return MATERIAL_WEIGHT * material(b, principal)
       + PAWN_STRUCTURE_WEIGHT * pawnStructure(b, node, principal)
       + MOBILITY_WEIGHT * mobility(b, node, principal);
}
