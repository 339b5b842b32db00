#include "test_util.hpp"

static void testMaterial(){
  Board b = boardFrom(START_CELLS);
  CHECK(material(b, WHITE)==0);
  CHECK(material(b, BLACK)==0);
  b.cells[7][3]=NO_PIECE;
  CHECK(material(b, WHITE)==10.0);
  CHECK(material(b, BLACK)==-10.0);
  b.cells[0][0]=NO_PIECE;
  CHECK(material(b, WHITE)==4.75);
}

static void testPawnStructure(){
  Board b = emptyBoard();
  b.cells[1][2]=WP;
  b.cells[1][4]=WP;
  b.cells[2][3]=WP;
  SearchNode mine(true), theirs(false);
  CHECK(pawnStructure(b, mine, WHITE)==2);
  CHECK(pawnStructure(b, theirs, WHITE)==0);
  // black pawns are not ours
  CHECK(pawnStructure(b, mine, BLACK)==0);

  b = emptyBoard();
  b.cells[6][2]=BP;
  b.cells[5][3]=BP;
  b.cells[4][4]=WP;
  CHECK(pawnStructure(b, mine, BLACK)==1);
  CHECK(pawnStructure(b, theirs, BLACK)==0);
  CHECK(pawnStructure(b, mine, WHITE)==0);
}

static void testMobility(){
  Board b = emptyBoard();
  b.cells[0][1]=WN;
  SearchNode mine(true);
  CHECK(mobility(b, mine, WHITE)==0.5);
  CHECK(mine.expanded);
  CHECK(mine.children.size()==3);

  // white to move but the principal is black
  SearchNode theirs(false);
  CHECK(mobility(b, theirs, BLACK)==-0.5);

  // king moves do not count
  b = emptyBoard();
  b.cells[3][3]=WK;
  SearchNode king(true);
  CHECK(mobility(b, king, WHITE)==0);
  CHECK(king.children.size()==8);
}

static void testEvaluate(){
  Board b = emptyBoard();
  b.cells[0][1]=WN;
  b.cells[0][7]=WK;
  b.cells[1][4]=WP;
  b.cells[2][5]=WP;
  b.cells[7][7]=BK;

  SearchNode mine(true);
  CHECK(material(b, WHITE)==5.5);
  CHECK(pawnStructure(b, mine, WHITE)==1);
  CHECK(mobility(b, mine, WHITE)==2.5);
  CHECK(evaluate(b, mine, WHITE)==68.5);

  SearchNode theirs(false);
  CHECK(evaluate(b, theirs, WHITE)==55.0);

  SearchNode blackTurn(true);
  CHECK(evaluate(b, blackTurn, BLACK)==-55.0);
}

static void testStartPosition(){
  Board b = boardFrom(START_CELLS);
  SearchNode white(true);
  CHECK(evaluate(b, white, WHITE)==35.0);
  SearchNode black(true);
  CHECK(evaluate(b, black, BLACK)==35.0);
  SearchNode reply(false);
  CHECK(evaluate(b, reply, WHITE)==-35.0);
}

static void testBonusTable(){
  CHECK(squareBonus[3][3]==1.0 && squareBonus[4][4]==1.0);
  CHECK(squareBonus[2][1]==0.25 && squareBonus[5][6]==0.25);
  CHECK(squareBonus[0][0]==0 && squareBonus[6][3]==0 && squareBonus[3][7]==0);
  double sum=0;
  for(int r=0;r<BOARD_SIZE;r++) for(int c=0;c<BOARD_SIZE;c++) sum+=squareBonus[r][c];
  CHECK(sum==12.0);
}

int main(){
  testMaterial();
  testPawnStructure();
  testMobility();
  testEvaluate();
  testStartPosition();
  testBonusTable();
  return finish("test_evaluation");
}
