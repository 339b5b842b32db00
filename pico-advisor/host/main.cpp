#include "../src/chess_engine.hpp"

// Host build: pico_advisor <w|b> <64 cells> [maxdepth] [movetime_ms]
// Prints the board after the best move once per completed depth.

static void usage(){
  PLATFORM_PRINT("usage: pico_advisor <w|b> <64 cells> [maxdepth] [movetime_ms]");
}

int main(int argc, char **argv){
  if(argc<3 || argc>5){ usage(); return 1; }

  Engine engine;
  if(!setPosition(engine, argv[1], argv[2])){
    PLATFORM_PRINT("error: expected side w or b and 64 cells of PRBQKNprbqkn.");
    usage();
    return 1;
  }

  SearchLimits limits;
  limits.maxDepth = 0;
  limits.moveTimeMs = 0;
  limits.maxNodes = 0;
  int v;
  if(argc>3){
    if(!parseNumber(argv[3], v)){ usage(); return 1; }
    limits.maxDepth = v;
  }
  if(argc>4){
    if(!parseNumber(argv[4], v)){ usage(); return 1; }
    limits.moveTimeMs = (unsigned long)v;
  }

  DBG_PRINT(String("start ") + serializeBoard(engine.board));
  think(engine, limits, printReport);
  return 0;
}
