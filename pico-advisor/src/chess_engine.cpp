#include "chess_engine.hpp"

Engine::Engine()
  : principal(WHITE), root(true), treeNodes(0), maxNodes(0), stopTime(0), timed(false), stopSearch(false) {
  clearBoard(board);
  stats.nodes=0; stats.depth=0; stats.score=0;
}

static bool limitCheck(Engine &e){
  if(e.stopSearch) return true;
  if(e.timed && platformMillis() >= e.stopTime){
    e.stopSearch = true;
    return true;
  }
  if(e.maxNodes && e.treeNodes >= e.maxNodes){
    e.stopSearch = true;
    return true;
  }
  return false;
}

// Counts the children a first expansion adds to the tree.
static void countExpansion(Engine &e, const SearchNode &node, bool wasExpanded){
  if(!wasExpanded) e.treeNodes += node.children.size();
}

bool setPosition(Engine &e, const String &color, const String &cells){
  Color c;
  Board b;
  if(!parseColor(color, c)) return false;
  if(!loadBoard(cells, b)) return false;
  e.board = b;
  e.principal = c;
  resetTree(e);
  return true;
}

void resetTree(Engine &e){
  e.root = SearchNode(true);
  e.treeNodes = 0;
}

double alphaBeta(Engine &e, SearchNode &node, int depth, double alpha, double beta){
  e.stats.nodes++;
  bool wasExpanded = node.expanded;
  if(!wasExpanded && limitCheck(e)) return node.score;
  if(depth==0 || isTerminal(node)){
    node.score = evaluate(e.board, node, e.principal);
    countExpansion(e, node, wasExpanded);
    return node.score;
  }
  if(wasExpanded && limitCheck(e)) return node.score;

  std::vector<SearchNode> &children = getChildren(node, e.board, e.principal);
  countExpansion(e, node, wasExpanded);
  if(node.principalToMove){
    node.score = -INF_SCORE;
    for(size_t i=0;i<children.size();i++){
      SearchNode &child = children[i];
      makeMove(e.board, child.move);
      double sc = alphaBeta(e, child, depth-1, alpha, beta);
      unmakeMove(e.board, child.move);
      if(e.stopSearch) break;
      if(sc > node.score) node.score = sc;
      if(node.score > alpha) alpha = node.score;
      if(beta <= alpha) break;
    }
  } else {
    node.score = INF_SCORE;
    for(size_t i=0;i<children.size();i++){
      SearchNode &child = children[i];
      makeMove(e.board, child.move);
      double sc = alphaBeta(e, child, depth-1, alpha, beta);
      unmakeMove(e.board, child.move);
      if(e.stopSearch) break;
      if(sc < node.score) node.score = sc;
      if(node.score < beta) beta = node.score;
      if(beta <= alpha) break;
    }
  }
  return node.score;
}

// First root move whose score matches the root; ties go to generation order.
const SearchNode* bestChild(const SearchNode &root){
  for(size_t i=0;i<root.children.size();i++)
    if(root.children[i].score == root.score) return &root.children[i];
  return nullptr;
}

int think(Engine &e, const SearchLimits &limits, BoardReport report){
  e.stopSearch = false;
  e.timed = limits.moveTimeMs > 0;
  e.stopTime = platformMillis() + limits.moveTimeMs;
  e.maxNodes = limits.maxNodes;
  int maxDepth = MAX_SEARCH_DEPTH;
  if(limits.maxDepth > 0 && limits.maxDepth < MAX_SEARCH_DEPTH) maxDepth = limits.maxDepth;
  if(maxDepth < START_DEPTH) maxDepth = START_DEPTH;

  int rounds = 0;
  for(int d=START_DEPTH; d<=maxDepth; d++){
    e.stats.nodes = 0;
    double score = alphaBeta(e, e.root, d, -INF_SCORE, INF_SCORE);
    if(e.stopSearch) break;
    rounds++;
    e.stats.depth = d; e.stats.score = score;
    DBG_PRINT(String("info depth ") + String(d) + String(" score ") + String(score) + String(" nodes ") + String(e.stats.nodes));

    const SearchNode *best = bestChild(e.root);
    if(!best) continue;
    makeMove(e.board, best->move);
    report(serializeBoard(e.board));
#ifdef DEBUG_MODE
    printBoard(e.board);
#endif
    unmakeMove(e.board, best->move);
  }
  return rounds;
}

void printReport(const String &cells){ PLATFORM_PRINT(cells); }

// Plain decimal digits, short enough to fit an int.
bool parseNumber(const String &s, int &out){
  if(s.length()==0 || (int)s.length()>MAX_NUMBER_DIGITS) return false;
  for(unsigned int i=0;i<s.length();i++) if(s[i]<'0' || s[i]>'9') return false;
  out = s.toInt();
  return true;
}

int extractInt(const String &s, const String &key){
  int p = s.indexOf(key + " ");
  if(p<0) return -1;
  String tail = s.substring(p + key.length() + 1);
  tail.trim();
  int space = tail.indexOf(" ");
  if(space>=0) tail = tail.substring(0, space);
  int v;
  if(!parseNumber(tail, v)) return -1;
  return v;
}

// "board <w|b> <64 cells>"
bool parsePosition(Engine &e, const String &s){
  String rest = s.substring(5);
  rest.trim();
  int space = rest.indexOf(" ");
  if(space<0) return false;
  String color = rest.substring(0, space);
  String cells = rest.substring(space + 1);
  cells.trim();
  return setPosition(e, color, cells);
}

// "go [depth N] [movetime N] [nodes N]"
int goCommand(Engine &e, const String &s){
  SearchLimits limits;
  int d = extractInt(s, "depth");
  int t = extractInt(s, "movetime");
  int n = extractInt(s, "nodes");
  limits.maxDepth = d>0 ? d : 0;
  limits.moveTimeMs = t>0 ? (unsigned long)t : 0;
  limits.maxNodes = n>0 ? (unsigned long)n : 0;
#ifdef ARDUINO
  if(limits.maxNodes==0 || limits.maxNodes>DEVICE_MAX_NODES) limits.maxNodes = DEVICE_MAX_NODES;
#endif
  return think(e, limits, printReport);
}
