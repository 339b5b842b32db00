#include "search_node.hpp"

SearchNode::SearchNode(bool principal)
  : hasMove(false), principalToMove(principal), expanded(false), score(0.0) {
  move.count=0;
}

SearchNode::SearchNode(const Move &m, bool principal)
  : move(m), hasMove(true), principalToMove(principal), expanded(false), score(0.0) {}

std::vector<SearchNode>& getChildren(SearchNode &node, const Board &b, Color principal){
  if(!node.expanded){
    MoveList moves;
    generateMoves(b, sideToMove(node, principal), moves);
    node.children.reserve(moves.size());
    for(size_t i=0;i<moves.size();i++) node.children.push_back(SearchNode(moves[i], !node.principalToMove));
    node.expanded=true;
  }
  return node.children;
}

bool isTerminal(const SearchNode &node){
  if(!node.hasMove) return false;
  for(int i=0;i<node.move.count;i++){
    const Change &ch=node.move.changes[i];
    if(ch.prev==WK && isBlack(ch.piece)) return true;
    if(ch.prev==BK && isWhite(ch.piece)) return true;
  }
  return false;
}
