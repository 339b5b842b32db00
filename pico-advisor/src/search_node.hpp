#pragma once

#include "move_generator.hpp"

// One ply of the game tree. The board is not stored here: a node's position is
// reached by applying the moves on the path from the root to the shared board.
struct SearchNode {
  Move move;
  bool hasMove;
  bool principalToMove;
  bool expanded;
  double score;
  std::vector<SearchNode> children;

  explicit SearchNode(bool principal);
  SearchNode(const Move &m, bool principal);
};

inline Color sideToMove(const SearchNode &node, Color principal){
  return node.principalToMove ? principal : opposite(principal);
}

// Expands the node on first use and returns the cached list afterwards.
// The board must be in this node's position on the first call; later calls
// never look at the board, so a node revisited from another position keeps
// children that belong to the old one.
std::vector<SearchNode>& getChildren(SearchNode &node, const Board &b, Color principal);

// True when the move into this node captured a king.
bool isTerminal(const SearchNode &node);
