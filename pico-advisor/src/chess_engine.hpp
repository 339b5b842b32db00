#pragma once

#include "evaluation.hpp"
#include <limits>

constexpr int START_DEPTH = 2;
constexpr int MAX_SEARCH_DEPTH = 101;
constexpr double INF_SCORE = std::numeric_limits<double>::infinity();
// Depth 2 from the opening needs about 2940 nodes of roughly 40 bytes on the RP2040.
constexpr unsigned long DEVICE_MAX_NODES = 3500;
constexpr int MAX_NUMBER_DIGITS = 9;

// maxDepth, moveTimeMs and maxNodes of 0 mean no limit.
// maxNodes caps the nodes held by the search tree.
struct SearchLimits {
  int maxDepth;
  unsigned long moveTimeMs;
  unsigned long maxNodes;
};

struct SearchStats {
  unsigned long nodes;
  int depth;
  double score;
};

typedef void (*BoardReport)(const String &cells);

struct Engine {
  Board board;
  Color principal;
  SearchNode root;
  SearchStats stats;
  unsigned long treeNodes;
  unsigned long maxNodes;
  unsigned long stopTime;
  bool timed;
  bool stopSearch;

  Engine();
};

bool setPosition(Engine &e, const String &color, const String &cells);
void resetTree(Engine &e);
double alphaBeta(Engine &e, SearchNode &node, int depth, double alpha, double beta);
const SearchNode* bestChild(const SearchNode &root);
int think(Engine &e, const SearchLimits &limits, BoardReport report);

void printReport(const String &cells);
bool parseNumber(const String &s, int &out);
int extractInt(const String &s, const String &key);
bool parsePosition(Engine &e, const String &s);
int goCommand(Engine &e, const String &s);
