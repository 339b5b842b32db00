#pragma once

#include "board.hpp"
#include <vector>

constexpr int MAX_CHANGES = 2;

// One cell written by a move: its new content and its content when the move was built.
struct Change {
  uint8_t row, col;
  Piece piece;
  Piece prev;
};

// Destination is always changes[0], origin changes[1].
struct Move {
  Change changes[MAX_CHANGES];
  uint8_t count;
};

typedef std::vector<Move> MoveList;

void addChange(const Board &b, Move &m, int r, int c, Piece piece);
void addMove(MoveList &list, const Move &m);
void addMoveFront(MoveList &list, const Move &m);

void makeMove(Board &b, const Move &m);
void unmakeMove(Board &b, const Move &m);

void addMoveInDir(const Board &b, MoveList &list, Color color, int r, int c, int dr, int dc);
void generateMoves(const Board &b, Color color, MoveList &list);
