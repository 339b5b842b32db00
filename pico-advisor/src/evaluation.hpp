#pragma once

#include "search_node.hpp"

constexpr double MATERIAL_WEIGHT = 10.0;
constexpr double PAWN_STRUCTURE_WEIGHT = 1.0;
constexpr double MOBILITY_WEIGHT = 5.0;

// Bonus for occupying central squares, zero outside the table.
extern const double squareBonus[BOARD_SIZE][BOARD_SIZE];

double material(const Board &b, Color principal);
double pawnStructure(const Board &b, const SearchNode &node, Color principal);
double mobility(const Board &b, SearchNode &node, Color principal);
double evaluate(const Board &b, SearchNode &node, Color principal);
