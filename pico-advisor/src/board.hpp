#pragma once

#include "platform.hpp"
#include <cstdint>

enum Color { WHITE, BLACK };

enum Piece : uint8_t {
  WP, WN, WB, WR, WQ, WK,
  BP, BN, BB, BR, BQ, BK, NO_PIECE
};

constexpr int BOARD_SIZE = 8;
constexpr int BOARD_CELLS = BOARD_SIZE * BOARD_SIZE;
constexpr char EMPTY_SYMBOL = '.';

// Signed material value of each piece, positive for White.
extern const double pieceValue[12];

// Row 0 is the first rank of the input string; White pawns advance toward row 7.
struct Board {
  Piece cells[BOARD_SIZE][BOARD_SIZE];
};

inline bool onBoard(int r, int c){ return r>=0 && r<BOARD_SIZE && c>=0 && c<BOARD_SIZE; }
inline bool isWhite(Piece p){ return p<=WK; }
inline bool isBlack(Piece p){ return p>=BP && p<=BK; }
inline bool isColor(Piece p, Color c){ return p!=NO_PIECE && (c==WHITE ? isWhite(p) : isBlack(p)); }
inline bool isKing(Piece p){ return p==WK || p==BK; }
inline Color opposite(Color c){ return c==WHITE ? BLACK : WHITE; }
inline Piece pawnOf(Color c){ return c==WHITE ? WP : BP; }
inline Piece queenOf(Color c){ return c==WHITE ? WQ : BQ; }
inline double absValue(Piece p){ double v=pieceValue[p]; return v<0 ? -v : v; }

char pieceSymbol(Piece p);
bool symbolPiece(char c, Piece &p);

void clearBoard(Board &b);
bool loadBoard(const String &cells, Board &b);
bool parseColor(const String &token, Color &c);
String serializeBoard(const Board &b);
bool sameBoard(const Board &a, const Board &b);
void printBoard(const Board &b);
