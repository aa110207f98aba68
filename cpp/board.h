#ifndef BOARD_H
#define BOARD_H

#include <stdint.h>

#include <string>
#include <vector>

#include "constants.h"

using namespace std;

struct Move;
class Rack;

enum Axis { kHorizontal = 0, kVertical = 1 };

inline Axis Other(Axis axis) { return axis == kHorizontal ? kVertical : kHorizontal; }

struct Square {
  char letter = 0;  // 'A'-'Z', or 0 if the square is empty.
  bool is_blank = false;
  uint8_t letter_mult = 1;
  uint8_t word_mult = 1;

  bool IsEmpty() const { return letter == 0; }
  // Face value of the tile on this square (0 for blanks and empty squares).
  int Value() const {
    return (letter == 0 || is_blank) ? 0 : kLetterValues[letter - 'A'];
  }
};

// A row (kHorizontal) or column (kVertical) of the board. Positions run left
// to right or top to bottom. Everything that walks the board does so through
// a BoardLine so that it only has to be written once for both directions.
class BoardLine {
 public:
  BoardLine(const Square* squares, Axis axis, int index)
      : squares_(squares), axis_(axis), index_(index) {}

  const Square& operator[](int pos) const { return squares_[pos]; }

  // Off-board positions count as empty.
  bool IsOccupied(int pos) const {
    return pos >= 0 && pos < kBoardSize && !squares_[pos].IsEmpty();
  }

  Axis GetAxis() const { return axis_; }
  int Row(int pos) const { return axis_ == kHorizontal ? index_ : pos; }
  int Col(int pos) const { return axis_ == kHorizontal ? pos : index_; }

 private:
  const Square* squares_;
  Axis axis_;
  int index_;
};

// Position of (row, col) along a line of the given axis, and the index of
// that line.
inline int LineIndex(Axis axis, int row, int col) { return axis == kHorizontal ? row : col; }
inline int LinePos(Axis axis, int row, int col) { return axis == kHorizontal ? col : row; }

class Board {
 public:
  Board();

  // Puts a tile on an empty square. Throws IllegalMoveError if the square is
  // off the board or already occupied, or if |letter| isn't A-Z.
  void Place(int row, int col, char letter, bool is_blank = false);

  // Places every tile of |move| after checking that each square is empty and
  // that |rack| holds the tiles. Throws IllegalMoveError otherwise, leaving
  // the board untouched.
  void Apply(const Move& move, const Rack& rack);

  // True if no tile has been played yet.
  bool IsEmpty() const { return num_tiles_ == 0; }
  int NumTiles() const { return num_tiles_; }

  const Square& At(int row, int col) const { return views_[kHorizontal][row * kBoardSize + col]; }
  static bool OnBoard(int row, int col) {
    return row >= 0 && row < kBoardSize && col >= 0 && col < kBoardSize;
  }
  bool IsOccupied(int row, int col) const { return OnBoard(row, col) && !At(row, col).IsEmpty(); }

  BoardLine Line(Axis axis, int index) const {
    return BoardLine(&views_[axis][index * kBoardSize], axis, index);
  }
  BoardLine SquaresInRow(int row) const { return Line(kHorizontal, row); }
  BoardLine SquaresInCol(int col) const { return Line(kVertical, col); }

  // bd is 15 lines of 15 characters (whitespace is ignored):
  //   '.'  empty square
  //   'A'  a tile
  //   'a'  a blank playing as 'A'
  // On failure, prints the reason and leaves the board unchanged.
  bool ParseBoard(const char* bd);
  bool ParseBoardStr(const string& bd) { return ParseBoard(bd.c_str()); }
  string AsString() const;

 private:
  void SetSquare(int row, int col, char letter, bool is_blank);

  // views_[kHorizontal] is row-major; views_[kVertical] is its transpose.
  // Only SetSquare() writes to them, and it always writes both.
  Square views_[2][kNumSquares];
  int num_tiles_;
};

#endif  // BOARD_H
