#ifndef MOVE_H
#define MOVE_H

#include <string>
#include <tuple>
#include <vector>

#include "board.h"

using namespace std;

// One tile put down by a move.
struct Placement {
  int row;
  int col;
  char letter;    // 'A'-'Z'; for a blank, the letter it stands for.
  bool is_blank;

  bool operator==(const Placement& o) const {
    return row == o.row && col == o.col && letter == o.letter && is_blank == o.is_blank;
  }
  bool operator<(const Placement& o) const {
    return tie(row, col, letter, is_blank) < tie(o.row, o.col, o.letter, o.is_blank);
  }
};

// A fully scored play. Moves are plain values; nothing in the engine holds on
// to or modifies one after returning it.
struct Move {
  Axis axis = kHorizontal;
  // First square of the main word (which may start on an existing tile).
  int row = 0;
  int col = 0;
  // Newly placed tiles, in order along the main word.
  vector<Placement> placements;
  // The main word first, then every perpendicular word the move forms.
  vector<string> words;
  int score = 0;

  // e.g. "8D CAtS 20" (row first for horizontal plays, column first for
  // vertical ones, blanks in lowercase).
  string ToString() const;

  // Same tiles on the same squares in the same direction.
  bool operator==(const Move& o) const {
    return axis == o.axis && placements == o.placements;
  }
  bool operator<(const Move& o) const {
    return tie(axis, placements) < tie(o.axis, o.placements);
  }
};

#endif  // MOVE_H
