#ifndef CROSS_CHECKS_H
#define CROSS_CHECKS_H

#include <stdint.h>

#include "board.h"
#include "gaddag.h"

using namespace std;

const uint32_t kAllLetters = (1u << kNumLetters) - 1;

// For every empty square and each direction of play, the letters that can go
// there without spoiling the perpendicular word (if there is one).
//
// All lookups are in line coordinates: |line| is the row for kHorizontal
// plays and the column for kVertical ones, |pos| the position along it.
// This is a cache derived from a Board; call Compute() again whenever the
// board changes.
class CrossChecks {
 public:
  explicit CrossChecks(const Gaddag* dict);

  void Compute(const Board& board);

  // Bit i is set if 'A' + i may be played here. Occupied squares allow
  // nothing; squares with no perpendicular neighbor allow everything.
  uint32_t Allowed(Axis axis, int line, int pos) const { return allowed_[axis][Index(line, pos)]; }
  bool IsAllowed(Axis axis, int line, int pos, int letter) const {
    return Allowed(axis, line, pos) & (1u << letter);
  }

  // True if a tile here would extend a perpendicular run of tiles.
  bool HasCrossWord(Axis axis, int line, int pos) const {
    return has_cross_[axis][Index(line, pos)];
  }
  // Face value of the tiles already in that perpendicular word. The scorer
  // recomputes this itself; it is exposed for callers and bindings.
  int CrossSum(Axis axis, int line, int pos) const { return cross_sum_[axis][Index(line, pos)]; }

  bool operator==(const CrossChecks& other) const;

 private:
  static int Index(int line, int pos) { return line * kBoardSize + pos; }
  void ComputeSquare(const Board& board, Axis axis, int line, int pos);

  const Gaddag* dict_;
  uint32_t allowed_[2][kNumSquares];
  int cross_sum_[2][kNumSquares];
  bool has_cross_[2][kNumSquares];
};

#endif  // CROSS_CHECKS_H
