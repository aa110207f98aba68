#include "cross_checks.h"

#include <cstring>

CrossChecks::CrossChecks(const Gaddag* dict) : dict_(dict) {
  memset(allowed_, 0, sizeof(allowed_));
  memset(cross_sum_, 0, sizeof(cross_sum_));
  memset(has_cross_, 0, sizeof(has_cross_));
}

void CrossChecks::Compute(const Board& board) {
  for (int axis = kHorizontal; axis <= kVertical; axis++) {
    for (int line = 0; line < kBoardSize; line++) {
      for (int pos = 0; pos < kBoardSize; pos++) {
        ComputeSquare(board, static_cast<Axis>(axis), line, pos);
      }
    }
  }
}

void CrossChecks::ComputeSquare(const Board& board, Axis axis, int line, int pos) {
  int idx = Index(line, pos);
  allowed_[axis][idx] = 0;
  cross_sum_[axis][idx] = 0;
  has_cross_[axis][idx] = false;
  if (board.Line(axis, line).IsOccupied(pos)) {
    return;
  }

  // The perpendicular line crosses this one at |pos|; this square sits at
  // position |line| along it.
  BoardLine perp = board.Line(Other(axis), pos);
  int start = line, end = line;
  while (perp.IsOccupied(start - 1)) start--;
  while (perp.IsOccupied(end + 1)) end++;
  if (start == line && end == line) {
    allowed_[axis][idx] = kAllLetters;
    return;
  }

  has_cross_[axis][idx] = true;
  int sum = 0;
  for (int i = start; i <= end; i++) {
    if (i != line) sum += perp[i].Value();
  }
  cross_sum_[axis][idx] = sum;

  // The perpendicular word is read backwards from its last letter, so the
  // tiles after this square are shared by every candidate letter.
  uint32_t node = dict_->Root();
  for (int i = end; i > line; i--) {
    node = dict_->Descend(node, perp[i].letter - 'A');
    if (node == kNoNode) return;
  }

  uint32_t allowed = 0;
  for (int c = 0; c < kNumLetters; c++) {
    uint32_t n = dict_->Descend(node, c);
    for (int i = line - 1; i >= start && n != kNoNode; i--) {
      n = dict_->Descend(n, perp[i].letter - 'A');
    }
    if (n != kNoNode && dict_->IsWord(n)) {
      allowed |= (1u << c);
    }
  }
  allowed_[axis][idx] = allowed;
}

bool CrossChecks::operator==(const CrossChecks& other) const {
  return memcmp(allowed_, other.allowed_, sizeof(allowed_)) == 0 &&
         memcmp(cross_sum_, other.cross_sum_, sizeof(cross_sum_)) == 0 &&
         memcmp(has_cross_, other.has_cross_, sizeof(has_cross_)) == 0;
}
