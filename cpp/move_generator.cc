#include "move_generator.h"

#include <algorithm>

#include "anchors.h"
#include "errors.h"
#include "scorer.h"

vector<Move> MoveGenerator::Generate(
    const Board& board, const Rack& rack, const GenerateOptions& options
) {
  auto started = chrono::steady_clock::now();
  vector<Move> out;
  board_ = &board;
  rack_ = rack;
  out_ = &out;
  placed_.clear();
  placed_.reserve(kRackSize);
  checks_.Compute(board);

  auto anchors = FindAnchors(board);
  fill(anchors_, anchors_ + kNumSquares, false);
  for (const auto& [row, col] : anchors) {
    anchors_[row * kBoardSize + col] = true;
  }

  if (rack.IsEmpty()) return out;

  for (const auto& [row, col] : anchors) {
    if (options.should_cancel && options.should_cancel()) {
      throw CancellationError("Move generation was cancelled");
    }
    if (options.time_budget.count() > 0 &&
        chrono::steady_clock::now() - started > options.time_budget) {
      throw CancellationError("Move generation ran out of time");
    }
    SearchAnchor(row, col, kHorizontal);
    SearchAnchor(row, col, kVertical);
  }
  return out;
}

void MoveGenerator::SearchAnchor(int row, int col, Axis axis) {
  axis_ = axis;
  line_index_ = LineIndex(axis, row, col);
  anchor_ = LinePos(axis, row, col);

  // Tiles may only go on the run of empty, non-anchor squares before the
  // anchor. Anything further back is reached from an earlier anchor.
  BoardLine line = CurrentLine();
  left_limit_ = anchor_;
  while (left_limit_ > 0 && !line.IsOccupied(left_limit_ - 1) &&
         !anchors_[line.Row(left_limit_ - 1) * kBoardSize + line.Col(left_limit_ - 1)]) {
    left_limit_--;
  }

  start_ = anchor_;
  Gen(anchor_, dict_->Root(), false);
}

// Tries every way of filling |pos|: the tile already there, or any rack tile
// that the cross-checks and the automaton both allow.
void MoveGenerator::Gen(int pos, uint32_t node, bool forward) {
  BoardLine line = CurrentLine();
  if (line.IsOccupied(pos)) {
    uint32_t next = dict_->Descend(node, line[pos].letter - 'A');
    if (next != kNoNode) GoOn(pos, next, forward);
    return;
  }
  if (rack_.IsEmpty()) return;

  uint32_t candidates = checks_.Allowed(axis_, line_index_, pos);
  if (rack_.NumBlanks() == 0) {
    uint32_t on_rack = 0;
    for (int c = 0; c < kNumLetters; c++) {
      if (rack_.Count(c)) on_rack |= (1u << c);
    }
    candidates &= on_rack;
  }
  while (candidates) {
    int c = __builtin_ctz(candidates);
    candidates &= candidates - 1;
    uint32_t next = dict_->Descend(node, c);
    if (next == kNoNode) continue;
    if (rack_.Count(c)) Play(pos, c, false, next, forward);
    if (rack_.NumBlanks()) Play(pos, c, true, next, forward);
  }
}

void MoveGenerator::Play(int pos, int letter, bool is_blank, uint32_t node, bool forward) {
  BoardLine line = CurrentLine();
  int tile = is_blank ? kBlank : letter;
  rack_.Remove(tile);
  placed_.push_back({line.Row(pos), line.Col(pos), static_cast<char>('A' + letter), is_blank});
  GoOn(pos, node, forward);
  placed_.pop_back();
  rack_.Add(tile);
}

// |node| has just consumed the letter at |pos|.
void MoveGenerator::GoOn(int pos, uint32_t node, bool forward) {
  BoardLine line = CurrentLine();
  if (!forward) {
    bool left_clear = !line.IsOccupied(pos - 1);
    if (left_clear && dict_->IsWord(node) && !line.IsOccupied(anchor_ + 1)) {
      Record(pos, anchor_);
    }
    if (pos > 0 && (line.IsOccupied(pos - 1) || pos - 1 >= left_limit_)) {
      Gen(pos - 1, node, false);
    }
    if (left_clear && anchor_ + 1 < kBoardSize) {
      uint32_t sep = dict_->Descend(node, kSep);
      if (sep != kNoNode) {
        int saved = start_;
        start_ = pos;
        Gen(anchor_ + 1, sep, true);
        start_ = saved;
      }
    }
  } else {
    if (dict_->IsWord(node) && !line.IsOccupied(pos + 1)) {
      Record(start_, pos);
    }
    if (pos + 1 < kBoardSize) {
      Gen(pos + 1, node, true);
    }
  }
}

void MoveGenerator::Record(int start, int end) {
  if (placed_.empty() || end - start < 1) return;

  // A lone tile that makes words both ways is reported once, as a
  // horizontal play.
  if (axis_ == kVertical && placed_.size() == 1) {
    const Placement& p = placed_[0];
    if (board_->IsOccupied(p.row, p.col - 1) || board_->IsOccupied(p.row, p.col + 1)) {
      return;
    }
  }

  BoardLine line = CurrentLine();
  Move m;
  m.axis = axis_;
  m.row = line.Row(start);
  m.col = line.Col(start);
  m.placements = placed_;
  sort(m.placements.begin(), m.placements.end());

  ScoreDetails details = ScorePlacements(*board_, axis_, m.placements);
  m.words = details.words;
  m.score = details.total;
  out_->push_back(std::move(m));
}
