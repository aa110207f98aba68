// Move generation with a GADDAG (Gordon, "A Faster Scrabble Move Generation
// Algorithm", 1994).
#ifndef MOVE_GENERATOR_H
#define MOVE_GENERATOR_H

#include <stdint.h>

#include <chrono>
#include <functional>
#include <vector>

#include "board.h"
#include "cross_checks.h"
#include "gaddag.h"
#include "move.h"
#include "rack.h"

using namespace std;

struct GenerateOptions {
  // Polled before each anchor is searched. Returning true aborts the search
  // with a CancellationError.
  function<bool()> should_cancel;
  // Wall-clock budget, checked at the same points. Zero means no limit.
  chrono::milliseconds time_budget{0};
};

// Finds every legal play for a rack on a board. The Gaddag is only read and
// may be shared between generators; a single generator keeps per-search state
// and must not run two searches at once.
class MoveGenerator {
 public:
  explicit MoveGenerator(const Gaddag* dict) : dict_(dict), checks_(dict) {}

  // Moves are returned in no particular order. Throws CancellationError if
  // |options| stops the search early.
  vector<Move> Generate(
      const Board& board, const Rack& rack, const GenerateOptions& options = GenerateOptions()
  );

  // Cross-checks computed for the most recent Generate() call.
  const CrossChecks& LastCrossChecks() const { return checks_; }

 private:
  void SearchAnchor(int row, int col, Axis axis);
  void Gen(int pos, uint32_t node, bool forward);
  void Play(int pos, int letter, bool is_blank, uint32_t node, bool forward);
  void GoOn(int pos, uint32_t node, bool forward);
  void Record(int start, int end);

  BoardLine CurrentLine() const { return board_->Line(axis_, line_index_); }

  const Gaddag* dict_;
  CrossChecks checks_;

  // State for the search in progress.
  const Board* board_;
  Rack rack_;
  bool anchors_[kNumSquares];
  Axis axis_;
  int line_index_;
  int anchor_;      // position of the anchor along the line
  int left_limit_;  // leftmost empty square a tile may go on
  int start_;       // first square of the word, once we've turned around
  vector<Placement> placed_;
  vector<Move>* out_;
};

#endif  // MOVE_GENERATOR_H
