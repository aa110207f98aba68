#ifndef SCORER_H
#define SCORER_H

#include <string>
#include <vector>

#include "board.h"
#include "move.h"

using namespace std;

struct ScoreDetails {
  int main_word;    // premium-adjusted score of the word along the move
  int cross_words;  // sum over every perpendicular word the move forms
  int bingo;        // kBingoBonus if all kRackSize tiles were placed
  int total;
  vector<string> words;  // main word first (if it has 2+ letters)
};

// Scores tiles placed along a single line of |board|, which must be the
// position just before the move. Letter and word premiums only count for
// squares covered by the new tiles; word premiums multiply together.
ScoreDetails ScorePlacements(const Board& board, Axis axis, const vector<Placement>& placements);

int ScoreMove(const Move& move, const Board& board);

#endif  // SCORER_H
