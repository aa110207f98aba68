#include "scorer.h"

#include <algorithm>

static int TileValue(char letter, bool is_blank) {
  return is_blank ? 0 : kLetterValues[letter - 'A'];
}

ScoreDetails ScorePlacements(
    const Board& board, Axis axis, const vector<Placement>& placements
) {
  ScoreDetails details = {0, 0, 0, 0, {}};
  if (placements.empty()) return details;

  int index = LineIndex(axis, placements[0].row, placements[0].col);
  BoardLine line = board.Line(axis, index);

  // New tiles by position along the line.
  const Placement* placed[kBoardSize] = {nullptr};
  int lo = kBoardSize, hi = -1;
  for (const auto& p : placements) {
    int pos = LinePos(axis, p.row, p.col);
    placed[pos] = &p;
    lo = min(lo, pos);
    hi = max(hi, pos);
  }
  while (line.IsOccupied(lo - 1)) lo--;
  while (line.IsOccupied(hi + 1)) hi++;

  string main_word;
  int main_sum = 0, main_mult = 1;
  for (int pos = lo; pos <= hi; pos++) {
    const Square& sq = line[pos];
    if (const Placement* p = placed[pos]) {
      main_word.push_back(p->letter);
      main_sum += TileValue(p->letter, p->is_blank) * sq.letter_mult;
      main_mult *= sq.word_mult;
    } else if (!sq.IsEmpty()) {
      main_word.push_back(sq.letter);
      main_sum += sq.Value();
    }
  }
  if (main_word.size() > 1) {
    details.main_word = main_sum * main_mult;
    details.words.push_back(main_word);
  }

  for (int pos = lo; pos <= hi; pos++) {
    const Placement* p = placed[pos];
    if (!p) continue;
    BoardLine perp = board.Line(Other(axis), pos);
    int start = index, end = index;
    while (perp.IsOccupied(start - 1)) start--;
    while (perp.IsOccupied(end + 1)) end++;
    if (start == end) continue;

    const Square& sq = line[pos];
    string word;
    int sum = 0;
    for (int i = start; i <= end; i++) {
      if (i == index) {
        word.push_back(p->letter);
        sum += TileValue(p->letter, p->is_blank) * sq.letter_mult;
      } else {
        word.push_back(perp[i].letter);
        sum += perp[i].Value();
      }
    }
    details.cross_words += sum * sq.word_mult;
    details.words.push_back(word);
  }

  if (static_cast<int>(placements.size()) == kRackSize) {
    details.bingo = kBingoBonus;
  }
  details.total = details.main_word + details.cross_words + details.bingo;
  return details;
}

int ScoreMove(const Move& move, const Board& board) {
  return ScorePlacements(board, move.axis, move.placements).total;
}
