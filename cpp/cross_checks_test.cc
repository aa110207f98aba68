#include "cross_checks.h"

#include <gtest/gtest.h>

#include "scorer.h"

namespace {

uint32_t Bit(char letter) { return 1u << (letter - 'A'); }

Board CatBoard() {
  Board b;
  b.Place(7, 7, 'C');
  b.Place(7, 8, 'A');
  b.Place(7, 9, 'T');
  return b;
}

TEST(CrossChecksTest, ExtendingAWord) {
  auto g = Gaddag::Build({"CAT", "CATS", "AT"});
  CrossChecks checks(g.get());
  checks.Compute(CatBoard());

  // A vertical play through (7, 10) must keep CAT? a word.
  EXPECT_EQ(Bit('S'), checks.Allowed(kVertical, 10, 7));
  EXPECT_TRUE(checks.IsAllowed(kVertical, 10, 7, 'S' - 'A'));
  EXPECT_TRUE(checks.HasCrossWord(kVertical, 10, 7));
  EXPECT_EQ(5, checks.CrossSum(kVertical, 10, 7));

  // Nothing goes in front of CAT.
  EXPECT_EQ(0u, checks.Allowed(kVertical, 6, 7));
  EXPECT_TRUE(checks.HasCrossWord(kVertical, 6, 7));

  // A horizontal play through (6, 9) needs ?T, and (8, 8) needs A?.
  EXPECT_EQ(Bit('A'), checks.Allowed(kHorizontal, 6, 9));
  EXPECT_EQ(1, checks.CrossSum(kHorizontal, 6, 9));
  EXPECT_EQ(Bit('T'), checks.Allowed(kHorizontal, 8, 8));
  EXPECT_EQ(1, checks.CrossSum(kHorizontal, 8, 8));

  // Below the C only C? would do, and there is no such word.
  EXPECT_EQ(0u, checks.Allowed(kHorizontal, 8, 7));
}

TEST(CrossChecksTest, WithoutTheLongerWord) {
  auto g = Gaddag::Build({"CAT", "AT"});
  CrossChecks checks(g.get());
  checks.Compute(CatBoard());
  EXPECT_EQ(0u, checks.Allowed(kVertical, 10, 7));
  EXPECT_TRUE(checks.HasCrossWord(kVertical, 10, 7));
}

TEST(CrossChecksTest, UnconstrainedAndOccupiedSquares) {
  auto g = Gaddag::Build({"CAT", "CATS", "AT"});
  CrossChecks checks(g.get());
  checks.Compute(CatBoard());

  EXPECT_EQ(kAllLetters, checks.Allowed(kHorizontal, 0, 0));
  EXPECT_FALSE(checks.HasCrossWord(kHorizontal, 0, 0));
  EXPECT_EQ(0, checks.CrossSum(kHorizontal, 0, 0));

  // Squares in line with CAT have no perpendicular word for plays along it.
  EXPECT_EQ(kAllLetters, checks.Allowed(kHorizontal, 7, 10));
  EXPECT_EQ(kAllLetters, checks.Allowed(kVertical, 9, 6));

  for (int col = 7; col <= 9; col++) {
    EXPECT_EQ(0u, checks.Allowed(kHorizontal, 7, col));
    EXPECT_EQ(0u, checks.Allowed(kVertical, col, 7));
  }
}

TEST(CrossChecksTest, FillingAGap) {
  auto g = Gaddag::Build({"CAT", "COT", "CUT", "AT"});
  Board b;
  b.Place(7, 7, 'C');
  b.Place(7, 9, 'T', true);
  CrossChecks checks(g.get());
  checks.Compute(b);
  EXPECT_EQ(Bit('A') | Bit('O') | Bit('U'), checks.Allowed(kVertical, 8, 7));
  // The blank T counts for nothing.
  EXPECT_EQ(3, checks.CrossSum(kVertical, 8, 7));
}

TEST(CrossChecksTest, RecomputingIsIdempotent) {
  auto g = Gaddag::Build({"CAT", "CATS", "AT"});
  Board b = CatBoard();
  CrossChecks a(g.get()), c(g.get());
  a.Compute(b);
  c.Compute(b);
  c.Compute(b);
  EXPECT_TRUE(a == c);

  b.Place(7, 10, 'S');
  c.Compute(b);
  EXPECT_FALSE(a == c);
  EXPECT_EQ(0u, c.Allowed(kVertical, 10, 7));
}

TEST(CrossChecksTest, CrossSumMatchesScorer) {
  auto g = Gaddag::Build({"CAT", "CATS", "AT"});
  Board b = CatBoard();
  CrossChecks checks(g.get());
  checks.Compute(b);

  // A lone S after CAT on a plain square scores exactly the cross sum plus S.
  auto d = ScorePlacements(b, kVertical, {{7, 10, 'S', false}});
  EXPECT_EQ(checks.CrossSum(kVertical, 10, 7) + kLetterValues['S' - 'A'], d.cross_words);

  // A blank T below the A adds nothing to the cross sum; (8, 8) is a double
  // letter, which doubles nothing for a blank.
  d = ScorePlacements(b, kHorizontal, {{8, 8, 'T', true}});
  EXPECT_EQ(checks.CrossSum(kHorizontal, 8, 8), d.cross_words);
}

}  // namespace
