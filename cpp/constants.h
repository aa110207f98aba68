#ifndef CONSTANTS_H
#define CONSTANTS_H

// Standard English Scrabble rules.
const int kBoardSize = 15;
const int kNumSquares = kBoardSize * kBoardSize;
const int kCenter = 7;
const int kRackSize = 7;
const int kBingoBonus = 50;
const int kNumLetters = 26;

// Tile values, indexed by letter - 'A'. Blanks are always worth 0.
const int kLetterValues[kNumLetters] =
    // A, B, C, D, E, F, G, H, I, J, K, L, M, N, O, P,  Q, R, S, T, U, V, W, X, Y,  Z
    { 1, 3, 3, 2, 1, 4, 2, 4, 1, 8, 5, 1, 3, 1, 1, 3, 10, 1, 1, 1, 1, 4, 4, 8, 4, 10 };

// Tiles in a full bag, indexed by letter - 'A'.
const int kTileCounts[kNumLetters] =
    // A, B, C, D,  E, F, G, H, I, J, K, L, M, N, O, P, Q, R, S, T, U, V, W, X, Y, Z
    { 9, 2, 2, 4, 12, 2, 3, 2, 9, 1, 1, 4, 2, 6, 8, 2, 1, 6, 4, 6, 4, 2, 2, 1, 2, 1 };
const int kNumBlanks = 2;

// Premium squares. T = triple word, D = double word, t = triple letter,
// d = double letter. The center star is a double word square.
// clang-format off
const char* const kPremiumLayout[kBoardSize] = {
  "T..d...T...d..T",
  ".D...t...t...D.",
  "..D...d.d...D..",
  "d..D...d...D..d",
  "....D.....D....",
  ".t...t...t...t.",
  "..d...d.d...d..",
  "T..d...D...d..T",
  "..d...d.d...d..",
  ".t...t...t...t.",
  "....D.....D....",
  "d..D...d...D..d",
  "..D...d.d...D..",
  ".D...t...t...D.",
  "T..d...T...d..T",
};
// clang-format on

#endif  // CONSTANTS_H
