#include "board.h"

#include <stdio.h>

#include <cctype>

#include "errors.h"
#include "move.h"
#include "rack.h"

Board::Board() : num_tiles_(0) {
  for (int row = 0; row < kBoardSize; row++) {
    for (int col = 0; col < kBoardSize; col++) {
      Square sq;
      switch (kPremiumLayout[row][col]) {
        case 'T': sq.word_mult = 3; break;
        case 'D': sq.word_mult = 2; break;
        case 't': sq.letter_mult = 3; break;
        case 'd': sq.letter_mult = 2; break;
        default: break;
      }
      views_[kHorizontal][row * kBoardSize + col] = sq;
      views_[kVertical][col * kBoardSize + row] = sq;
    }
  }
}

void Board::SetSquare(int row, int col, char letter, bool is_blank) {
  Square& across = views_[kHorizontal][row * kBoardSize + col];
  Square& down = views_[kVertical][col * kBoardSize + row];
  across.letter = down.letter = letter;
  across.is_blank = down.is_blank = is_blank;
}

void Board::Place(int row, int col, char letter, bool is_blank) {
  if (!OnBoard(row, col)) {
    throw IllegalMoveError(
        "Square (" + to_string(row) + ", " + to_string(col) + ") is off the board"
    );
  }
  if (letter < 'A' || letter > 'Z') {
    throw IllegalMoveError("Can't place '" + string(1, letter) + "'");
  }
  if (!At(row, col).IsEmpty()) {
    throw IllegalMoveError(
        "Square (" + to_string(row) + ", " + to_string(col) + ") is already occupied"
    );
  }
  SetSquare(row, col, letter, is_blank);
  num_tiles_++;
}

void Board::Apply(const Move& move, const Rack& rack) {
  if (move.placements.empty()) {
    throw IllegalMoveError("Move places no tiles");
  }
  Rack remaining = rack;
  bool seen[kNumSquares] = {false};
  const Placement& first = move.placements[0];
  for (const auto& p : move.placements) {
    if (!OnBoard(p.row, p.col)) {
      throw IllegalMoveError(
          "Square (" + to_string(p.row) + ", " + to_string(p.col) + ") is off the board"
      );
    }
    if (LineIndex(move.axis, p.row, p.col) != LineIndex(move.axis, first.row, first.col)) {
      throw IllegalMoveError("Tiles of a move must share a single line");
    }
    int idx = p.row * kBoardSize + p.col;
    if (seen[idx] || !At(p.row, p.col).IsEmpty()) {
      throw IllegalMoveError(
          "Square (" + to_string(p.row) + ", " + to_string(p.col) + ") is not empty"
      );
    }
    seen[idx] = true;
    if (p.letter < 'A' || p.letter > 'Z') {
      throw IllegalMoveError("Can't place '" + string(1, p.letter) + "'");
    }
    int tile = p.is_blank ? kBlank : p.letter - 'A';
    if (!remaining.Remove(tile)) {
      throw IllegalMoveError(
          string("Rack ") + rack.AsString() + " has no " +
          (p.is_blank ? string("blank") : string(1, p.letter)) + " left"
      );
    }
  }

  for (const auto& p : move.placements) {
    SetSquare(p.row, p.col, p.letter, p.is_blank);
    num_tiles_++;
  }
}

bool Board::ParseBoard(const char* bd) {
  Board parsed;
  int i = 0;
  for (const char* c = bd; *c; c++) {
    if (isspace(static_cast<unsigned char>(*c))) continue;
    if (i >= kNumSquares) {
      fprintf(stderr, "Board strings must contain %d squares, got more\n", kNumSquares);
      return false;
    }
    int row = i / kBoardSize;
    int col = i % kBoardSize;
    if (*c >= 'A' && *c <= 'Z') {
      parsed.Place(row, col, *c, false);
    } else if (*c >= 'a' && *c <= 'z') {
      parsed.Place(row, col, toupper(*c), true);
    } else if (*c != '.') {
      fprintf(stderr, "Found unexpected square: '%c'\n", *c);
      return false;
    }
    i++;
  }
  if (i != kNumSquares) {
    fprintf(stderr, "Board strings must contain %d squares, got %d\n", kNumSquares, i);
    return false;
  }
  *this = parsed;
  return true;
}

string Board::AsString() const {
  string out;
  out.reserve(kNumSquares + kBoardSize);
  for (int row = 0; row < kBoardSize; row++) {
    for (int col = 0; col < kBoardSize; col++) {
      const Square& sq = At(row, col);
      if (sq.IsEmpty()) {
        out.push_back('.');
      } else {
        out.push_back(sq.is_blank ? tolower(sq.letter) : sq.letter);
      }
    }
    out.push_back('\n');
  }
  return out;
}
