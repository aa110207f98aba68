#include "move.h"

#include <cctype>
#include <sstream>

string Move::ToString() const {
  ostringstream out;
  string row_str = to_string(row + 1);
  char col_char = 'A' + col;
  if (axis == kHorizontal) {
    out << row_str << col_char;
  } else {
    out << col_char << row_str;
  }

  string word = words.empty() ? string() : words[0];
  int start = LinePos(axis, row, col);
  for (const auto& p : placements) {
    int offset = LinePos(axis, p.row, p.col) - start;
    if (p.is_blank && offset >= 0 && offset < static_cast<int>(word.size())) {
      word[offset] = tolower(static_cast<unsigned char>(word[offset]));
    }
  }
  out << " " << word << " " << score;
  return out.str();
}
