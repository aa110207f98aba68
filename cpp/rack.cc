#include "rack.h"

#include <stdio.h>

Rack::Rack() : size_(0) {
  for (int i = 0; i <= kNumLetters; i++) counts_[i] = 0;
}

bool Rack::Parse(const string& tiles) {
  Rack r;
  for (char c : tiles) {
    if (c == kBlankChar) {
      r.Add(kBlank);
    } else if (c >= 'A' && c <= 'Z') {
      r.Add(c - 'A');
    } else if (c >= 'a' && c <= 'z') {
      r.Add(c - 'a');
    } else {
      fprintf(stderr, "Found unexpected tile: '%c'\n", c);
      return false;
    }
  }
  if (r.Size() > kRackSize) {
    fprintf(stderr, "Racks hold at most %d tiles, got %d ('%s')\n", kRackSize, r.Size(),
            tiles.c_str());
    return false;
  }
  if (r.NumBlanks() > kNumBlanks) {
    fprintf(stderr, "There are only %d blanks, got %d\n", kNumBlanks, r.NumBlanks());
    return false;
  }
  for (int i = 0; i < kNumLetters; i++) {
    if (r.Count(i) > kTileCounts[i]) {
      fprintf(stderr, "There are only %d %c tiles, got %d\n", kTileCounts[i], 'A' + i,
              r.Count(i));
      return false;
    }
  }
  *this = r;
  return true;
}

string Rack::AsString() const {
  string out;
  for (int i = 0; i < kNumLetters; i++) {
    out.append(counts_[i], 'A' + i);
  }
  out.append(counts_[kBlank], kBlankChar);
  return out;
}
