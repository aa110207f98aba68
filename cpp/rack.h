#ifndef RACK_H
#define RACK_H

#include <string>

#include "constants.h"

using namespace std;

// Tile index for a blank; letters are 0-25.
const int kBlank = 26;
const char kBlankChar = '?';

// The tiles held by the player to move, as counts per letter.
class Rack {
 public:
  Rack();

  // Tiles are letters A-Z (case-insensitive) and '?' for a blank, e.g.
  // "RETAIN?". At most kRackSize tiles, and no more of any tile than the
  // set contains. On failure, prints the reason and leaves the rack unchanged.
  bool Parse(const string& tiles);

  int Count(int tile) const { return counts_[tile]; }
  int NumBlanks() const { return counts_[kBlank]; }
  int Size() const { return size_; }
  bool IsEmpty() const { return size_ == 0; }

  void Add(int tile) {
    counts_[tile]++;
    size_++;
  }
  // Returns false if there is no such tile.
  bool Remove(int tile) {
    if (counts_[tile] == 0) return false;
    counts_[tile]--;
    size_--;
    return true;
  }

  string AsString() const;

 private:
  int counts_[kNumLetters + 1];
  int size_;
};

#endif  // RACK_H
