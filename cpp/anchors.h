#ifndef ANCHORS_H
#define ANCHORS_H

#include <utility>
#include <vector>

#include "board.h"

using namespace std;

// An anchor is an empty square next to (above, below, left or right of) a
// tile. On an empty board the center square is the only anchor. Every legal
// move puts a tile on at least one anchor.
bool IsAnchor(const Board& board, int row, int col);

// All anchors as (row, col), in row-major order.
vector<pair<int, int>> FindAnchors(const Board& board);

#endif  // ANCHORS_H
