#include "anchors.h"

bool IsAnchor(const Board& board, int row, int col) {
  if (!Board::OnBoard(row, col) || board.IsOccupied(row, col)) return false;
  if (board.IsEmpty()) return row == kCenter && col == kCenter;
  return board.IsOccupied(row - 1, col) || board.IsOccupied(row + 1, col) ||
         board.IsOccupied(row, col - 1) || board.IsOccupied(row, col + 1);
}

vector<pair<int, int>> FindAnchors(const Board& board) {
  vector<pair<int, int>> out;
  if (board.IsEmpty()) {
    out.push_back({kCenter, kCenter});
    return out;
  }
  for (int row = 0; row < kBoardSize; row++) {
    for (int col = 0; col < kBoardSize; col++) {
      if (IsAnchor(board, row, col)) out.push_back({row, col});
    }
  }
  return out;
}
