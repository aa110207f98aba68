#include <emscripten/bind.h>

#include "board.h"
#include "gaddag.h"
#include "move.h"
#include "move_generator.h"
#include "rack.h"

using namespace emscripten;

// Runs one search and returns the plays as strings like "8D CATS 20".
vector<string> FindMoves(MoveGenerator& gen, const string& board_str, const string& rack_str) {
  vector<string> out;
  Board board;
  Rack rack;
  if (!board.ParseBoardStr(board_str) || !rack.Parse(rack_str)) {
    return out;
  }
  for (const auto& m : gen.Generate(board, rack)) {
    out.push_back(m.ToString());
  }
  return out;
}

EMSCRIPTEN_BINDINGS(wasm_scrabble) {
  class_<Gaddag>("Gaddag")
      .constructor<>()
      .function("num_nodes", &Gaddag::NumNodes)
      .function("num_words", &Gaddag::NumWords)
      .function("contains", &Gaddag::Contains)
      .class_function("CreateFromFile", &Gaddag::CreateFromFileStr);

  register_vector<string>("VectorString");

  class_<MoveGenerator>("MoveGenerator")
      .constructor<const Gaddag*>(allow_raw_pointers())
      .function("find_moves", &FindMoves);
}
