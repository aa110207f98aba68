// Pure C++ CLI. Loads a dictionary, a board and a rack and lists every play.

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include "board.h"
#include "gaddag.h"
#include "move_generator.h"
#include "rack.h"

void usage_and_die(int argc, char** argv) {
  fprintf(
      stderr,
      "Usage: %s <dictionary> <board file, or - for an empty board> <rack>\n"
      "       %s --compile <word list> <output.gaddag>\n",
      argv[0],
      argv[0]
  );
  exit(1);
}

int compile(const char* word_list, const char* out_file) {
  auto g = Gaddag::CreateFromFile(word_list);
  if (!g.get()) {
    return 1;
  }
  g->PrintStats();
  ofstream out(out_file, ios::out | ios::binary);
  if (!out.is_open()) {
    fprintf(stderr, "Couldn't open %s for writing\n", out_file);
    return 1;
  }
  auto bytes = g->Serialize();
  out.write(bytes.data(), bytes.size());
  if (!out.good()) {
    fprintf(stderr, "Error writing %s\n", out_file);
    return 1;
  }
  std::cout << "wrote " << bytes.size() << " bytes to " << out_file << std::endl;
  return 0;
}

int main(int argc, char** argv) {
  if (argc == 4 && string(argv[1]) == "--compile") {
    return compile(argv[2], argv[3]);
  }
  if (argc != 4) {
    usage_and_die(argc, argv);
  }

  auto dict_file = argv[1];
  auto board_file = argv[2];
  auto rack_str = argv[3];

  auto g = Gaddag::CreateFromFile(dict_file);
  if (!g.get()) {
    std::cerr << "Unable to load dictionary " << dict_file << std::endl;
    return 1;
  }
  std::cerr << "Loaded " << g->NumWords() << " words, " << g->NumNodes() << " nodes"
            << std::endl;

  Board board;
  if (string(board_file) != "-") {
    ifstream f(board_file);
    if (!f.is_open()) {
      std::cerr << "Unable to open board " << board_file << std::endl;
      return 1;
    }
    stringstream buf;
    buf << f.rdbuf();
    if (!board.ParseBoardStr(buf.str())) {
      return 1;
    }
  }

  Rack rack;
  if (!rack.Parse(rack_str)) {
    return 1;
  }

  MoveGenerator gen(g.get());
  auto moves = gen.Generate(board, rack);
  stable_sort(moves.begin(), moves.end(), [](const Move& a, const Move& b) {
    return a.score > b.score;
  });
  for (const auto& m : moves) {
    std::cout << m.ToString();
    for (size_t i = 1; i < m.words.size(); i++) {
      std::cout << (i == 1 ? " (" : ", ") << m.words[i];
    }
    if (m.words.size() > 1) std::cout << ")";
    std::cout << "\n";
  }
  std::flush(std::cout);
}
