#ifndef GADDAG_H
#define GADDAG_H

#include <stdint.h>

#include <bit>
#include <memory>
#include <string>
#include <vector>

using namespace std;

// Symbols 0-25 are the letters A-Z. kSep marks the switch from reading a
// word backwards (towards its first letter) to reading it forwards.
const int kSep = 26;
const int kNumSymbols = 27;
const char kSepChar = '+';

const uint32_t kNoNode = 0xffffffff;

// A minimized GADDAG. Every word w0..wn-1 is stored as
//   wn-1 ... w0                      (the whole word read backwards)
//   wi ... w0 + wi+1 ... wn-1        (for each 0 <= i < n-1)
// Nodes are packed into a flat array and referred to by index; the root is
// always node 0. The structure is immutable once built and may be shared by
// any number of readers.
class Gaddag {
 public:
  Gaddag();
  ~Gaddag();

  // Fast operations
  uint32_t Root() const { return 0; }
  bool HasChild(uint32_t node, int symbol) const {
    if (symbol < 0 || symbol >= kNumSymbols) return false;
    return nodes_[node].child_mask & (1u << symbol);
  }

  // Returns kNoNode if there is no transition on |symbol|.
  uint32_t Descend(uint32_t node, int symbol) const {
    if (symbol < 0 || symbol >= kNumSymbols) return kNoNode;
    uint32_t mask = nodes_[node].child_mask & kSymbolMask;
    if (!(mask & (1u << symbol))) return kNoNode;
    auto index = std::popcount(mask & ((1u << symbol) - 1));
    return edges_[nodes_[node].first_edge + index];
  }

  bool IsWord(uint32_t node) const { return nodes_[node].child_mask & kWordBit; }

  // Construction. Build() throws ConstructionError if a word contains
  // anything other than A-Z. Empty entries are ignored.
  static unique_ptr<Gaddag> Build(const vector<string>& words);

  // Reads a newline-delimited word list (or a file written by Serialize()).
  // Returns NULL and prints the reason if the file can't be used.
  static unique_ptr<Gaddag> CreateFromFile(const char* filename);
  static unique_ptr<Gaddag> CreateFromFileStr(const string& filename);

  string Serialize() const;
  // Throws ConstructionError on malformed input.
  static unique_ptr<Gaddag> Deserialize(const string& bytes);
  static bool LooksSerialized(const string& bytes);

  // Some slower methods that operate on the entire Gaddag (not just a node).
  // |path| is a string over A-Z and '+'.
  uint32_t FindPath(const string& path) const;
  bool Contains(const string& word) const;

  size_t NumNodes() const { return nodes_.size(); }
  size_t NumEdges() const { return edges_.size(); }
  size_t NumWords() const { return num_words_; }
  void PrintStats() const;

  // 'A'-'Z' -> 0-25, '+' -> kSep, anything else -> -1.
  static int SymbolFor(char c);

 private:
  friend class GaddagBuilder;

  static constexpr uint32_t kWordBit = 1u << 31;
  static constexpr uint32_t kSymbolMask = (1u << kNumSymbols) - 1;

  struct Node {
    uint32_t child_mask;  // bit i set iff there is an edge on symbol i
    uint32_t first_edge;  // children are edges_[first_edge, first_edge + popcount)
  };

  vector<Node> nodes_;
  vector<uint32_t> edges_;
  uint32_t num_words_;
};

#endif  // GADDAG_H
