#ifndef GADDAG_BUILDER_H
#define GADDAG_BUILDER_H

#include <stdint.h>

#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "gaddag.h"

using namespace std;

// Builds a minimal Gaddag from a word list.
//
// Every word is expanded into its GADDAG entries, the entries are sorted and
// then added one at a time to an automaton which is kept minimal as it grows
// (Daciuk et al., "Incremental Construction of Minimal Acyclic Finite-State
// Automata"). Once an entry has been added, every node that no longer lies on
// the path of the most recent entry is either merged with an equivalent node
// from the register or registered itself.
class GaddagBuilder {
 public:
  GaddagBuilder();
  ~GaddagBuilder();

  // Throws ConstructionError if the word contains anything but A-Z.
  void AddWord(const string& word);

  unique_ptr<Gaddag> Finish();

 private:
  struct BuilderNode {
    bool is_word = false;
    // (symbol, child), sorted by symbol because entries arrive sorted.
    vector<pair<uint8_t, uint32_t>> edges;
  };

  // Two nodes are equivalent if they agree on finality and every outgoing
  // edge leads to the same (already registered) child.
  struct NodeHash {
    const vector<BuilderNode>* nodes;
    size_t operator()(uint32_t id) const;
  };
  struct NodeEqual {
    const vector<BuilderNode>* nodes;
    bool operator()(uint32_t a, uint32_t b) const;
  };

  void Insert(const string& entry);
  void Minimize(size_t down_to);
  uint32_t NewNode();
  void Release(uint32_t id);

  vector<string> entries_;
  uint64_t num_words_;

  vector<BuilderNode> nodes_;
  vector<uint32_t> free_;
  unordered_set<uint32_t, NodeHash, NodeEqual> register_;

  // path_[i] is the node reached after reading prev_[0, i).
  vector<uint32_t> path_;
  string prev_;
};

#endif  // GADDAG_BUILDER_H
