#include "gaddag_builder.h"

#include <algorithm>

#include "errors.h"

size_t GaddagBuilder::NodeHash::operator()(uint32_t id) const {
  const BuilderNode& n = (*nodes)[id];
  size_t h = n.is_word ? 0x9e3779b9 : 0;
  for (const auto& [symbol, child] : n.edges) {
    h ^= (static_cast<size_t>(child) * 31 + symbol) + 0x9e3779b9 + (h << 6) + (h >> 2);
  }
  return h;
}

bool GaddagBuilder::NodeEqual::operator()(uint32_t a, uint32_t b) const {
  const BuilderNode& x = (*nodes)[a];
  const BuilderNode& y = (*nodes)[b];
  return x.is_word == y.is_word && x.edges == y.edges;
}

GaddagBuilder::GaddagBuilder()
    : num_words_(0),
      register_(0, NodeHash{&nodes_}, NodeEqual{&nodes_}) {}

GaddagBuilder::~GaddagBuilder() {}

/*
 * CARES becomes:
 *   SERAC
 *   ERAC+S
 *   RAC+ES
 *   AC+RES
 *   C+ARES
 */
void GaddagBuilder::AddWord(const string& word) {
  if (word.empty()) return;
  string symbols(word.size(), 0);
  for (size_t i = 0; i < word.size(); i++) {
    int s = Gaddag::SymbolFor(word[i]);
    if (s < 0 || s == kSep) {
      throw ConstructionError(
          "Invalid symbol '" + string(1, word[i]) + "' in word \"" + word + "\""
      );
    }
    symbols[i] = static_cast<char>(s);
  }

  int n = symbols.size();
  entries_.emplace_back(symbols.rbegin(), symbols.rend());
  for (int i = 0; i < n - 1; i++) {
    string entry(symbols.rend() - (i + 1), symbols.rend());
    entry.push_back(static_cast<char>(kSep));
    entry.append(symbols, i + 1, string::npos);
    entries_.push_back(std::move(entry));
  }
}

uint32_t GaddagBuilder::NewNode() {
  if (!free_.empty()) {
    uint32_t id = free_.back();
    free_.pop_back();
    return id;
  }
  nodes_.emplace_back();
  return nodes_.size() - 1;
}

void GaddagBuilder::Release(uint32_t id) {
  nodes_[id].is_word = false;
  nodes_[id].edges.clear();
  free_.push_back(id);
}

// Registers (or merges away) every node on the current path below depth
// |down_to|. After this, path_ has down_to + 1 entries.
void GaddagBuilder::Minimize(size_t down_to) {
  while (path_.size() > down_to + 1) {
    uint32_t child = path_.back();
    path_.pop_back();
    uint32_t parent = path_.back();

    auto it = register_.find(child);
    if (it != register_.end()) {
      nodes_[parent].edges.back().second = *it;
      Release(child);
    } else {
      register_.insert(child);
    }
  }
}

void GaddagBuilder::Insert(const string& entry) {
  size_t common = 0;
  while (common < entry.size() && common < prev_.size() &&
         entry[common] == prev_[common]) {
    common++;
  }
  Minimize(common);

  for (size_t i = common; i < entry.size(); i++) {
    uint32_t child = NewNode();
    // NewNode() may grow nodes_, so look the parent up afterwards.
    nodes_[path_.back()].edges.push_back({static_cast<uint8_t>(entry[i]), child});
    path_.push_back(child);
  }
  nodes_[path_.back()].is_word = true;
  prev_ = entry;
}

unique_ptr<Gaddag> GaddagBuilder::Finish() {
  sort(entries_.begin(), entries_.end());
  entries_.erase(unique(entries_.begin(), entries_.end()), entries_.end());

  num_words_ = 0;
  nodes_.clear();
  free_.clear();
  register_.clear();
  path_.clear();
  prev_.clear();

  uint32_t root = NewNode();
  path_.push_back(root);
  for (const auto& entry : entries_) {
    if (entry.find(static_cast<char>(kSep)) == string::npos) num_words_++;
    Insert(entry);
  }
  Minimize(0);

  // Copy into the packed representation, breadth first so that the root is
  // node 0 and each node's children are contiguous.
  unique_ptr<Gaddag> out(new Gaddag);
  out->nodes_.clear();
  out->num_words_ = num_words_;

  vector<uint32_t> remap(nodes_.size(), kNoNode);
  vector<uint32_t> order;
  remap[root] = 0;
  order.push_back(root);
  for (size_t k = 0; k < order.size(); k++) {
    const BuilderNode& node = nodes_[order[k]];
    Gaddag::Node packed;
    packed.first_edge = out->edges_.size();
    packed.child_mask = node.is_word ? Gaddag::kWordBit : 0;
    for (const auto& [symbol, child] : node.edges) {
      packed.child_mask |= (1u << symbol);
      if (remap[child] == kNoNode) {
        remap[child] = order.size();
        order.push_back(child);
      }
      out->edges_.push_back(remap[child]);
    }
    out->nodes_.push_back(packed);
  }

  return out;
}
