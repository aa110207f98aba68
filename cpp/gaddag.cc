#include "gaddag.h"

#include <stdio.h>

#include <cctype>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

#include "errors.h"
#include "gaddag_builder.h"

// Serialized format, all integers little-endian uint32:
//   "GADDAG01" num_words num_nodes num_edges
//   num_nodes x (child_mask first_edge)
//   num_edges x child
static const char kSignature[] = "GADDAG01";
static const size_t kSignatureSize = 8;
static const size_t kHeaderSize = kSignatureSize + 3 * 4;

static void AppendUint32(string* out, uint32_t v) {
  out->push_back(static_cast<char>(v & 0xff));
  out->push_back(static_cast<char>((v >> 8) & 0xff));
  out->push_back(static_cast<char>((v >> 16) & 0xff));
  out->push_back(static_cast<char>((v >> 24) & 0xff));
}

static uint32_t ReadUint32(const string& bytes, size_t offset) {
  const uint8_t* p = reinterpret_cast<const uint8_t*>(bytes.data()) + offset;
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

// Initially, the automaton is just a root with no words.
Gaddag::Gaddag() : num_words_(0) { nodes_.push_back({0, 0}); }

Gaddag::~Gaddag() {}

int Gaddag::SymbolFor(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c == kSepChar) return kSep;
  return -1;
}

unique_ptr<Gaddag> Gaddag::Build(const vector<string>& words) {
  GaddagBuilder builder;
  for (const auto& word : words) {
    builder.AddWord(word);
  }
  return builder.Finish();
}

uint32_t Gaddag::FindPath(const string& path) const {
  uint32_t node = Root();
  for (char c : path) {
    node = Descend(node, SymbolFor(c));
    if (node == kNoNode) return kNoNode;
  }
  return node;
}

bool Gaddag::Contains(const string& word) const {
  if (word.empty()) return false;
  uint32_t node = Root();
  for (auto it = word.rbegin(); it != word.rend(); ++it) {
    int s = SymbolFor(*it);
    if (s == kSep) return false;
    node = Descend(node, s);
    if (node == kNoNode) return false;
  }
  return IsWord(node);
}

string Gaddag::Serialize() const {
  string out;
  out.reserve(kHeaderSize + nodes_.size() * 8 + edges_.size() * 4);
  out.append(kSignature, kSignatureSize);
  AppendUint32(&out, num_words_);
  AppendUint32(&out, nodes_.size());
  AppendUint32(&out, edges_.size());
  for (const auto& node : nodes_) {
    AppendUint32(&out, node.child_mask);
    AppendUint32(&out, node.first_edge);
  }
  for (auto child : edges_) {
    AppendUint32(&out, child);
  }
  return out;
}

bool Gaddag::LooksSerialized(const string& bytes) {
  return bytes.size() >= kSignatureSize &&
         memcmp(bytes.data(), kSignature, kSignatureSize) == 0;
}

unique_ptr<Gaddag> Gaddag::Deserialize(const string& bytes) {
  if (bytes.size() < kHeaderSize || !LooksSerialized(bytes)) {
    throw ConstructionError("Not a serialized GADDAG");
  }
  uint32_t num_words = ReadUint32(bytes, kSignatureSize);
  uint64_t num_nodes = ReadUint32(bytes, kSignatureSize + 4);
  uint64_t num_edges = ReadUint32(bytes, kSignatureSize + 8);
  if (num_nodes == 0) {
    throw ConstructionError("Serialized GADDAG has no root");
  }
  if (bytes.size() != kHeaderSize + num_nodes * 8 + num_edges * 4) {
    throw ConstructionError(
        "Serialized GADDAG has " + to_string(bytes.size()) +
        " bytes, header implies " + to_string(kHeaderSize + num_nodes * 8 + num_edges * 4)
    );
  }

  unique_ptr<Gaddag> g(new Gaddag);
  g->num_words_ = num_words;
  g->nodes_.resize(num_nodes);
  g->edges_.resize(num_edges);
  size_t offset = kHeaderSize;
  for (uint64_t i = 0; i < num_nodes; i++) {
    Node& node = g->nodes_[i];
    node.child_mask = ReadUint32(bytes, offset);
    node.first_edge = ReadUint32(bytes, offset + 4);
    offset += 8;
    if (node.child_mask & ~(kSymbolMask | kWordBit)) {
      throw ConstructionError("Bad transition mask on node " + to_string(i));
    }
    uint64_t end = static_cast<uint64_t>(node.first_edge) +
                   std::popcount(node.child_mask & kSymbolMask);
    if (end > num_edges) {
      throw ConstructionError("Edges of node " + to_string(i) + " out of range");
    }
  }
  for (uint64_t i = 0; i < num_edges; i++) {
    uint32_t child = ReadUint32(bytes, offset);
    offset += 4;
    if (child >= num_nodes) {
      throw ConstructionError("Edge " + to_string(i) + " points past the last node");
    }
    g->edges_[i] = child;
  }
  return g;
}

unique_ptr<Gaddag> Gaddag::CreateFromFile(const char* filename) {
  ifstream f(filename, ios::in | ios::binary);
  if (!f.is_open()) {
    fprintf(stderr, "Couldn't open %s\n", filename);
    return NULL;
  }
  stringstream buf;
  buf << f.rdbuf();
  string contents = buf.str();

  try {
    if (LooksSerialized(contents)) {
      return Deserialize(contents);
    }

    GaddagBuilder builder;
    istringstream lines(contents);
    string line;
    while (getline(lines, line)) {
      string word;
      for (char c : line) {
        if (isspace(static_cast<unsigned char>(c))) continue;
        word.push_back(toupper(static_cast<unsigned char>(c)));
      }
      builder.AddWord(word);
    }
    return builder.Finish();
  } catch (const ConstructionError& e) {
    fprintf(stderr, "Unable to build GADDAG from %s: %s\n", filename, e.what());
    return NULL;
  }
}

unique_ptr<Gaddag> Gaddag::CreateFromFileStr(const string& filename) {
  return CreateFromFile(filename.c_str());
}

void Gaddag::PrintStats() const {
  cout << "words: " << num_words_ << ", nodes: " << nodes_.size()
       << ", edges: " << edges_.size() << ", bytes: "
       << nodes_.size() * sizeof(Node) + edges_.size() * sizeof(uint32_t) << endl;
}
