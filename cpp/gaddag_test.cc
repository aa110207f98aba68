#include "gaddag.h"

#include <gtest/gtest.h>

#include <fstream>
#include <set>

#include "errors.h"

namespace {

// Every stored path for |word|: the reversed word, then each reversed prefix
// followed by the separator and the rest of the word.
vector<string> Paths(const string& word) {
  vector<string> out;
  out.emplace_back(word.rbegin(), word.rend());
  for (size_t i = 0; i + 1 < word.size(); i++) {
    string p(word.rend() - (i + 1), word.rend());
    p.push_back(kSepChar);
    p.append(word, i + 1, string::npos);
    out.push_back(p);
  }
  return out;
}

TEST(GaddagTest, StoresEveryRotation) {
  auto g = Gaddag::Build({"CARES"});
  for (const auto& path : {"SERAC", "ERAC+S", "RAC+ES", "AC+RES", "C+ARES"}) {
    uint32_t node = g->FindPath(path);
    ASSERT_NE(kNoNode, node) << path;
    EXPECT_TRUE(g->IsWord(node)) << path;
  }
  EXPECT_EQ(kNoNode, g->FindPath("CARES"));
  EXPECT_EQ(kNoNode, g->FindPath("SERAC+"));
  EXPECT_EQ(1u, g->NumWords());
}

TEST(GaddagTest, EveryWordIsTerminalOnEveryPath) {
  vector<string> words = {"CAT", "CATS", "AT", "SCAT", "TACT", "ACTS", "QI", "ZZZ"};
  auto g = Gaddag::Build(words);
  EXPECT_EQ(words.size(), g->NumWords());
  for (const auto& w : words) {
    EXPECT_TRUE(g->Contains(w)) << w;
    for (const auto& path : Paths(w)) {
      uint32_t node = g->FindPath(path);
      ASSERT_NE(kNoNode, node) << path;
      EXPECT_TRUE(g->IsWord(node)) << path;
    }
  }
}

TEST(GaddagTest, PrefixesAndRotationsOfNonWordsAreNotTerminal) {
  auto g = Gaddag::Build({"CAT", "CATS", "AT"});
  EXPECT_FALSE(g->Contains("CA"));
  EXPECT_FALSE(g->Contains("C"));
  EXPECT_FALSE(g->Contains("TA"));
  EXPECT_FALSE(g->Contains("CATSS"));
  EXPECT_FALSE(g->Contains(""));

  // "AC" is on the way to "AC+T" but is not a word itself.
  uint32_t node = g->FindPath("AC");
  ASSERT_NE(kNoNode, node);
  EXPECT_FALSE(g->IsWord(node));

  // Crossing the separator with nothing after it never completes a word.
  node = g->FindPath("TAC+");
  ASSERT_NE(kNoNode, node);
  EXPECT_FALSE(g->IsWord(node));
  EXPECT_TRUE(g->IsWord(g->FindPath("TAC+S")));
}

TEST(GaddagTest, DescendWithoutTransition) {
  auto g = Gaddag::Build({"AT"});
  EXPECT_EQ(kNoNode, g->Descend(g->Root(), 'Z' - 'A'));
  EXPECT_EQ(kNoNode, g->Descend(g->Root(), -1));
  EXPECT_EQ(kNoNode, g->Descend(g->Root(), kNumSymbols));
  EXPECT_NE(kNoNode, g->Descend(g->Root(), 'T' - 'A'));
  EXPECT_TRUE(g->HasChild(g->Root(), 'A' - 'A'));
  EXPECT_FALSE(g->HasChild(g->Root(), 'Z' - 'A'));
}

TEST(GaddagTest, HasChildIgnoresTheWordBit) {
  auto g = Gaddag::Build({"AT"});
  uint32_t node = g->FindPath("TA");
  ASSERT_NE(kNoNode, node);
  ASSERT_TRUE(g->IsWord(node));
  EXPECT_FALSE(g->HasChild(node, 31));
  EXPECT_FALSE(g->HasChild(node, kNumSymbols));
  EXPECT_FALSE(g->HasChild(node, -1));
}

TEST(GaddagTest, EmptyWordListGivesBareRoot) {
  auto g = Gaddag::Build({});
  EXPECT_EQ(1u, g->NumNodes());
  EXPECT_EQ(0u, g->NumEdges());
  EXPECT_EQ(0u, g->NumWords());
  EXPECT_FALSE(g->IsWord(g->Root()));
  for (int s = 0; s < kNumSymbols; s++) {
    EXPECT_EQ(kNoNode, g->Descend(g->Root(), s));
  }
}

TEST(GaddagTest, RejectsSymbolsOutsideAToZ) {
  EXPECT_THROW(Gaddag::Build({"CAT", "DOG1"}), ConstructionError);
  EXPECT_THROW(Gaddag::Build({"cat"}), ConstructionError);
  EXPECT_THROW(Gaddag::Build({"C+T"}), ConstructionError);
  EXPECT_NO_THROW(Gaddag::Build({"CAT", ""}));
}

TEST(GaddagTest, DuplicatesAreCountedOnce) {
  auto g = Gaddag::Build({"CAT", "CAT", "AT"});
  EXPECT_EQ(2u, g->NumWords());
}

TEST(GaddagTest, MinimizationSharesSuffixes) {
  vector<string> words = {"BAT", "CAT", "HAT", "MAT", "RAT", "SAT", "BATS", "CATS",
                          "HATS", "MATS", "RATS", "SATS", "BATH", "MATH"};
  auto g = Gaddag::Build(words);

  // Size of the equivalent unminimized trie: one node per distinct prefix of
  // a stored path, plus the root.
  set<string> prefixes;
  for (const auto& w : words) {
    for (const auto& path : Paths(w)) {
      for (size_t i = 1; i <= path.size(); i++) prefixes.insert(path.substr(0, i));
    }
  }
  EXPECT_LT(g->NumNodes(), prefixes.size() + 1);

  // Every node with no children is a word end, and there's only one of them.
  size_t leaves = 0;
  for (uint32_t n = 0; n < g->NumNodes(); n++) {
    bool has_child = false;
    for (int s = 0; s < kNumSymbols; s++) has_child |= g->HasChild(n, s);
    if (!has_child) leaves++;
  }
  EXPECT_EQ(1u, leaves);
}

TEST(GaddagTest, OrderOfWordsDoesNotMatter) {
  auto a = Gaddag::Build({"ZA", "AA", "QI", "AB", "BA"});
  auto b = Gaddag::Build({"BA", "AB", "QI", "AA", "ZA"});
  EXPECT_EQ(a->Serialize(), b->Serialize());
}

TEST(GaddagTest, SerializeRoundTrip) {
  vector<string> words = {"CAT", "CATS", "AT", "QI", "JINX", "OXYPHENBUTAZONE"};
  auto g = Gaddag::Build(words);
  auto bytes = g->Serialize();
  EXPECT_TRUE(Gaddag::LooksSerialized(bytes));

  auto copy = Gaddag::Deserialize(bytes);
  EXPECT_EQ(g->NumNodes(), copy->NumNodes());
  EXPECT_EQ(g->NumEdges(), copy->NumEdges());
  EXPECT_EQ(g->NumWords(), copy->NumWords());
  for (const auto& w : words) {
    EXPECT_TRUE(copy->Contains(w)) << w;
  }
  EXPECT_FALSE(copy->Contains("CA"));
  EXPECT_EQ(bytes, copy->Serialize());
}

TEST(GaddagTest, DeserializeRejectsMalformedInput) {
  auto bytes = Gaddag::Build({"CAT", "AT"})->Serialize();

  EXPECT_THROW(Gaddag::Deserialize(""), ConstructionError);
  EXPECT_THROW(Gaddag::Deserialize("CAT\nAT\n"), ConstructionError);
  EXPECT_THROW(Gaddag::Deserialize(bytes.substr(0, bytes.size() - 1)), ConstructionError);

  // Point the last edge far past the end of the node table.
  string bad_edge = bytes;
  bad_edge[bad_edge.size() - 1] = '\x7f';
  EXPECT_THROW(Gaddag::Deserialize(bad_edge), ConstructionError);

  // Set a transition bit beyond the separator on the root.
  string bad_mask = bytes;
  bad_mask[20 + 3] |= 0x10;
  EXPECT_THROW(Gaddag::Deserialize(bad_mask), ConstructionError);
}

string WriteTempFile(const string& name, const string& contents) {
  string path = testing::TempDir() + name;
  ofstream out(path, ios::out | ios::binary);
  out << contents;
  return path;
}

TEST(GaddagTest, CreateFromWordList) {
  string path = WriteTempFile("words.txt", "cat\n\nCATS \r\nAt\n");
  auto g = Gaddag::CreateFromFileStr(path);
  ASSERT_TRUE(g.get());
  EXPECT_EQ(3u, g->NumWords());
  EXPECT_TRUE(g->Contains("CAT"));
  EXPECT_TRUE(g->Contains("CATS"));
  EXPECT_TRUE(g->Contains("AT"));
}

TEST(GaddagTest, CreateFromSerializedFile) {
  auto g = Gaddag::Build({"QI", "ZA"});
  string path = WriteTempFile("words.gaddag", g->Serialize());
  auto loaded = Gaddag::CreateFromFile(path.c_str());
  ASSERT_TRUE(loaded.get());
  EXPECT_EQ(g->Serialize(), loaded->Serialize());
}

TEST(GaddagTest, CreateFromFileFailures) {
  EXPECT_FALSE(Gaddag::CreateFromFile("/nonexistent/words.txt").get());
  string path = WriteTempFile("bad_words.txt", "CAT\nD0G\n");
  EXPECT_FALSE(Gaddag::CreateFromFileStr(path).get());
}

}  // namespace
