#include "pointer_cache/size_estimator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using namespace pointer_cache;

namespace {

struct Node {
  int id{0};
  std::string name;
  Node *next{nullptr};
};

std::size_t estimate_fields(const Node &n, SizeEstimator &e) {
  return e.indirect_size(n.name) + e.indirect_size(n.next);
}

struct Document {
  std::string title;
  std::vector<std::string> tags;
  std::shared_ptr<std::string> body;
};

std::size_t estimate_fields(const Document &d, SizeEstimator &e) {
  return e.indirect_size(d.title) + e.indirect_size(d.tags) +
         e.indirect_size(d.body);
}

struct Labelled {
  std::string label;
  std::string body;
};

std::size_t estimate_fields(const Labelled &l, SizeEstimator &e) {
  return e.indirect_size(l.label) + e.indirect_size(l.body);
}

struct Point {
  double x;
  double y;
};

enum class Color : std::uint8_t { Red, Green };

} // namespace

TEST_CASE("Scalars cost their layout size", "[estimator][scalar]") {
  CHECK(estimate_size(42) == sizeof(int));
  CHECK(estimate_size(3.5) == sizeof(double));
  CHECK(estimate_size(Color::Green) == sizeof(Color));
  CHECK(estimate_size(Point{1.0, 2.0}) == sizeof(Point));
}

TEST_CASE("Text costs header plus length", "[estimator][text]") {
  CHECK(estimate_size(std::string()) == sizeof(std::string));
  CHECK(estimate_size(std::string(100, 'x')) == sizeof(std::string) + 100);
  CHECK(estimate_size(std::u16string(4, u'x')) ==
        sizeof(std::u16string) + 4 * sizeof(char16_t));
}

TEST_CASE("Vectors charge elements and spare capacity",
          "[estimator][sequence]") {
  std::vector<int> v;
  v.reserve(10);
  v.push_back(1);
  v.push_back(2);
  v.push_back(3);
  CHECK(estimate_size(v) == sizeof(v) + v.capacity() * sizeof(int));

  std::vector<std::string> words{"alpha", "be"};
  CHECK(estimate_size(words) ==
        sizeof(words) + 2 * sizeof(std::string) + 7 +
            (words.capacity() - 2) * sizeof(std::string));
}

TEST_CASE("Map bucket approximation", "[estimator][mapping]") {
  CHECK(map_bucket_count(0) == 1);
  CHECK(map_bucket_count(6) == 1);
  CHECK(map_bucket_count(7) == 2);
  CHECK(map_bucket_count(13) == 2);
  CHECK(map_bucket_count(14) == 4);
  CHECK(map_bucket_count(100) == 16);

  std::unordered_map<std::string, int> m{{"a", 1}, {"bb", 2}, {"ccc", 3}};
  const std::size_t slot = sizeof(std::string) + sizeof(int);
  CHECK(estimate_size(m) ==
        sizeof(m) + kMapBucketHeaderBytes + 3 * slot + 6 +
            (kMapSlotsPerBucket - 3) * slot);

  std::map<int, int> empty;
  CHECK(estimate_size(empty) ==
        sizeof(empty) + kMapBucketHeaderBytes +
            kMapSlotsPerBucket * 2 * sizeof(int));
}

TEST_CASE("References add their target once", "[estimator][reference]") {
  int x = 7;
  int *p = &x;
  int *null = nullptr;
  CHECK(estimate_size(p) == sizeof(int *) + sizeof(int));
  CHECK(estimate_size(null) == sizeof(int *));

  auto text = std::make_shared<std::string>(20, 'z');
  CHECK(estimate_size(text) ==
        sizeof(text) + sizeof(std::string) + 20);

  std::vector<std::shared_ptr<std::string>> twice{text, text};
  CHECK(estimate_size(twice) ==
        sizeof(twice) + 2 * sizeof(text) + sizeof(std::string) + 20 +
            (twice.capacity() - 2) * sizeof(text));

  auto owned = std::make_unique<double>(1.0);
  CHECK(estimate_size(owned) == sizeof(owned) + sizeof(double));
}

TEST_CASE("Optionals and pairs count their contents", "[estimator][composite]") {
  std::optional<std::string> none;
  std::optional<std::string> some(std::string(9, 'q'));
  CHECK(estimate_size(none) == sizeof(none));
  CHECK(estimate_size(some) == sizeof(some) + 9);

  std::pair<std::string, int> kv{"key", 1};
  CHECK(estimate_size(kv) == sizeof(kv) + 3);
}

TEST_CASE("Records add their variable-length fields", "[estimator][record]") {
  Document d;
  d.title = "title";
  d.tags = {"x", "yz"};
  d.body = std::make_shared<std::string>(50, 'b');
  const std::size_t expected =
      sizeof(Document) + 5 +
      (sizeof(std::string) * d.tags.capacity() + 3) +
      (sizeof(std::string) + 50);
  CHECK(estimate_size(d) == expected);
}

TEST_CASE("Self reference costs nothing extra", "[estimator][cycle]") {
  Node looped{1, "head", nullptr};
  looped.next = &looped;
  Node severed{1, "head", nullptr};

  CHECK(estimate_size(looped) == estimate_size(severed));
  CHECK(estimate_size(severed) == sizeof(Node) + 4);
}

TEST_CASE("Mutual references match the severed chain", "[estimator][cycle]") {
  Node a{1, "first", nullptr};
  Node b{2, "second", nullptr};
  a.next = &b;
  b.next = &a;

  Node a2{1, "first", nullptr};
  Node b2{2, "second", nullptr};
  a2.next = &b2;

  CHECK(estimate_size(a) == estimate_size(a2));
  CHECK(estimate_size(a2) == 2 * sizeof(Node) + 5 + 6);
}

TEST_CASE("Shared targets are charged once per estimate",
          "[estimator][cycle]") {
  Node leaf{3, std::string(64, 'l'), nullptr};
  Node left{1, "l", &leaf};
  Node right{2, "r", &leaf};
  std::vector<Node *> roots{&left, &right};

  const std::size_t expected = sizeof(roots) + 2 * sizeof(Node *) +
                               (roots.capacity() - 2) * sizeof(Node *) +
                               3 * sizeof(Node) + 1 + 1 + 64;
  CHECK(estimate_size(roots) == expected);

  SizeEstimator e;
  e.size_of(left);
  e.size_of(right);
  CHECK(e.visited() == 3);
}

TEST_CASE("A record and its first member are separate identities",
          "[estimator][cycle]") {
  Labelled l{"tag", std::string(40, 'b')};
  std::pair<const std::string *, const Labelled *> refs{&l.label, &l};
  CHECK(estimate_size(refs) == sizeof(refs) + (sizeof(std::string) + 3) +
                                   (sizeof(Labelled) + 3 + 40));

  SizeEstimator e;
  CHECK(e.visit(&l.label));
  CHECK(e.visit(&l));
  CHECK_FALSE(e.visit(&l));
  CHECK(e.visited() == 2);
}
