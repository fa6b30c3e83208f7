// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <random>
#include <ranges>
#include <set>
#include <span>
#include <sortedvec/sorted_vector.hpp>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_set>
#include <vector>

using namespace kressler::sortedvec;

namespace {

struct Record {
  double val;
  std::uint32_t key;
};

template <typename Container>
std::vector<int> contents(const Container& c) {
  return std::vector<int>(c.begin(), c.end());
}

}  // namespace

TEST_CASE("sorted_vector basic construction", "[sorted_vector]") {
  sorted_vector<int> sv;

  REQUIRE(sv.size() == 0);
  REQUIRE(sv.empty());
  REQUIRE(sv.begin() == sv.end());
  REQUIRE(sv.find(1) == sv.end());
  REQUIRE(!sv.contains(1));
  REQUIRE(sv.locate(1) == std::pair<std::size_t, bool>{0, false});
  REQUIRE(sv.is_sorted());
}

TEST_CASE("sorted_vector from unsorted vector", "[sorted_vector]") {
  const std::vector<int> unsorted = {3, 5, 0, 10, 7, 1};
  const auto sv = make_sorted_vector(unsorted);

  REQUIRE(contents(sv) == std::vector<int>{0, 1, 3, 5, 7, 10});
  REQUIRE(sv.find(6) == sv.end());
  REQUIRE(sv.find(5) != sv.end());
  REQUIRE(*sv.find(5) == 5);
  REQUIRE(sv.contains(10));
  REQUIRE(!sv.contains(-1));

  SECTION("Other construction paths give the same order") {
    const sorted_vector<int> from_list = {3, 5, 0, 10, 7, 1};
    const sorted_vector<int> from_range(unsorted.begin(), unsorted.end());
    const auto named = sorted_vector<int>::from_unsorted(unsorted);
    REQUIRE(from_list == sv);
    REQUIRE(from_range == sv);
    REQUIRE(named == sv);
  }
}

TEST_CASE("sorted_vector with a key function", "[sorted_vector]") {
  sorted_vector<Record, decltype(&Record::key)> sv(&Record::key);
  sv.insert(Record{3.14, 0});
  sv.insert(Record{0.00, 10});
  sv.insert(Record{5.00, 4});

  REQUIRE(sv.size() == 3);
  REQUIRE(sv.find(5u) == sv.end());
  REQUIRE(sv.find(4u) != sv.end());
  REQUIRE(sv.find(4u)->val == 5.00);
  REQUIRE(sv.front().key == 0);
  REQUIRE(sv.back().key == 10);
  REQUIRE(sv.key_of(sv[1]) == 4);

  SECTION("Lambda key function") {
    auto by_val = [](const Record& r) { return r.val; };
    sorted_vector<Record, decltype(by_val)> by_value(
        std::vector<Record>(sv.begin(), sv.end()), by_val);
    REQUIRE(by_value.front().val == 0.00);
    REQUIRE(by_value.back().val == 5.00);
    REQUIRE(by_value.contains(3.14));
  }
}

TEST_CASE("sorted_vector insert operations", "[sorted_vector]") {
  sorted_vector<int> sv;

  SECTION("Insert keeps ascending order") {
    for (int v : {5, 1, 4, 2, 3}) {
      sv.insert(v);
      REQUIRE(sv.is_sorted());
    }
    REQUIRE(contents(sv) == std::vector<int>{1, 2, 3, 4, 5});
  }

  SECTION("Insert returns iterator to the new element") {
    sv.insert(10);
    sv.insert(30);
    const auto it = sv.insert(20);
    REQUIRE(*it == 20);
    REQUIRE(it - sv.begin() == 1);
  }

  SECTION("Duplicate keys are kept") {
    sv.insert(2);
    sv.insert(2);
    sv.insert(1);
    sv.insert(2);
    REQUIRE(contents(sv) == std::vector<int>{1, 2, 2, 2});
    REQUIRE(sv.find(2) != sv.end());
    REQUIRE(*sv.find(2) == 2);
  }

  SECTION("Emplace constructs in place") {
    sorted_vector<std::string> strings;
    strings.emplace(3, 'c');
    strings.emplace("aa");
    REQUIRE(strings.size() == 2);
    REQUIRE(strings[0] == "aa");
    REQUIRE(strings[1] == "ccc");
  }

  SECTION("locate reports the insertion point for missing keys") {
    sv.extend({10, 20, 30});
    REQUIRE(sv.locate(5) == std::pair<std::size_t, bool>{0, false});
    REQUIRE(sv.locate(15) == std::pair<std::size_t, bool>{1, false});
    REQUIRE(sv.locate(20) == std::pair<std::size_t, bool>{1, true});
    REQUIRE(sv.locate(35) == std::pair<std::size_t, bool>{3, false});
  }
}

TEST_CASE("sorted_vector remove operations", "[sorted_vector]") {
  sorted_vector<int> sv = {4, 8, 15, 16, 23, 42};

  SECTION("Remove existing key") {
    const auto removed = sv.remove(15);
    REQUIRE(removed.has_value());
    REQUIRE(*removed == 15);
    REQUIRE(contents(sv) == std::vector<int>{4, 8, 16, 23, 42});
  }

  SECTION("Remove missing key returns nullopt") {
    REQUIRE(!sv.remove(7).has_value());
    REQUIRE(sv.size() == 6);
  }

  SECTION("Remove at index") {
    REQUIRE(sv.remove_at(0) == 4);
    REQUIRE(sv.remove_at(sv.size() - 1) == 42);
    REQUIRE(contents(sv) == std::vector<int>{8, 15, 16, 23});
    REQUIRE_THROWS_AS(sv.remove_at(4), std::out_of_range);
  }

  SECTION("Erase by iterator") {
    auto it = sv.erase(sv.find(16));
    REQUIRE(*it == 23);
    it = sv.erase(sv.begin(), sv.begin() + 2);
    REQUIRE(*it == 15);
    REQUIRE(contents(sv) == std::vector<int>{15, 23, 42});
  }

  SECTION("Pop removes the greatest element") {
    REQUIRE(sv.pop() == 42);
    REQUIRE(sv.pop() == 23);
    REQUIRE(sv.size() == 4);

    sorted_vector<int> empty;
    REQUIRE(!empty.pop().has_value());
  }

  SECTION("Truncate keeps a prefix") {
    sv.truncate(10);
    REQUIRE(sv.size() == 6);
    sv.truncate(2);
    REQUIRE(contents(sv) == std::vector<int>{4, 8});
    sv.truncate(0);
    REQUIRE(sv.empty());
  }
}

TEST_CASE("sorted_vector dedup_by_key", "[sorted_vector]") {
  auto first_of_pair = [](const std::pair<int, char>& p) { return p.first; };
  sorted_vector<std::pair<int, char>, decltype(first_of_pair)> sv(
      std::vector<std::pair<int, char>>{
          {2, 'a'}, {1, 'b'}, {2, 'c'}, {3, 'd'}, {1, 'e'}, {2, 'f'}},
      first_of_pair);

  sv.dedup_by_key();
  REQUIRE(sv.size() == 3);
  REQUIRE(sv[0].first == 1);
  REQUIRE(sv[1].first == 2);
  REQUIRE(sv[2].first == 3);

  SECTION("Dedup is idempotent") {
    const auto once = sv.as_vector();
    sv.dedup_by_key();
    REQUIRE(sv.as_vector() == once);
  }
}

TEST_CASE("sorted_vector split_at", "[sorted_vector]") {
  sorted_vector<int> sv = {9, 3, 7, 1, 5, 0, 8, 2, 6, 4};
  const auto original = sv.as_vector();

  SECTION("Split in the middle") {
    auto upper = sv.split_at(sv.size() / 2);
    REQUIRE(sv.size() == 5);
    REQUIRE(upper.size() == 5);
    REQUIRE(sv.is_sorted());
    REQUIRE(upper.is_sorted());

    std::vector<int> joined(sv.begin(), sv.end());
    joined.insert(joined.end(), upper.begin(), upper.end());
    REQUIRE(joined == original);

    // The split-off half keeps working as a sorted container
    upper.insert(-1);
    REQUIRE(upper.front() == -1);
    REQUIRE(upper.contains(9));
  }

  SECTION("Split at the ends") {
    auto all = sv.split_at(0);
    REQUIRE(sv.empty());
    REQUIRE(all.size() == 10);

    auto none = all.split_at(all.size());
    REQUIRE(none.empty());
    REQUIRE(all.size() == 10);
  }

  SECTION("Split beyond size is a precondition violation") {
    REQUIRE_THROWS_AS(sv.split_at(11), std::out_of_range);
    REQUIRE(sv.as_vector() == original);
  }
}

TEST_CASE("sorted_vector extend", "[sorted_vector]") {
  sorted_vector<int> sv = {10, 20};

  SECTION("Extend with a range") {
    const std::vector<int> more = {15, 5, 25};
    sv.extend(more);
    REQUIRE(contents(sv) == std::vector<int>{5, 10, 15, 20, 25});
  }

  SECTION("Extend with iterators and initializer lists") {
    const std::set<int> more = {1, 30};
    sv.extend(more.begin(), more.end());
    sv.extend({12, 11});
    REQUIRE(contents(sv) == std::vector<int>{1, 10, 11, 12, 20, 30});
  }

  SECTION("Extend with an empty range") {
    sv.extend(std::vector<int>{});
    REQUIRE(contents(sv) == std::vector<int>{10, 20});
  }

  SECTION("Extend with its own elements") {
    sv.extend(sv.begin(), sv.end());
    REQUIRE(contents(sv) == std::vector<int>{10, 10, 20, 20});
    sv.extend(sv);
    REQUIRE(sv.size() == 8);
    REQUIRE(sv.is_sorted());
  }
}

TEST_CASE("sorted_vector extend leaves borrowed sources intact",
          "[sorted_vector]") {
  // Longer than any small-string buffer, so a move would empty the source
  const std::vector<std::string> expected = {
      "a string that does not fit in the inline buffer, second",
      "a string that does not fit in the inline buffer, first"};
  std::vector<std::string> source = expected;
  sorted_vector<std::string> sv;

  SECTION("From std::views::all") {
    sv.extend(std::views::all(source));
    REQUIRE(source == expected);
    REQUIRE(sv.size() == 2);
    REQUIRE(sv.front() == expected[1]);
  }

  SECTION("From a std::span") {
    sv.extend(std::span<std::string>(source));
    REQUIRE(source == expected);
    REQUIRE(sv.back() == expected[0]);
  }

  SECTION("From a filtered view") {
    sv.extend(source | std::views::filter([](const std::string& s) {
                return s.ends_with("first");
              }));
    REQUIRE(source == expected);
    REQUIRE(sv.size() == 1);
  }

  SECTION("An owning rvalue gives up its elements") {
    sv.extend(std::move(source));
    REQUIRE(sv.size() == 2);
    REQUIRE(sv.as_vector() ==
            std::vector<std::string>{expected[1], expected[0]});
  }
}

TEST_CASE("sorted_vector conversion", "[sorted_vector]") {
  sorted_vector<int> sv = {3, 1, 2};

  SECTION("as_span views the sorted elements") {
    const auto span = sv.as_span();
    REQUIRE(span.size() == 3);
    REQUIRE(span[0] == 1);
    REQUIRE(span[2] == 3);
  }

  SECTION("into_vector releases the storage") {
    auto released = std::move(sv).into_vector();
    REQUIRE(released == std::vector<int>{1, 2, 3});
    REQUIRE(sv.empty());
  }

  SECTION("Round trip preserves iteration order") {
    const auto before = sv.as_vector();
    auto rebuilt = make_sorted_vector(std::move(sv).into_vector());
    REQUIRE(rebuilt.as_vector() == before);
  }

  SECTION("Reverse iteration yields descending keys") {
    REQUIRE(std::vector<int>(sv.rbegin(), sv.rend()) ==
            std::vector<int>{3, 2, 1});
  }

  SECTION("at() is bounds checked") {
    REQUIRE(sv.at(2) == 3);
    REQUIRE_THROWS_AS(sv.at(3), std::out_of_range);
  }
}

TEST_CASE("sorted_vector hashes its element sequence", "[sorted_vector]") {
  const std::hash<sorted_vector<std::string>> hasher;
  const sorted_vector<std::string> a = {"pear", "apple", "fig"};
  const sorted_vector<std::string> b = {"fig", "pear", "apple"};
  const sorted_vector<std::string> c = {"fig", "pear"};
  REQUIRE(a == b);
  REQUIRE(hasher(a) == hasher(b));
  REQUIRE(hasher(a) != hasher(c));

  SECTION("Usable as an unordered_set key") {
    std::unordered_set<sorted_vector<int>> seen;
    seen.insert(sorted_vector<int>{3, 1, 2});
    seen.insert(sorted_vector<int>{1, 2, 3});
    seen.insert(sorted_vector<int>{1, 2});
    REQUIRE(seen.size() == 2);
    REQUIRE(seen.contains(sorted_vector<int>{2, 3, 1}));
    REQUIRE(!seen.contains(sorted_vector<int>{}));
  }
}

TEST_CASE("sorted_vector with std::greater (descending order)",
          "[sorted_vector][comparator]") {
  sorted_vector<int, identity_key, std::greater<>> sv(
      std::vector<int>{1, 4, 2, 3}, scalar_key<identity_key, std::greater<>>());

  REQUIRE(contents(sv) == std::vector<int>{4, 3, 2, 1});
  sv.insert(5);
  sv.insert(0);
  REQUIRE(contents(sv) == std::vector<int>{5, 4, 3, 2, 1, 0});
  REQUIRE(sv.contains(3));
  REQUIRE(sv.pop() == 0);
}

TEST_CASE("sorted_vector with tuple keys", "[sorted_vector]") {
  struct Employee {
    std::string department;
    int level;
    std::string name;
  };
  auto key = [](const Employee& e) { return std::tie(e.department, e.level); };

  sorted_vector<Employee, decltype(key)> staff(key);
  staff.insert({"eng", 3, "ada"});
  staff.insert({"eng", 1, "bob"});
  staff.insert({"art", 2, "cy"});

  REQUIRE(staff[0].name == "cy");
  REQUIRE(staff[1].name == "bob");
  REQUIRE(staff[2].name == "ada");

  const std::string eng = "eng";
  const int level = 3;
  REQUIRE(staff.find(std::tie(eng, level))->name == "ada");
  REQUIRE(!staff.contains(std::make_tuple(eng, 2)));
}

TEST_CASE("sorted_vector holds move-only elements", "[sorted_vector]") {
  auto deref = [](const std::unique_ptr<int>& p) { return *p; };
  sorted_vector<std::unique_ptr<int>, decltype(deref)> sv(deref);

  sv.insert(std::make_unique<int>(3));
  sv.insert(std::make_unique<int>(1));
  sv.insert(std::make_unique<int>(2));
  REQUIRE(*sv.front() == 1);

  auto removed = sv.remove(2);
  REQUIRE(removed.has_value());
  REQUIRE(**removed == 2);

  std::vector<std::unique_ptr<int>> more;
  more.push_back(std::make_unique<int>(0));
  sv.extend(std::move(more));
  REQUIRE(*sv.front() == 0);

  auto upper = sv.split_at(1);
  REQUIRE(*upper.front() == 1);
  REQUIRE(*sv.pop().value() == 0);
}

TEST_CASE("sorted_vector finds a key iff it was in the source",
          "[sorted_vector][random]") {
  std::mt19937 rng(1234);
  std::uniform_int_distribution<int> value_dist(-50, 50);
  std::uniform_int_distribution<std::size_t> size_dist(0, 64);

  for (int iter = 0; iter < 300; ++iter) {
    std::vector<int> xs(size_dist(rng));
    for (auto& x : xs) {
      x = value_dist(rng);
    }
    const int s = value_dist(rng);
    xs.insert(xs.begin() + static_cast<std::ptrdiff_t>(xs.size() / 2), s);

    const auto sv = make_sorted_vector(xs);
    REQUIRE(sv.is_sorted());
    REQUIRE(sv.contains(s));

    const int query = value_dist(rng);
    const bool in_source = std::find(xs.begin(), xs.end(), query) != xs.end();
    REQUIRE(sv.contains(query) == in_source);
    REQUIRE((sv.find(query) != sv.end()) == in_source);
  }
}

TEST_CASE("sorted_vector mutations match a multiset",
          "[sorted_vector][random]") {
  std::mt19937 rng(4321);
  std::uniform_int_distribution<int> value_dist(-50, 50);
  std::uniform_int_distribution<std::size_t> size_dist(0, 64);

  for (int iter = 0; iter < 100; ++iter) {
    std::vector<int> xs(size_dist(rng));
    for (auto& x : xs) {
      x = value_dist(rng);
    }
    auto sv = make_sorted_vector(xs);
    std::multiset<int> reference(xs.begin(), xs.end());

    for (int op = 0; op < 50; ++op) {
      const int v = value_dist(rng);
      switch (op % 3) {
        case 0:
          sv.insert(v);
          reference.insert(v);
          break;
        case 1: {
          const auto removed = sv.remove(v);
          const auto it = reference.find(v);
          REQUIRE(removed.has_value() == (it != reference.end()));
          if (it != reference.end()) {
            reference.erase(it);
          }
          break;
        }
        default: {
          const auto popped = sv.pop();
          REQUIRE(popped.has_value() == !reference.empty());
          if (popped) {
            REQUIRE(*popped == *reference.rbegin());
            reference.erase(std::prev(reference.end()));
          }
          break;
        }
      }
      REQUIRE(sv.is_sorted());
    }
    REQUIRE(std::equal(sv.begin(), sv.end(), reference.begin(),
                       reference.end()));
  }
}
