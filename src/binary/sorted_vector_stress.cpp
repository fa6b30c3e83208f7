// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <lyra/lyra.hpp>
#include <random>
#include <set>
#include <string>
#include <vector>

#include <sortedvec/sorted_vector.hpp>

using namespace kressler::sortedvec;

namespace {

struct StressOptions {
  std::uint64_t seed = static_cast<std::uint64_t>(
      std::chrono::system_clock::now().time_since_epoch().count());
  std::size_t iterations = 100;
  std::size_t max_size = 2000;
  std::size_t prefix_length = 64;
  std::size_t operations = 5000;
};

// Strings share a configurable leading run, then differ over a small
// alphabet, so lookups exercise the prefix-skipping search
class KeySource {
 public:
  KeySource(std::mt19937& rng, std::size_t prefix_length)
      : rng_(rng), prefix_(prefix_length, '#') {}

  std::string next_string() {
    std::uniform_int_distribution<std::size_t> cut_dist(0, prefix_.size());
    std::uniform_int_distribution<int> len_dist(0, 6);
    std::uniform_int_distribution<int> char_dist('a', 'd');

    // Occasionally truncate the prefix to produce strict prefixes of others
    const std::size_t cut = coin(8) ? cut_dist(rng_) : prefix_.size();
    std::string s = prefix_.substr(0, cut);
    const int len = len_dist(rng_);
    for (int i = 0; i < len; ++i) {
      s.push_back(static_cast<char>(char_dist(rng_)));
    }
    return s;
  }

  int next_int() {
    std::uniform_int_distribution<int> dist(-1000, 1000);
    return dist(rng_);
  }

  std::mt19937& rng() { return rng_; }

  // True with probability 1/n
  bool coin(int n) {
    std::uniform_int_distribution<int> dist(0, n - 1);
    return dist(rng_) == 0;
  }

 private:
  std::mt19937& rng_;
  std::string prefix_;
};

template <typename Container, typename Reference>
bool validate(const Container& container, const Reference& reference,
              const char* name) {
  if (!container.is_sorted()) {
    std::cerr << name << ": container is not sorted" << std::endl;
    return false;
  }
  if (container.size() != reference.size()) {
    std::cerr << name << ": size " << container.size()
              << " != reference size " << reference.size() << std::endl;
    return false;
  }
  if (!std::equal(container.begin(), container.end(), reference.begin(),
                  reference.end())) {
    std::cerr << name << ": contents differ from reference" << std::endl;
    return false;
  }
  return true;
}

// Applies one random operation to both the container and the reference
// multiset. Returns false on a mismatch in an operation's result.
template <typename Container, typename T, typename NextValue>
bool apply_random_op(Container& container, std::multiset<T>& reference,
                     KeySource& source, NextValue next_value,
                     std::size_t max_size, const char* name) {
  std::uniform_int_distribution<int> op_dist(0, 99);
  const int op = op_dist(source.rng());

  if (op < 35) {
    if (reference.size() < max_size) {
      T value = next_value();
      reference.insert(value);
      container.insert(std::move(value));
    }
  } else if (op < 60) {
    const T value = next_value();
    const auto removed = container.remove(value);
    const auto it = reference.find(value);
    if (removed.has_value() != (it != reference.end())) {
      std::cerr << name << ": remove disagreed on presence" << std::endl;
      return false;
    }
    if (it != reference.end()) {
      reference.erase(it);
    }
  } else if (op < 85) {
    const T value = next_value();
    const bool expected = reference.contains(value);
    const auto it = container.find(value);
    if ((it != container.end()) != expected ||
        container.contains(value) != expected) {
      std::cerr << name << ": find disagreed on presence" << std::endl;
      return false;
    }
    if (it != container.end() && !(*it == value)) {
      std::cerr << name << ": find returned a different element" << std::endl;
      return false;
    }
  } else if (op < 92) {
    std::vector<T> batch;
    const std::size_t room =
        max_size > reference.size() ? max_size - reference.size() : 0;
    const std::size_t count = std::min<std::size_t>(room, 16);
    for (std::size_t i = 0; i < count; ++i) {
      batch.push_back(next_value());
    }
    reference.insert(batch.begin(), batch.end());
    container.extend(std::move(batch));
  } else if (op < 95) {
    container.dedup_by_key();
    std::multiset<T> collapsed;
    for (const auto& v : reference) {
      if (collapsed.empty() || *collapsed.rbegin() != v) {
        collapsed.insert(v);
      }
    }
    reference = std::move(collapsed);
  } else {
    // Split somewhere and glue the halves back together
    std::uniform_int_distribution<std::size_t> at_dist(0, container.size());
    auto tail = container.split_at(at_dist(source.rng()));
    if (!container.is_sorted() || !tail.is_sorted()) {
      std::cerr << name << ": split produced an unsorted half" << std::endl;
      return false;
    }
    if (!container.empty() && !tail.empty() &&
        tail.key_policy().less(tail.front(), container.back())) {
      std::cerr << name << ": split halves overlap" << std::endl;
      return false;
    }
    container.extend(std::move(tail).into_vector());
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  StressOptions options;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(options.seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(options.iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(options.max_size, "max_size")["-m"]["--max-size"](
          "Maximum number of elements per container") |
      lyra::opt(options.prefix_length,
                "prefix_length")["-p"]["--prefix-length"](
          "Length of the prefix shared by generated string keys") |
      lyra::opt(options.operations, "operations")["-o"]["--operations"](
          "Random operations per iteration");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  constexpr std::size_t kValidateEvery = 100;

  for (std::size_t iter = 0; iter < options.iterations; ++iter) {
    const std::uint64_t iter_seed = options.seed + iter;
    std::mt19937 rng(static_cast<std::mt19937::result_type>(iter_seed));
    KeySource source(rng, options.prefix_length);

    std::cout << "Iteration " << iter << ", seed " << iter_seed << std::endl;

    sorted_slice_vector<std::string> strings;
    std::multiset<std::string> string_reference;
    sorted_vector<int> ints;
    std::multiset<int> int_reference;

    auto next_string = [&] { return source.next_string(); };
    auto next_int = [&] { return source.next_int(); };

    for (std::size_t op = 0; op < options.operations; ++op) {
      const bool ok =
          apply_random_op(strings, string_reference, source, next_string,
                          options.max_size, "sorted_slice_vector<string>") &&
          apply_random_op(ints, int_reference, source, next_int,
                          options.max_size, "sorted_vector<int>");
      if (!ok) {
        std::cerr << "Failure in iteration " << iter << " (seed " << iter_seed
                  << "), operation " << op << std::endl;
        return 1;
      }

      if ((op + 1) % kValidateEvery == 0 || op + 1 == options.operations) {
        if (!validate(strings, string_reference,
                      "sorted_slice_vector<string>") ||
            !validate(ints, int_reference, "sorted_vector<int>")) {
          std::cerr << "Failure in iteration " << iter << " (seed "
                    << iter_seed << "), operation " << op << std::endl;
          return 1;
        }
      }
    }
  }
  return 0;
}
