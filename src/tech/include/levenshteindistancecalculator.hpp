#pragma once

#include <string_view>

#include "fxr_vector.hpp"

namespace fxr {

/// Edit distance (insertions, deletions and substitutions of a single char) between two words.
/// Used to suggest the closest known command line option to a mistyped one.
class LevenshteinDistanceCalculator {
 public:
  /// Complexity is 'word1.size() * word2.size()' in time, and min(word1.size(), word2.size()) in space.
  int operator()(std::string_view word1, std::string_view word2);

 private:
  // reused between calls
  vector<int> _row;
};

}  // namespace fxr
