#include "levenshteindistancecalculator.hpp"

#include <algorithm>
#include <numeric>
#include <string_view>
#include <utility>

namespace fxr {

int LevenshteinDistanceCalculator::operator()(std::string_view word1, std::string_view word2) {
  // the row is sized on the shortest word
  if (word2.size() < word1.size()) {
    std::swap(word1, word2);
  }

  // _row[pos] holds the distance between the first 'pos' chars of word1 and the current prefix of word2
  _row.resize(static_cast<vector<int>::size_type>(word1.size() + 1U));
  std::iota(_row.begin(), _row.end(), 0);

  for (std::string_view::size_type word2Pos = 0; word2Pos < word2.size(); ++word2Pos) {
    int diagonal = _row.front();
    _row.front() = static_cast<int>(word2Pos) + 1;
    for (std::string_view::size_type word1Pos = 0; word1Pos < word1.size(); ++word1Pos) {
      const int substitutionCost = word1[word1Pos] == word2[word2Pos] ? 0 : 1;
      const int distance = std::min({_row[word1Pos] + 1, _row[word1Pos + 1U] + 1, diagonal + substitutionCost});
      diagonal = _row[word1Pos + 1U];
      _row[word1Pos + 1U] = distance;
    }
  }

  return _row.back();
}

}  // namespace fxr
