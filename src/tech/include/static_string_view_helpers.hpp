#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <utility>

#include "nchars.hpp"

namespace fxr {

/// Joins std::string_view template arguments at compile time into a static, null terminated storage, inserting Sep
/// between two consecutive strings. The terminating null char is not part of 'value'.
template <std::string_view const& Sep, std::string_view const&... Strs>
class JoinStringViewWithSep {
 private:
  static constexpr auto impl() noexcept {
    constexpr std::string_view::size_type nbSeps = sizeof...(Strs) == 0 ? 0 : sizeof...(Strs) - 1U;
    constexpr std::string_view::size_type len = (Strs.size() + ... + 0) + nbSeps * Sep.size();
    std::array<char, len + 1U> arr{};
    auto it = arr.begin();
    bool first = true;
    auto append = [&it, &first](std::string_view str) {
      if (!first) {
        it = std::ranges::copy(Sep, it).out;
      }
      it = std::ranges::copy(str, it).out;
      first = false;
    };
    (append(Strs), ...);
    *it = '\0';
    return arr;
  }

  static constexpr auto arr = impl();

 public:
  static constexpr std::string_view value{arr.data(), arr.size() - 1U};
};

template <std::string_view const& Sep, std::string_view const&... Strs>
inline constexpr auto JoinStringViewWithSep_v = JoinStringViewWithSep<Sep, Strs...>::value;

namespace details {
inline constexpr std::string_view kNoSeparator;
}  // namespace details

/// Plain compile time concatenation of std::string_view template arguments.
template <std::string_view const&... Strs>
inline constexpr auto JoinStringView_v = JoinStringViewWithSep<details::kNoSeparator, Strs...>::value;

namespace details {

template <std::string_view const& Sep, const auto& a, typename>
struct make_joined_string_view_impl;

template <std::string_view const& Sep, const auto& a, std::size_t... i>
struct make_joined_string_view_impl<Sep, a, std::index_sequence<i...>> {
  static constexpr auto value = JoinStringViewWithSep<Sep, a[i]...>::value;
};

}  // namespace details

/// Joins all the std::string_view of a static array with given separator
template <std::string_view const& Sep, const auto& a>
using make_joined_string_view = details::make_joined_string_view_impl<Sep, a, std::make_index_sequence<std::size(a)>>;

/// Converts an integer value to its string_view representation at compile time.
/// The underlying storage is not null terminated.
template <int64_t intVal>
class IntToStringView {
 private:
  static constexpr auto impl() noexcept {
    std::array<char, nchars(intVal)> arr;
    if constexpr (intVal == 0) {
      arr[0] = '0';
      return arr;
    }
    auto endIt = arr.end();
    int64_t val = intVal;
    if constexpr (intVal < 0) {
      arr[0] = '-';
      val = -val;
    }
    do {
      *--endIt = (val % 10) + '0';
      val /= 10;
    } while (val != 0);
    return arr;
  }

  static constexpr auto arr = impl();

 public:
  static constexpr std::string_view value{arr.begin(), arr.end()};
};

template <int64_t intVal>
inline constexpr auto IntToStringView_v = IntToStringView<intVal>::value;

/// std::string_view of a single char with static storage.
template <char Char>
class CharToStringView {
 private:
  static constexpr char ch = Char;

 public:
  static constexpr std::string_view value{&ch, 1};
};

template <char Char>
inline constexpr auto CharToStringView_v = CharToStringView<Char>::value;

}  // namespace fxr
