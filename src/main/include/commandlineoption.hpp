#pragma once

#include <compare>
#include <cstdint>
#include <string_view>
#include <utility>
#include <variant>

namespace fxr {

/// Group of options displayed together in the help. Groups are ordered by priority first.
struct CommandHeader {
  constexpr std::strong_ordering operator<=>(const CommandHeader &rhs) const {
    if (const auto prioCmp = prio <=> rhs.prio; prioCmp != 0) {
      return prioCmp;
    }
    return groupName <=> rhs.groupName;
  }

  constexpr bool operator==(const CommandHeader &) const = default;

  std::string_view groupName;
  int prio = 0;
};

/// Definition of a command line option: its names (full and optional short hand flag) and help texts.
class CommandLineOption {
 public:
  constexpr CommandLineOption() noexcept = default;

  constexpr CommandLineOption(CommandHeader commandHeader, std::string_view fullName, char shortName,
                              std::string_view valueDescription, std::string_view description)
      : _commandHeader(commandHeader),
        _fullName(fullName),
        _valueDescription(valueDescription),
        _description(description),
        _shortName(shortName) {}

  constexpr CommandLineOption(CommandHeader commandHeader, std::string_view fullName, std::string_view valueDescription,
                              std::string_view description)
      : CommandLineOption(commandHeader, fullName, '\0', valueDescription, description) {}

  /// Tells whether given command line argument designates this option.
  /// Options whose full name does not start with '--' ('help' for instance) also accept it ('--help').
  constexpr bool matches(std::string_view argStr) const {
    if (hasShortName() && argStr.size() == 2U && argStr.front() == '-' && argStr.back() == _shortName) {
      return true;
    }
    if (argStr.starts_with(kFullNamePrefix) && !_fullName.starts_with(kFullNamePrefix)) {
      argStr.remove_prefix(kFullNamePrefix.size());
    }
    return argStr == _fullName;
  }

  constexpr const CommandHeader &commandHeader() const { return _commandHeader; }
  constexpr std::string_view fullName() const { return _fullName; }
  constexpr std::string_view valueDescription() const { return _valueDescription; }
  constexpr std::string_view description() const { return _description; }

  constexpr char shortNameChar() const { return _shortName; }

  constexpr bool hasShortName() const { return _shortName != '\0'; }

  constexpr std::strong_ordering operator<=>(const CommandLineOption &) const = default;

 private:
  static constexpr std::string_view kFullNamePrefix = "--";

  // header first, for the ordering of the help
  CommandHeader _commandHeader;
  std::string_view _fullName;
  std::string_view _valueDescription;
  std::string_view _description;
  char _shortName = '\0';
};

/// Integral option value that may be omitted: '--lookback' alone is distinguished from '--lookback 3'
/// and from the absence of the option.
class CommandLineOptionalInt32 {
 public:
  enum class State : int8_t { kOptionNotPresent, kOptionPresent, kValueIsSet };

  constexpr CommandLineOptionalInt32() noexcept = default;

  constexpr CommandLineOptionalInt32(State state) noexcept : _state(state) {}

  constexpr CommandLineOptionalInt32(int32_t value) noexcept : _value(value), _state(State::kValueIsSet) {}

  constexpr int32_t operator*() const { return _value; }

  constexpr bool isPresent() const { return _state != State::kOptionNotPresent; }

  constexpr bool isSet() const { return _state == State::kValueIsSet; }

  constexpr bool operator==(const CommandLineOptionalInt32 &) const noexcept = default;

 private:
  int32_t _value = 0;
  State _state = State::kOptionNotPresent;
};

template <class OptValueType>
struct AllowedCommandLineOptionsBase {
  using CommandLineOptionType =
      std::variant<std::string_view OptValueType::*, CommandLineOptionalInt32 OptValueType::*, bool OptValueType::*>;
  using CommandLineOptionWithValue = std::pair<CommandLineOption, CommandLineOptionType>;
};

}  // namespace fxr
