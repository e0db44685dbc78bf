#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "commandlineoption.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "fxr_vector.hpp"
#include "levenshteindistancecalculator.hpp"
#include "stringhelpers.hpp"

namespace fxr {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/// Parses command line arguments into an object of type OptValueType, from a list of options definitions each bound
/// to a data member of OptValueType.
template <class OptValueType>
class CommandLineOptionsParser {
 public:
  using CommandLineOptionType = AllowedCommandLineOptionsBase<OptValueType>::CommandLineOptionType;
  using CommandLineOptionWithValue = AllowedCommandLineOptionsBase<OptValueType>::CommandLineOptionWithValue;
  using value_type = OptValueType;

  template <unsigned N>
  explicit CommandLineOptionsParser(const CommandLineOptionWithValue (&init)[N])
      : _opts(std::begin(init), std::end(init)) {
    // help is displayed by group, in priority order
    std::ranges::sort(_opts, [](const auto &lhs, const auto &rhs) { return lhs.first < rhs.first; });
  }

  /// Parses given arguments (program name excluded).
  /// Throws invalid_argument for an unknown option or a missing option value.
  OptValueType parse(std::span<const char *const> arguments) const {
    OptValueType data;

    for (std::size_t argPos = 0; argPos < arguments.size(); ++argPos) {
      const std::string_view argStr(arguments[argPos]);
      const auto optIt = std::ranges::find_if(_opts, [argStr](const auto &opt) { return opt.first.matches(argStr); });
      if (optIt == _opts.end()) {
        invalidArgument(argStr);
      }

      std::optional<std::string_view> nextArg;
      if (argPos + 1U < arguments.size()) {
        nextArg = arguments[argPos + 1U];
      }
      if (storeValue(optIt->first, optIt->second, nextArg, data)) {
        ++argPos;
      }
    }

    return data;
  }

  void displayHelp(std::string_view programName, std::ostream &stream) const {
    stream << "usage: " << programName << " <options>\n";
    if (_opts.empty()) {
      return;
    }
    stream << "Options:\n";

    int descrColumn = 0;
    for (const auto &[opt, _] : _opts) {
      descrColumn = std::max(descrColumn, OptionNamesLen(opt));
    }
    descrColumn += 2;

    std::string_view previousGroup;
    for (const auto &[opt, _] : _opts) {
      if (opt.commandHeader().groupName != previousGroup) {
        previousGroup = opt.commandHeader().groupName;
        stream << "\n " << previousGroup << '\n';
      }

      stream << "  " << opt.fullName();
      if (opt.hasShortName()) {
        stream << ", -" << opt.shortNameChar();
      }
      stream << ' ' << opt.valueDescription();
      Spaces(descrColumn - OptionNamesLen(opt), stream);

      PrintDescription(opt.description(), descrColumn, stream);
    }
  }

 private:
  static constexpr int kMaxCharLine = 120;

  [[noreturn]] static void ThrowExpectingValueException(const CommandLineOption &commandLineOption) {
    throw invalid_argument("Expecting a value for option {}", commandLineOption.fullName());
  }

  static bool IsOptionInt(std::string_view opt) {
    if (!opt.empty() && (opt.front() == '-' || opt.front() == '+')) {
      opt.remove_prefix(1);
    }
    return !opt.empty() && std::ranges::all_of(opt, [](char ch) { return ch >= '0' && ch <= '9'; });
  }

  /// Stores the value of given option in data, and returns true if the next argument has been consumed as its value.
  static bool storeValue(const CommandLineOption &commandLineOption, CommandLineOptionType prop,
                         std::optional<std::string_view> nextArg, OptValueType &data) {
    return std::visit(overloaded{
                          [&data](bool OptValueType::*arg) {
                            data.*arg = true;
                            return false;
                          },
                          [&data, nextArg](CommandLineOptionalInt32 OptValueType::*arg) {
                            if (nextArg && IsOptionInt(*nextArg)) {
                              data.*arg = FromString<int32_t>(*nextArg);
                              return true;
                            }
                            data.*arg = CommandLineOptionalInt32(CommandLineOptionalInt32::State::kOptionPresent);
                            return false;
                          },
                          [&data, nextArg, &commandLineOption](std::string_view OptValueType::*arg) {
                            if (!nextArg) {
                              ThrowExpectingValueException(commandLineOption);
                            }
                            data.*arg = *nextArg;
                            return true;
                          },
                      },
                      prop);
  }

  static int OptionNamesLen(const CommandLineOption &opt) {
    int len = static_cast<int>(2U + opt.fullName().size() + 1U + opt.valueDescription().size());
    if (opt.hasShortName()) {
      len += 4;
    }
    return len;
  }

  static void Spaces(int nbSpaces, std::ostream &stream) {
    if (nbSpaces > 0) {
      stream << std::string(static_cast<std::string::size_type>(nbSpaces), ' ');
    }
  }

  /// Prints the description word by word, going to a new line aligned on descrColumn when the line is full.
  static void PrintDescription(std::string_view descr, int descrColumn, std::ostream &stream) {
    int linePos = descrColumn;
    while (!descr.empty()) {
      const auto wordLen = std::min(descr.find_first_of(" \n"), descr.size());
      if (linePos != descrColumn && linePos + static_cast<int>(wordLen) > kMaxCharLine) {
        stream << '\n';
        Spaces(descrColumn, stream);
        linePos = descrColumn;
      }
      stream << descr.substr(0, wordLen);
      linePos += static_cast<int>(wordLen);
      if (wordLen == descr.size()) {
        break;
      }
      if (descr[wordLen] == '\n') {
        stream << '\n';
        Spaces(descrColumn, stream);
        linePos = descrColumn;
      } else {
        stream << ' ';
        ++linePos;
      }
      descr.remove_prefix(wordLen + 1U);
    }
    stream << '\n';
  }

  [[noreturn]] void invalidArgument(std::string_view argStr) const {
    LevenshteinDistanceCalculator calc;
    std::string_view closestOptionName;
    int minDistance = 0;
    for (const auto &[opt, _] : _opts) {
      const int distance = calc(opt.fullName(), argStr);
      if (closestOptionName.empty() || distance < minDistance) {
        closestOptionName = opt.fullName();
        minDistance = distance;
      }
    }

    const auto halfMinLen = static_cast<int>(std::min(argStr.size(), closestOptionName.size()) / 2U);
    if (!closestOptionName.empty() && (minDistance <= 2 || minDistance < halfMinLen)) {
      throw invalid_argument("Unrecognized command-line option '{}' - did you mean '{}'?", argStr, closestOptionName);
    }
    throw invalid_argument("Unrecognized command-line option '{}'", argStr);
  }

  vector<CommandLineOptionWithValue> _opts;
};

}  // namespace fxr
