#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <span>
#include <string>

#include "commandlineoptionsparser.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "fxresolveroptions.hpp"
#include "fxresolveroptionsdef.hpp"
#include "processcommandsfromcli.hpp"

int main(int argc, const char* argv[]) {
  using namespace fxr;
  try {
    auto parser =
        CommandLineOptionsParser<FxResolverCmdLineOptions>(FxResolverAllowedOptions<FxResolverCmdLineOptions>::value);

    const auto programName = std::filesystem::path(argv[0]).filename().string();

    // skip first argument which is program name
    const std::span<const char* const> allArguments(argv, argc);
    const auto cmdLineOptions = parser.parse(allArguments.subspan(1));

    if (cmdLineOptions.version) {
      FxResolverCmdLineOptions::PrintVersion(programName, std::cout);
      return EXIT_SUCCESS;
    }
    if (cmdLineOptions.help || !cmdLineOptions.hasRateQuery()) {
      parser.displayHelp(programName, std::cout);
      return EXIT_SUCCESS;
    }

    return ProcessCommandsFromCLI(programName, cmdLineOptions);
  } catch (const invalid_argument& e) {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return EXIT_FAILURE;
  }
}
