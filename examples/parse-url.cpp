#include <stackquery/stackquery.hpp>
#include <cstdlib>
#include <iostream>
#include <string_view>

#include "stackquery/log.hpp"

using namespace stackquery;

// Parses each URL given on the command line and prints its decoded query parameters.
// Pass '-v' first to log the degraded outcomes (truncations, dropped parameters).
int main(int argc, char **argv) {
  int firstArg = 1;
  if (argc > 1 && std::string_view(argv[1]) == "-v") {
    log::set_level(log::level::trace);
    ++firstArg;
  }
  if (firstArg >= argc) {
    std::cerr << "Usage: " << argv[0] << " [-v] <url>...\n";
    return EXIT_FAILURE;
  }

  log::info("{}", fullVersionStringView());

  for (int argPos = firstArg; argPos < argc; ++argPos) {
    const std::string_view url(argv[argPos]);

    // 8 parameters of 16 bytes keys and 64 bytes values, entirely on the stack
    QueryParams<8, 16, 64> params;
    params.parse(url);

    log::info("'{}': {} parameter(s)", url, params.size());
    for (const auto &[key, value] : params) {
      std::cout << key << " = " << value << '\n';
    }
  }

  return EXIT_SUCCESS;
}
