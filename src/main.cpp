#include <iostream>
#include <string>

#include "wgsessions/app.hpp"
#include "wgsessions/config.hpp"
#include "wgsessions/timestamp.hpp"

int main(int argc, char** argv) {
  wgsessions::RunConfig cfg;
  std::string err;

  switch (wgsessions::parse_args(argc, argv, cfg, &err)) {
    case wgsessions::ArgsResult::kHelp:
      wgsessions::print_usage(std::cout);
      return 0;
    case wgsessions::ArgsResult::kVersion:
      std::cout << "wgsessions v" << wgsessions::kVersion << "\n";
      return 0;
    case wgsessions::ArgsResult::kError:
      std::cerr << err << "\n";
      wgsessions::print_usage(std::cerr);
      return 1;
    case wgsessions::ArgsResult::kRun:
      break;
  }

  return wgsessions::run_report(cfg, wgsessions::local_today(), std::cout, std::cerr);
}
