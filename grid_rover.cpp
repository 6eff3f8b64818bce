#include <iostream>
#include <string>
#include <vector>

#include "grid_rtree/cli.h"

int main(int argc, char **argv) {
  const std::vector<std::string> args(argv, argv + argc);
  return grid_rtree::run_cli(args, std::cin, std::cout, std::cerr);
}
