#include <iostream>
#include <string>
#include <vector>

#include "Cli/CommandLine.h"

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv, argv + argc);
  return runCli(args, std::cout, std::cerr);
}
