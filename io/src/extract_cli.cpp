#include <iostream>
#include <string>
#include <vector>

#include "kappa/io/extract_app.hpp"

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  return kappa::io::runExtract(args, std::cout, std::cerr);
}
