#include "commands.hxx"

#include <iostream>

int main(int argc, char **argv) {
  return txtpack::cli::run(argc, argv, std::cin, std::cout, std::cerr);
}
