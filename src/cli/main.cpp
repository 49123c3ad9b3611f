// pkglint: compile-check and reformat a package and its local dependencies.
//
//     pkglint                       # lint the package in the current directory
//     pkglint --path ../token -v    # another package, debug logging
//     pkglint --stdin < main.leo    # normalize stdin to stdout only

#include <pkglint/cli.hpp>

#include <iostream>

int main(int argc, char** argv) {
    return pkglint::run_cli(argc, argv, std::cin, std::cout, std::cerr);
}
