#include <iostream>
#include "fieldmerge/Cli.hpp"

int main(int argc, char** argv) {
    return fieldmerge::run_cli(argc, argv, std::cout, std::cerr);
}
