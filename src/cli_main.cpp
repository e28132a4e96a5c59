#include <iostream>
#include "mergepatch/Cli.hpp"

int main(int argc, char** argv) {
    return mergepatch::run_cli(argc, argv, std::cin, std::cout, std::cerr);
}
