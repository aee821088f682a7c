#include "cli.hpp"
#include <exception>
#include <iostream>

int main(int argc, char* argv[]) try {
    return hookcache::run_cli(argc, argv, std::cin, std::cout, std::cerr);
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
