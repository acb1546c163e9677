#include "cli.hpp"

int main(int argc, char **argv) {
    return recog::run_cli(argc, argv, std::cout, std::cerr);
}
