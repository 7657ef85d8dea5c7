#include "CLI.h"
#include <iostream>

int main(int argc, char* argv[]) {
    auto options = NetLink::CLI::parseArguments(argc, argv);
    if (!options) {
        std::cerr << "Error: " << options.error().message << std::endl;
        NetLink::CLI::printUsage();
        return 1;
    }
    return NetLink::CLI::run(*options);
}
