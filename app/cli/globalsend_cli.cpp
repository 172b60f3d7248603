#include <iostream>
#include <string>
#include <vector>

#include "CliApp.h"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    GlobalSend::CliApp app(std::cout, std::cerr);
    return app.run(args);
}
