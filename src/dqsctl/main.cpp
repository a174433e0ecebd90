#include "app/command_runner.hpp"
#include "infrastructure/logging/logger.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> arguments(argv + 1, argv + argc);

    DQS::App::CommandRunner runner(std::cout, std::cerr);
    int exit_code = runner.run(arguments);

    DQS::Logger::getInstance().flush();
    return exit_code;
}
