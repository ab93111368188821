#include "ToolHelpers.hpp"
#include <chrono>
#include <iostream>
#include <string>

int main(int argc, char **argv)
{
    const std::string program = argc > 0 ? argv[0] : "HuffmanTool";

    Result<ToolOptions> options = parseArguments(argc, argv);
    if (!options.success())
    {
        std::cerr << "Error: " << options.describeError() << std::endl;
        std::cerr << usage(program) << std::endl;
        return 1;
    }

    const std::chrono::high_resolution_clock::time_point start = std::chrono::high_resolution_clock::now();
    Result<std::string> result = runCommand(options.value.value());
    const std::chrono::high_resolution_clock::time_point end = std::chrono::high_resolution_clock::now();

    return handleResult(result, start, end);
}
