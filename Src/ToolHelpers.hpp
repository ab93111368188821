#pragma once
#include <chrono>
#include <iostream>
#include <string>
#include <type_traits>
#include "Helpers/Result.hpp"
#include "config.hpp"

struct ToolOptions
{
    std::string command;      // "compress" or "decompress"
    std::string inputPath;
    std::string outputPath;   // derived from inputPath when empty
    bool trimTrailingWhitespace = DefaultTrimTrailingWhitespace;
    bool verbose = DefaultVerbose;
};

std::string usage(const std::string &program);

Result<ToolOptions> parseArguments(int argc, char **argv);

// Both return the path that was written.
Result<std::string> runCompress(const ToolOptions &options);

Result<std::string> runDecompress(const ToolOptions &options);

Result<std::string> runCommand(const ToolOptions &options);

// Prints the outcome and returns the process exit code.
template<typename T>
int handleResult(
    Result<T> &result,
    const std::chrono::high_resolution_clock::time_point &start,
    const std::chrono::high_resolution_clock::time_point &end
) {
    for (const auto &warning : result.warnings)
    {
        std::cerr << "Warning: " << warning << std::endl;
    }

    if (!result.success())
    {
        std::cerr << "Error: " << result.describeError() << std::endl;
        return 1;
    }

    auto timeDiff = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::string successMessage = "Success in " + std::to_string(timeDiff * 0.000000001) + " s.";

    if constexpr (std::is_convertible_v<T, std::string> || std::is_same_v<T, std::string>)
    {
        successMessage += " Result: " + result.value.value();
    }

    std::cout << successMessage << std::endl;
    return 0;
};
