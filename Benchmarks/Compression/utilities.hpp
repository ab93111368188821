#include <benchmark/benchmark.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"

namespace benchmark
{
    namespace utilities
    {
        std::vector<uint8_t> GenerateInput(
            const std::string &alphabet,
            int size
        );

        std::vector<uint8_t> GenerateRandomBytes(int size);

        void ReportCompression(
            benchmark::State &state,
            size_t inputSize,
            size_t outputSize
        );
    }
}
