#include "utilities.hpp"
#include <cstdlib>

std::vector<uint8_t> benchmark::utilities::GenerateInput(
    const std::string &alphabet,
    int size
) {
    std::vector<uint8_t> res;
    res.reserve(size);
    for (int i = 0; i < size; i++) {
        res.push_back(static_cast<uint8_t>(alphabet[rand() % alphabet.size()]));
    }
    return res;
}

std::vector<uint8_t> benchmark::utilities::GenerateRandomBytes(int size)
{
    std::vector<uint8_t> res;
    res.reserve(size);
    for (int i = 0; i < size; i++) {
        res.push_back(static_cast<uint8_t>(rand() % 256));
    }
    return res;
}

void benchmark::utilities::ReportCompression(
    benchmark::State &state,
    size_t inputSize,
    size_t outputSize
) {
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * inputSize);
    state.counters["InputBytes"] = static_cast<double>(inputSize);
    state.counters["OutputBytes"] = static_cast<double>(outputSize);
    if (outputSize > 0)
    {
        state.counters["Ratio"] = static_cast<double>(inputSize) / outputSize;
    }
}
