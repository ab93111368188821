#include "unitTestHelpers.hpp"
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>

std::string createTempFile(const std::string& filename, const std::string& content)
{
    std::ofstream file(filename, std::ios::binary);
    file << content;
    file.close();
    return filename;
}

std::string readTextFile(const std::string& filename)
{
    std::ifstream file(filename, std::ios::binary);
    return std::string(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );
}

std::vector<uint8_t> toBytes(const std::string& text)
{
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string toText(const std::vector<uint8_t>& bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

std::vector<uint8_t> genRandomTextInput(int size)
{
    std::vector<uint8_t> res;
    const std::string popularSymbols = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    for (int i = 0; i < size; i++) {
        res.push_back(popularSymbols[rand() % popularSymbols.size()]);
    }
    return res;
}

std::vector<uint8_t> genRandomByteInput(int size)
{
    std::vector<uint8_t> res;
    for (int i = 0; i < size; i++) {
        res.push_back(static_cast<uint8_t>(rand() % 256));
    }
    return res;
}

namespace
{
    void searchLengths(
        const std::vector<uint64_t>& weights,
        size_t index,
        int maxLength,
        uint64_t kraftUsed,          // in units of 2^-maxLength
        uint64_t cost,
        uint64_t& best
    ) {
        const uint64_t kraftBudget = 1ULL << maxLength;
        if (index == weights.size())
        {
            if (cost < best) best = cost;
            return;
        }
        for (int length = 1; length <= maxLength; ++length)
        {
            const uint64_t share = 1ULL << (maxLength - length);
            if (kraftUsed + share > kraftBudget) continue;
            searchLengths(weights, index + 1, maxLength, kraftUsed + share,
                          cost + weights[index] * length, best);
        }
    }
}

uint64_t bruteForceOptimalLength(const huffpack::algorithms::FrequencyTable& frequencies)
{
    std::vector<uint64_t> weights;
    for (const auto& [symbol, frequency] : frequencies)
    {
        weights.push_back(frequency);
    }
    if (weights.empty()) return 0;

    // a lone symbol still needs one bit
    const int maxLength = weights.size() > 1 ? static_cast<int>(weights.size()) - 1 : 1;
    uint64_t best = std::numeric_limits<uint64_t>::max();
    searchLengths(weights, 0, maxLength, 0, 0, best);
    return best;
}
