#include "FrequencyAnalyzer.hpp"
#include <array>

huffpack::algorithms::FrequencyTable huffpack::algorithms::FrequencyAnalyzer::count(
    const std::vector<Symbol>& symbols
) {
    std::array<uint64_t, 256> counts{};
    for (Symbol symbol : symbols)
    {
        counts[symbol]++;
    }

    FrequencyTable frequencies;
    for (size_t i = 0; i < counts.size(); ++i)
    {
        if (counts[i] == 0) continue;
        frequencies.emplace(static_cast<Symbol>(i), counts[i]);
    }
    return frequencies;
}

uint64_t huffpack::algorithms::FrequencyAnalyzer::totalCount(const FrequencyTable& frequencies)
{
    uint64_t total = 0;
    for (const auto& [symbol, frequency] : frequencies)
    {
        total += frequency;
    }
    return total;
}
