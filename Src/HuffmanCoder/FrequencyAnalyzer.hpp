#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace huffpack::algorithms
{
    using Symbol = uint8_t;

    // Ascending symbol order; the tree builder relies on it for its tie-break.
    using FrequencyTable = std::map<Symbol, uint64_t>;

    struct FrequencyAnalyzer
    {
        static FrequencyTable count(const std::vector<Symbol>& symbols);

        static uint64_t totalCount(const FrequencyTable& frequencies);
    };
}
