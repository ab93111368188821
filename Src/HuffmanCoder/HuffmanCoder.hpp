#pragma once
#include <cstdint>
#include <vector>
#include "../Helpers/Result.hpp"
#include "FrequencyAnalyzer.hpp"
#include "CodeTable.hpp"

namespace huffpack
{
    namespace coder
    {
        struct CompressedData
        {
            std::vector<uint8_t> payload;
            algorithms::FrequencyTable frequencies;
            algorithms::CodeTable codeTable;
        };

        // Frequencies -> tree -> codes. The tree is dropped once traversed.
        algorithms::CodeTable buildCodeTable(
            const algorithms::FrequencyTable& frequencies,
            bool verbose = false
        );

        // Builds the table from the input's own frequencies and encodes with it.
        Result<CompressedData> compress(
            const std::vector<uint8_t>& symbols,
            bool verbose = false
        );

        Result<std::vector<uint8_t>> compressWithTable(
            const std::vector<uint8_t>& symbols,
            const algorithms::CodeTable& codeTable,
            bool verbose = false
        );

        Result<std::vector<uint8_t>> decompress(
            const std::vector<uint8_t>& payload,
            const algorithms::CodeTable& codeTable,
            bool verbose = false
        );
    }
}
