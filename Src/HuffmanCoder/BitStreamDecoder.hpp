#pragma once
#include <cstdint>
#include <vector>
#include "../Helpers/Result.hpp"
#include "CodeTable.hpp"

namespace huffpack::algorithms
{
    struct BitStreamDecoder
    {
        // Greedy prefix match against table.reverse. The table must be the one
        // used to encode. Fails with TRUNCATED_OR_CORRUPT_PAYLOAD when the
        // header is missing or out of range, or bits are left unmatched.
        // Non-zero padding bits only add a warning.
        static Result<std::vector<Symbol>> decode(
            const std::vector<uint8_t>& payload,
            const CodeTable& table,
            bool verbose = false
        );
    };
}
