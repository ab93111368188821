#pragma once
#include <cstdint>
#include <vector>
#include "../Helpers/Result.hpp"
#include "CodeTable.hpp"

namespace huffpack::algorithms
{
    struct BitStreamEncoder
    {
        static constexpr uint8_t HEADER_BITS = 8;

        // Zero bits needed to bring `bitCount` up to a byte boundary (0..7).
        static uint8_t paddingFor(uint64_t bitCount);

        /*
         * Output layout:
         *   byte 0     padding count (0..7)
         *   bytes 1..N concatenated codes followed by `padding` zero bits,
         *              most significant bit first in every byte
         *
         * Fails with UNKNOWN_SYMBOL if a symbol has no forward code; nothing
         * is emitted in that case.
         */
        static Result<std::vector<uint8_t>> encode(
            const std::vector<Symbol>& symbols,
            const CodeTable& table,
            bool verbose = false
        );
    };
}
