#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "../Helpers/Result.hpp"
#include "../HuffmanCoder/FrequencyAnalyzer.hpp"

namespace huffpack
{
    namespace serializer
    {
        /*
         * Container layout (multi-byte fields big-endian):
         *   [0..3]   magic "HUFP"
         *   [4]      version
         *   [5..6]   symbol count S (0..256)
         *   S x      symbol (u8), frequency (u64), ascending symbol order
         *   [...]    encoded payload: padding header + packed code bits
         *
         * The frequency table is enough for the reader to rebuild the exact
         * code table, because tree construction is deterministic.
         */
        struct ContainerHeader
        {
            uint8_t version;
            algorithms::FrequencyTable frequencies;
            size_t payloadOffset;
        };

        std::vector<uint8_t> writeHeader(const algorithms::FrequencyTable& frequencies);

        Result<ContainerHeader> readHeader(const std::vector<uint8_t>& blob);

        Result<std::vector<uint8_t>> serialize(
            const std::vector<uint8_t>& symbols,
            bool verbose = false
        );

        Result<std::vector<uint8_t>> deserialize(
            const std::vector<uint8_t>& blob,
            bool verbose = false
        );
    }
}
