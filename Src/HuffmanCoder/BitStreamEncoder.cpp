#include "BitStreamEncoder.hpp"
#include "../Helpers/BitPacking.hpp"
#include "CodecStage.hpp"
#include <string>

uint8_t huffpack::algorithms::BitStreamEncoder::paddingFor(uint64_t bitCount)
{
    return static_cast<uint8_t>((8 - bitCount % 8) % 8);
}

Result<std::vector<uint8_t>> huffpack::algorithms::BitStreamEncoder::encode(
    const std::vector<Symbol>& symbols,
    const CodeTable& table,
    bool verbose
) {
    Result<std::vector<uint8_t>> result;

    // First pass validates every symbol and sizes the body, so the padding
    // header can be written before the codes.
    uint64_t bodyBits = 0;
    for (size_t i = 0; i < symbols.size(); ++i)
    {
        auto it = table.forward.find(symbols[i]);
        if (it == table.forward.end())
        {
            return makeError<std::vector<uint8_t>>(
                ErrorKind::UNKNOWN_SYMBOL,
                "Symbol " + std::to_string(static_cast<int>(symbols[i]))
                    + " at position " + std::to_string(i) + " has no code"
            );
        }
        bodyBits += it->second.size();
    }

    const uint8_t padding = paddingFor(bodyBits);

    BitSequence bits;
    BitPacking::appendBits(bits, padding, HEADER_BITS);
    for (Symbol symbol : symbols)
    {
        for (char bit : table.forward.at(symbol))
        {
            bits.push_back(bit == '1');
        }
    }
    BitPacking::appendBits(bits, 0, padding);

    if (bits.size() % 8 != 0)
    {
        return makeError<std::vector<uint8_t>>(
            ErrorKind::MISALIGNED_PAYLOAD,
            "Encoded bit count " + std::to_string(bits.size()) + " is not a multiple of 8"
        );
    }

    std::vector<uint8_t> packed = BitPacking::pack(bits);
    logStage(
        CodecStage::ENCODED,
        verbose,
        std::to_string(bodyBits) + " code bits, " + std::to_string(padding)
            + " padding bits, " + std::to_string(packed.size()) + " bytes"
    );

    return makeResult<std::vector<uint8_t>>(std::move(packed), &result);
}
