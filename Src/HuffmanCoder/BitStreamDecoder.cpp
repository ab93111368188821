#include "BitStreamDecoder.hpp"
#include "BitStreamEncoder.hpp"
#include "../Helpers/BitPacking.hpp"
#include "CodecStage.hpp"
#include <string>

Result<std::vector<huffpack::algorithms::Symbol>> huffpack::algorithms::BitStreamDecoder::decode(
    const std::vector<uint8_t>& payload,
    const CodeTable& table,
    bool verbose
) {
    Result<std::vector<Symbol>> result;

    if (payload.empty())
    {
        return makeError<std::vector<Symbol>>(
            ErrorKind::TRUNCATED_OR_CORRUPT_PAYLOAD,
            "Payload is empty, padding header missing"
        );
    }

    const BitSequence bits = BitPacking::unpack(payload);
    logStage(CodecStage::PAYLOAD_UNPACKED, verbose, std::to_string(bits.size()) + " bits");

    const uint64_t padding = BitPacking::readBits(bits, 0, BitStreamEncoder::HEADER_BITS);
    const size_t bodyBits = bits.size() - BitStreamEncoder::HEADER_BITS;
    if (padding > 7 || padding > bodyBits)
    {
        return makeError<std::vector<Symbol>>(
            ErrorKind::TRUNCATED_OR_CORRUPT_PAYLOAD,
            "Padding header " + std::to_string(padding) + " is invalid for "
                + std::to_string(bodyBits) + " payload bits"
        );
    }

    const size_t begin = BitStreamEncoder::HEADER_BITS;
    const size_t end = bits.size() - padding;
    for (size_t i = end; i < bits.size(); ++i)
    {
        if (bits[i])
        {
            result.addWarning("Padding bits are not all zero");
            break;
        }
    }
    logStage(CodecStage::PADDING_STRIPPED, verbose, std::to_string(end - begin) + " code bits");

    // no code can be longer than this, so a longer accumulator never matches
    const size_t longestCode = table.maxCodeLength();

    std::vector<Symbol> decoded;
    BitString current;
    for (size_t i = begin; i < end; ++i)
    {
        current.push_back(bits[i] ? '1' : '0');

        auto it = table.reverse.find(current);
        if (it != table.reverse.end())
        {
            decoded.push_back(it->second);
            current.clear();
        }
        else if (current.size() >= longestCode)
        {
            return makeError<std::vector<Symbol>>(
                ErrorKind::TRUNCATED_OR_CORRUPT_PAYLOAD,
                "Bits " + current + " at offset " + std::to_string(i + 1 - begin - current.size())
                    + " match no code"
            );
        }
    }

    if (!current.empty())
    {
        return makeError<std::vector<Symbol>>(
            ErrorKind::TRUNCATED_OR_CORRUPT_PAYLOAD,
            "Payload ended inside a code, " + std::to_string(current.size()) + " bits unmatched"
        );
    }

    logStage(CodecStage::DECODED, verbose, std::to_string(decoded.size()) + " symbols");
    return makeResult<std::vector<Symbol>>(std::move(decoded), &result);
}
