#include "HuffmanSerializer.hpp"
#include "../HuffmanCoder/HuffmanCoder.hpp"
#include "../config.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <string>

using namespace huffpack::algorithms;

namespace
{
    constexpr size_t FIXED_HEADER_BYTES = 7;      // magic + version + symbol count
    constexpr size_t FREQUENCY_ENTRY_BYTES = 9;   // symbol + u64 frequency

    void writeBigEndian(std::vector<uint8_t>& out, uint64_t value, size_t byteCount)
    {
        for (size_t i = byteCount; i > 0; --i)
        {
            out.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
        }
    }

    uint64_t readBigEndian(const std::vector<uint8_t>& in, size_t offset, size_t byteCount)
    {
        uint64_t value = 0;
        for (size_t i = 0; i < byteCount; ++i)
        {
            value = (value << 8) | in[offset + i];
        }
        return value;
    }
}

std::vector<uint8_t> huffpack::serializer::writeHeader(const FrequencyTable& frequencies)
{
    std::vector<uint8_t> header;
    header.reserve(FIXED_HEADER_BYTES + frequencies.size() * FREQUENCY_ENTRY_BYTES);

    header.insert(header.end(), ContainerMagic.begin(), ContainerMagic.end());
    header.push_back(ContainerVersion);
    writeBigEndian(header, frequencies.size(), 2);

    for (const auto& [symbol, frequency] : frequencies)
    {
        header.push_back(symbol);
        writeBigEndian(header, frequency, 8);
    }
    return header;
}

Result<huffpack::serializer::ContainerHeader> huffpack::serializer::readHeader(
    const std::vector<uint8_t>& blob
) {
    Result<ContainerHeader> result;

    if (blob.size() < FIXED_HEADER_BYTES)
    {
        return makeError<ContainerHeader>(
            ErrorKind::INVALID_CONTAINER,
            "Container is " + std::to_string(blob.size()) + " bytes, too short for a header"
        );
    }
    if (!std::equal(ContainerMagic.begin(), ContainerMagic.end(), blob.begin()))
    {
        return makeError<ContainerHeader>(ErrorKind::INVALID_CONTAINER, "Bad container magic");
    }

    ContainerHeader header;
    header.version = blob[4];
    if (header.version != ContainerVersion)
    {
        return makeError<ContainerHeader>(
            ErrorKind::INVALID_CONTAINER,
            "Unsupported container version " + std::to_string(header.version)
        );
    }

    const uint64_t symbolCount = readBigEndian(blob, 5, 2);
    if (symbolCount > 256)
    {
        return makeError<ContainerHeader>(
            ErrorKind::INVALID_CONTAINER,
            "Symbol count " + std::to_string(symbolCount) + " exceeds the byte alphabet"
        );
    }

    const size_t tableEnd = FIXED_HEADER_BYTES + symbolCount * FREQUENCY_ENTRY_BYTES;
    if (blob.size() < tableEnd)
    {
        return makeError<ContainerHeader>(
            ErrorKind::INVALID_CONTAINER,
            "Frequency table truncated: expected " + std::to_string(symbolCount) + " entries"
        );
    }

    size_t offset = FIXED_HEADER_BYTES;
    uint64_t total = 0;
    for (uint64_t i = 0; i < symbolCount; ++i)
    {
        const Symbol symbol = blob[offset];
        const uint64_t frequency = readBigEndian(blob, offset + 1, 8);
        offset += FREQUENCY_ENTRY_BYTES;

        if (frequency == 0)
        {
            return makeError<ContainerHeader>(
                ErrorKind::INVALID_CONTAINER,
                "Symbol " + std::to_string(symbol) + " has zero frequency"
            );
        }
        // entries are written in ascending order, anything else is corruption
        if (!header.frequencies.empty() && header.frequencies.rbegin()->first >= symbol)
        {
            return makeError<ContainerHeader>(
                ErrorKind::INVALID_CONTAINER,
                "Frequency table entries out of order at symbol " + std::to_string(symbol)
            );
        }
        // tree merges and the decoded length check both sum the frequencies
        if (frequency > std::numeric_limits<uint64_t>::max() - total)
        {
            return makeError<ContainerHeader>(
                ErrorKind::INVALID_CONTAINER,
                "Frequency total overflows at symbol " + std::to_string(symbol)
            );
        }
        total += frequency;
        header.frequencies.emplace_hint(header.frequencies.end(), symbol, frequency);
    }
    header.payloadOffset = offset;

    return makeResult<ContainerHeader>(std::move(header), &result);
}

Result<std::vector<uint8_t>> huffpack::serializer::serialize(
    const std::vector<uint8_t>& symbols,
    bool verbose
) {
    Result<std::vector<uint8_t>> result;

    Result<coder::CompressedData> compressed = coder::compress(symbols, verbose);
    if (!compressed.success())
    {
        return forwardError<std::vector<uint8_t>>(compressed);
    }
    const coder::CompressedData& data = compressed.value.value();

    std::vector<uint8_t> blob = writeHeader(data.frequencies);
    blob.insert(blob.end(), data.payload.begin(), data.payload.end());

    if (verbose)
    {
        std::cout << "Container: " << blob.size() - data.payload.size() << " header bytes, "
                  << data.payload.size() << " payload bytes" << std::endl;
    }

    result.warnings = compressed.warnings;
    return makeResult<std::vector<uint8_t>>(std::move(blob), &result);
}

Result<std::vector<uint8_t>> huffpack::serializer::deserialize(
    const std::vector<uint8_t>& blob,
    bool verbose
) {
    Result<std::vector<uint8_t>> result;

    Result<ContainerHeader> header = readHeader(blob);
    if (!header.success())
    {
        return forwardError<std::vector<uint8_t>>(header);
    }
    const ContainerHeader& parsed = header.value.value();

    CodeTable table = coder::buildCodeTable(parsed.frequencies, verbose);

    std::vector<uint8_t> payload(blob.begin() + parsed.payloadOffset, blob.end());
    Result<std::vector<uint8_t>> decoded = coder::decompress(payload, table, verbose);
    if (!decoded.success())
    {
        return decoded;
    }

    const uint64_t expected = FrequencyAnalyzer::totalCount(parsed.frequencies);
    if (decoded.value->size() != expected)
    {
        return makeError<std::vector<uint8_t>>(
            ErrorKind::TRUNCATED_OR_CORRUPT_PAYLOAD,
            "Decoded " + std::to_string(decoded.value->size()) + " symbols, frequency table expects "
                + std::to_string(expected)
        );
    }

    result.warnings = decoded.warnings;
    return makeResult<std::vector<uint8_t>>(std::move(*decoded.value), &result);
}
