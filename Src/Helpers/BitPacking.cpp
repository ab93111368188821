#include "BitPacking.hpp"
#include <stdexcept>

void huffpack::algorithms::BitPacking::appendBits(
    BitSequence& bits,
    uint64_t value,
    uint8_t bitCount
) {
    if (bitCount > 64)
        throw std::invalid_argument("bitCount must be between 0 and 64");

    for (int shift = static_cast<int>(bitCount) - 1; shift >= 0; --shift)
    {
        bits.push_back(((value >> shift) & 1ULL) != 0);
    }
}

uint64_t huffpack::algorithms::BitPacking::readBits(
    const BitSequence& bits,
    size_t offset,
    uint8_t bitCount
) {
    if (bitCount > 64)
        throw std::invalid_argument("bitCount must be between 0 and 64");
    if (offset + bitCount > bits.size())
        throw std::out_of_range("Not enough bits to read");

    uint64_t value = 0;
    for (size_t i = 0; i < bitCount; ++i)
    {
        value = (value << 1) | (bits[offset + i] ? 1ULL : 0ULL);
    }
    return value;
}

std::vector<uint8_t> huffpack::algorithms::BitPacking::pack(const BitSequence& bits)
{
    if (bits.size() % 8 != 0)
        throw std::invalid_argument("Bit count must be a multiple of 8 to pack");

    std::vector<uint8_t> output;
    output.reserve(bits.size() / 8);

    uint8_t byte = 0;
    uint8_t bitCount = 0;
    for (size_t i = 0; i < bits.size(); ++i)
    {
        byte = static_cast<uint8_t>((byte << 1) | (bits[i] ? 1 : 0));
        ++bitCount;
        if (bitCount == 8)
        {
            output.push_back(byte);
            byte = 0;
            bitCount = 0;
        }
    }

    return output;
}

huffpack::algorithms::BitSequence huffpack::algorithms::BitPacking::unpack(
    const std::vector<uint8_t>& buffer
) {
    BitSequence bits;
    for (uint8_t byte : buffer)
    {
        appendBits(bits, byte, 8);
    }
    return bits;
}
