#pragma once
#ifndef HUFFPACK_BITPACKING_HPP
#define HUFFPACK_BITPACKING_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include <boost/dynamic_bitset.hpp>

namespace huffpack::algorithms
{
    // Bits in stream order: index 0 is the first bit written / read.
    using BitSequence = boost::dynamic_bitset<>;

    struct BitPacking
    {
        // Appends the lowest `bitCount` bits of `value`, most significant first.
        static void appendBits(
            BitSequence& bits,
            uint64_t value,
            uint8_t bitCount
        );

        static uint64_t readBits(
            const BitSequence& bits,
            size_t offset,
            uint8_t bitCount
        );

        // Groups of 8 bits, MSB first. Throws if bits.size() is not a multiple of 8.
        static std::vector<uint8_t> pack(const BitSequence& bits);

        static BitSequence unpack(const std::vector<uint8_t>& buffer);
    };
}

#endif // HUFFPACK_BITPACKING_HPP
