#pragma once
#ifndef HUFFPACK_CODETABLE_HPP
#define HUFFPACK_CODETABLE_HPP

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <unordered_map>
#include "FrequencyAnalyzer.hpp"
#include "HuffmanTree.hpp"

namespace huffpack::algorithms
{
    // A code as a string of '0' / '1' characters.
    using BitString = std::string;

    struct CodeTable
    {
        std::map<Symbol, BitString> forward;
        std::unordered_map<BitString, Symbol> reverse;

        bool empty() const
        {
            return forward.empty();
        }

        size_t size() const
        {
            return forward.size();
        }

        bool contains(Symbol symbol) const
        {
            return forward.find(symbol) != forward.end();
        }

        size_t maxCodeLength() const;

        // Encoded bit count (before padding) for the given frequencies.
        uint64_t weightedLength(const FrequencyTable& frequencies) const;

        bool isPrefixFree() const;

        void log(std::ostream& os = std::cout) const;
    };

    struct CodeTableGenerator
    {
        // Left edge appends '0', right edge '1'. A root that is itself a leaf
        // gets the code "0"; a null root gives an empty table.
        static CodeTable generate(const HuffmanNode* root);

        static CodeTable generate(const FrequencyTable& frequencies);
    };
}

#endif // HUFFPACK_CODETABLE_HPP
