#pragma once
#ifndef HUFFPACK_HUFFMANTREE_HPP
#define HUFFPACK_HUFFMANTREE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <variant>
#include "FrequencyAnalyzer.hpp"

namespace huffpack::algorithms
{
    struct HuffmanNode;

    struct HuffmanLeaf
    {
        Symbol symbol;
        uint64_t frequency;
    };

    // Always has exactly two children; frequency is their sum.
    struct HuffmanInternal
    {
        uint64_t frequency;
        std::unique_ptr<HuffmanNode> left;
        std::unique_ptr<HuffmanNode> right;
    };

    struct HuffmanNode
    {
        std::variant<HuffmanLeaf, HuffmanInternal> content;

        explicit HuffmanNode(HuffmanLeaf leaf)
            : content(std::move(leaf))
        {}

        explicit HuffmanNode(HuffmanInternal internal)
            : content(std::move(internal))
        {}

        bool isLeaf() const
        {
            return std::holds_alternative<HuffmanLeaf>(content);
        }

        uint64_t frequency() const;
    };

    struct HuffmanTree
    {
        /*
         * Repeatedly merges the two lowest-frequency nodes until one remains.
         * The first node popped becomes the left child, the second the right.
         * Ties are broken by insertion order: leaves in ascending symbol order,
         * merged nodes numbered after them as they are created, so identical
         * tables always give identical trees.
         *
         * Returns nullptr for an empty table and a bare leaf for a table with
         * a single symbol. Zero-frequency entries are ignored.
         */
        static std::unique_ptr<HuffmanNode> build(const FrequencyTable& frequencies);

        // Sum of frequency * depth over all leaves.
        static uint64_t weightedPathLength(const HuffmanNode* root);

        static size_t leafCount(const HuffmanNode* root);
    };
}

#endif // HUFFPACK_HUFFMANTREE_HPP
