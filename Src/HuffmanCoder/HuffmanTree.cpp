#include "HuffmanTree.hpp"
#include <algorithm>
#include <vector>

namespace
{
    using huffpack::algorithms::HuffmanNode;

    struct HeapEntry
    {
        uint64_t frequency;
        uint64_t order;
        std::unique_ptr<HuffmanNode> node;
    };

    // std::*_heap builds a max-heap, so invert to keep the smallest on top
    struct HeapEntryGreater
    {
        bool operator()(const HeapEntry& l, const HeapEntry& r) const
        {
            if (l.frequency != r.frequency)
                return l.frequency > r.frequency;
            return l.order > r.order;
        }
    };

    void pushEntry(std::vector<HeapEntry>& heap, HeapEntry entry)
    {
        heap.push_back(std::move(entry));
        std::push_heap(heap.begin(), heap.end(), HeapEntryGreater());
    }

    HeapEntry popMinimum(std::vector<HeapEntry>& heap)
    {
        std::pop_heap(heap.begin(), heap.end(), HeapEntryGreater());
        HeapEntry entry = std::move(heap.back());
        heap.pop_back();
        return entry;
    }

    uint64_t weightedPathLengthAt(const HuffmanNode* node, uint64_t depth)
    {
        if (node == nullptr) return 0;

        if (const auto* leaf = std::get_if<huffpack::algorithms::HuffmanLeaf>(&node->content))
        {
            return leaf->frequency * depth;
        }
        const auto& internal = std::get<huffpack::algorithms::HuffmanInternal>(node->content);
        return weightedPathLengthAt(internal.left.get(), depth + 1)
             + weightedPathLengthAt(internal.right.get(), depth + 1);
    }
}

uint64_t huffpack::algorithms::HuffmanNode::frequency() const
{
    return std::visit([](const auto& node) -> uint64_t
    {
        return node.frequency;
    }, content);
}

std::unique_ptr<huffpack::algorithms::HuffmanNode> huffpack::algorithms::HuffmanTree::build(
    const FrequencyTable& frequencies
) {
    std::vector<HeapEntry> heap;
    heap.reserve(frequencies.size());

    uint64_t order = 0;
    for (const auto& [symbol, frequency] : frequencies)
    {
        if (frequency == 0) continue;
        pushEntry(heap, HeapEntry{
            frequency,
            order++,
            std::make_unique<HuffmanNode>(HuffmanLeaf{symbol, frequency})
        });
    }

    if (heap.empty())
        return nullptr;

    while (heap.size() > 1)
    {
        HeapEntry left = popMinimum(heap);
        HeapEntry right = popMinimum(heap);

        uint64_t merged = left.frequency + right.frequency;
        pushEntry(heap, HeapEntry{
            merged,
            order++,
            std::make_unique<HuffmanNode>(HuffmanInternal{
                merged,
                std::move(left.node),
                std::move(right.node)
            })
        });
    }

    return std::move(heap.front().node);
}

uint64_t huffpack::algorithms::HuffmanTree::weightedPathLength(const HuffmanNode* root)
{
    return weightedPathLengthAt(root, 0);
}

size_t huffpack::algorithms::HuffmanTree::leafCount(const HuffmanNode* root)
{
    if (root == nullptr) return 0;
    if (root->isLeaf()) return 1;

    const auto& internal = std::get<HuffmanInternal>(root->content);
    return leafCount(internal.left.get()) + leafCount(internal.right.get());
}
