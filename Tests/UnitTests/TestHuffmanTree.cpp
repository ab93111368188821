#include <gtest/gtest.h>
#include "../../Src/HuffmanCoder/HuffmanTree.hpp"
#include "helpers/unitTestHelpers.hpp"

using namespace huffpack::algorithms;

namespace
{
    // every internal node carries the sum of its children and has both of them
    bool frequenciesAreConsistent(const HuffmanNode* node)
    {
        if (node->isLeaf()) return true;

        const auto& internal = std::get<HuffmanInternal>(node->content);
        if (!internal.left || !internal.right) return false;
        if (internal.frequency != internal.left->frequency() + internal.right->frequency())
            return false;
        return frequenciesAreConsistent(internal.left.get())
            && frequenciesAreConsistent(internal.right.get());
    }

    Symbol leafSymbol(const HuffmanNode* node)
    {
        return std::get<HuffmanLeaf>(node->content).symbol;
    }
}

TEST(HuffmanTreeTest, EmptyTableHasNoRoot)
{
    EXPECT_EQ(HuffmanTree::build({}), nullptr);
    EXPECT_EQ(HuffmanTree::leafCount(nullptr), 0);
    EXPECT_EQ(HuffmanTree::weightedPathLength(nullptr), 0);
}

TEST(HuffmanTreeTest, SingleSymbolRootIsLeaf)
{
    std::unique_ptr<HuffmanNode> root = HuffmanTree::build({{'x', 42}});

    ASSERT_NE(root, nullptr);
    ASSERT_TRUE(root->isLeaf());
    EXPECT_EQ(leafSymbol(root.get()), 'x');
    EXPECT_EQ(root->frequency(), 42);
}

TEST(HuffmanTreeTest, MergesSmallestPairFirst)
{
    // c(1) + b(2) merge first, then a(3) pops before the merged node (3)
    std::unique_ptr<HuffmanNode> root = HuffmanTree::build(FrequencyAnalyzer::count(toBytes("aaabbc")));

    ASSERT_NE(root, nullptr);
    ASSERT_FALSE(root->isLeaf());
    EXPECT_EQ(root->frequency(), 6);

    const auto& top = std::get<HuffmanInternal>(root->content);
    ASSERT_TRUE(top.left->isLeaf());
    EXPECT_EQ(leafSymbol(top.left.get()), 'a');

    ASSERT_FALSE(top.right->isLeaf());
    const auto& merged = std::get<HuffmanInternal>(top.right->content);
    EXPECT_EQ(merged.frequency, 3);
    EXPECT_EQ(leafSymbol(merged.left.get()), 'c');
    EXPECT_EQ(leafSymbol(merged.right.get()), 'b');

    EXPECT_EQ(HuffmanTree::weightedPathLength(root.get()), 9);
}

TEST(HuffmanTreeTest, InternalFrequencyIsSumOfChildren)
{
    FrequencyTable frequencies = FrequencyAnalyzer::count(genRandomByteInput(5000));
    std::unique_ptr<HuffmanNode> root = HuffmanTree::build(frequencies);

    ASSERT_NE(root, nullptr);
    EXPECT_TRUE(frequenciesAreConsistent(root.get()));
    EXPECT_EQ(root->frequency(), 5000);
    EXPECT_EQ(HuffmanTree::leafCount(root.get()), frequencies.size());
}

TEST(HuffmanTreeTest, ZeroFrequencyEntriesAreSkipped)
{
    std::unique_ptr<HuffmanNode> root = HuffmanTree::build({{'a', 0}, {'b', 4}, {'c', 0}});

    ASSERT_NE(root, nullptr);
    ASSERT_TRUE(root->isLeaf());
    EXPECT_EQ(leafSymbol(root.get()), 'b');
}

TEST(HuffmanTreeTest, EqualFrequenciesBuildTheSameTreeEveryTime)
{
    FrequencyTable frequencies = {{'d', 1}, {'a', 1}, {'c', 1}, {'b', 1}};

    std::unique_ptr<HuffmanNode> first = HuffmanTree::build(frequencies);
    std::unique_ptr<HuffmanNode> second = HuffmanTree::build(frequencies);

    // a+b merge first, then c+d, then the two pairs in creation order
    const auto& firstTop = std::get<HuffmanInternal>(first->content);
    const auto& firstLeft = std::get<HuffmanInternal>(firstTop.left->content);
    const auto& firstRight = std::get<HuffmanInternal>(firstTop.right->content);
    EXPECT_EQ(leafSymbol(firstLeft.left.get()), 'a');
    EXPECT_EQ(leafSymbol(firstLeft.right.get()), 'b');
    EXPECT_EQ(leafSymbol(firstRight.left.get()), 'c');
    EXPECT_EQ(leafSymbol(firstRight.right.get()), 'd');

    const auto& secondTop = std::get<HuffmanInternal>(second->content);
    const auto& secondLeft = std::get<HuffmanInternal>(secondTop.left->content);
    EXPECT_EQ(leafSymbol(secondLeft.left.get()), 'a');
    EXPECT_EQ(leafSymbol(secondLeft.right.get()), 'b');
}
