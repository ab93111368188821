#include "CodeTable.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

namespace
{
    using namespace huffpack::algorithms;

    void buildEncodingTable(
        const HuffmanNode* node,
        const BitString& path,
        CodeTable& table
    ) {
        if (node == nullptr) return;

        if (const auto* leaf = std::get_if<HuffmanLeaf>(&node->content))
        {
            table.forward[leaf->symbol] = path;
            table.reverse[path] = leaf->symbol;
            return;
        }

        const auto& internal = std::get<HuffmanInternal>(node->content);
        buildEncodingTable(internal.left.get(), path + "0", table);
        buildEncodingTable(internal.right.get(), path + "1", table);
    }

    std::string printableSymbol(Symbol symbol)
    {
        if (std::isprint(symbol) && symbol != ' ')
            return std::string("'") + static_cast<char>(symbol) + "'";

        std::ostringstream os;
        os << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(symbol);
        return os.str();
    }
}

size_t huffpack::algorithms::CodeTable::maxCodeLength() const
{
    size_t longest = 0;
    for (const auto& [symbol, code] : forward)
    {
        longest = std::max(longest, code.size());
    }
    return longest;
}

uint64_t huffpack::algorithms::CodeTable::weightedLength(const FrequencyTable& frequencies) const
{
    uint64_t total = 0;
    for (const auto& [symbol, frequency] : frequencies)
    {
        auto it = forward.find(symbol);
        if (it == forward.end()) continue;
        total += frequency * it->second.size();
    }
    return total;
}

bool huffpack::algorithms::CodeTable::isPrefixFree() const
{
    // After sorting, a code that prefixes another sorts directly before
    // some code it prefixes, so checking neighbours is enough.
    std::vector<BitString> codes;
    codes.reserve(forward.size());
    for (const auto& [symbol, code] : forward)
    {
        if (code.empty()) return false;
        codes.push_back(code);
    }
    std::sort(codes.begin(), codes.end());

    for (size_t i = 1; i < codes.size(); ++i)
    {
        const BitString& shorter = codes[i - 1];
        const BitString& longer = codes[i];
        if (longer.compare(0, shorter.size(), shorter) == 0)
            return false;
    }
    return true;
}

void huffpack::algorithms::CodeTable::log(std::ostream& os) const
{
    os << "Code table (" << forward.size() << " symbols, longest code "
       << maxCodeLength() << " bits):\n";
    for (const auto& [symbol, code] : forward)
    {
        os << std::setw(8) << printableSymbol(symbol) << " | " << code << "\n";
    }
    os << std::flush;
}

huffpack::algorithms::CodeTable huffpack::algorithms::CodeTableGenerator::generate(
    const HuffmanNode* root
) {
    CodeTable table;
    if (root == nullptr)
        return table;

    if (const auto* leaf = std::get_if<HuffmanLeaf>(&root->content))
    {
        // an empty code could never be matched while decoding
        table.forward[leaf->symbol] = "0";
        table.reverse["0"] = leaf->symbol;
        return table;
    }

    buildEncodingTable(root, "", table);
    return table;
}

huffpack::algorithms::CodeTable huffpack::algorithms::CodeTableGenerator::generate(
    const FrequencyTable& frequencies
) {
    std::unique_ptr<HuffmanNode> root = HuffmanTree::build(frequencies);
    return generate(root.get());
}
