#include "HuffmanCoder.hpp"
#include "HuffmanTree.hpp"
#include "BitStreamEncoder.hpp"
#include "BitStreamDecoder.hpp"
#include "CodecStage.hpp"
#include <iostream>
#include <memory>
#include <string>

using namespace huffpack::algorithms;

CodeTable huffpack::coder::buildCodeTable(
    const FrequencyTable& frequencies,
    bool verbose
) {
    std::unique_ptr<HuffmanNode> root = HuffmanTree::build(frequencies);
    logStage(
        CodecStage::TREE_BUILT,
        verbose,
        std::to_string(HuffmanTree::leafCount(root.get())) + " leaves"
    );

    CodeTable table = CodeTableGenerator::generate(root.get());
    logStage(CodecStage::CODES_GENERATED, verbose);
    if (verbose)
    {
        table.log(std::cout);
    }
    return table;
}

Result<huffpack::coder::CompressedData> huffpack::coder::compress(
    const std::vector<uint8_t>& symbols,
    bool verbose
) {
    Result<CompressedData> result;
    logStage(CodecStage::IDLE, verbose, std::to_string(symbols.size()) + " input symbols");

    CompressedData compressed;
    compressed.frequencies = FrequencyAnalyzer::count(symbols);
    logStage(
        CodecStage::FREQUENCIES_COUNTED,
        verbose,
        std::to_string(compressed.frequencies.size()) + " distinct symbols"
    );

    compressed.codeTable = buildCodeTable(compressed.frequencies, verbose);

    Result<std::vector<uint8_t>> encoded = BitStreamEncoder::encode(
        symbols,
        compressed.codeTable,
        verbose
    );
    if (!encoded.success())
    {
        return forwardError<CompressedData>(encoded);
    }
    compressed.payload = encoded.getValue();
    result.warnings = encoded.warnings;

    return makeResult<CompressedData>(std::move(compressed), &result);
}

Result<std::vector<uint8_t>> huffpack::coder::compressWithTable(
    const std::vector<uint8_t>& symbols,
    const CodeTable& codeTable,
    bool verbose
) {
    logStage(CodecStage::IDLE, verbose, std::to_string(symbols.size()) + " input symbols");
    return BitStreamEncoder::encode(symbols, codeTable, verbose);
}

Result<std::vector<uint8_t>> huffpack::coder::decompress(
    const std::vector<uint8_t>& payload,
    const CodeTable& codeTable,
    bool verbose
) {
    logStage(CodecStage::IDLE, verbose, std::to_string(payload.size()) + " payload bytes");
    return BitStreamDecoder::decode(payload, codeTable, verbose);
}
