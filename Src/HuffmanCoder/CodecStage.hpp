#pragma once
#include <iostream>
#include <string>

namespace huffpack::algorithms
{
    // Per-call progression; nothing is kept between calls.
    enum class CodecStage
    {
        IDLE,
        FREQUENCIES_COUNTED,
        TREE_BUILT,
        CODES_GENERATED,
        ENCODED,
        PAYLOAD_UNPACKED,
        PADDING_STRIPPED,
        DECODED
    };

    inline std::string codecStageToString(CodecStage stage)
    {
        switch (stage)
        {
            case CodecStage::IDLE: return "Idle";
            case CodecStage::FREQUENCIES_COUNTED: return "FrequenciesCounted";
            case CodecStage::TREE_BUILT: return "TreeBuilt";
            case CodecStage::CODES_GENERATED: return "CodesGenerated";
            case CodecStage::ENCODED: return "Encoded";
            case CodecStage::PAYLOAD_UNPACKED: return "PayloadUnpacked";
            case CodecStage::PADDING_STRIPPED: return "PaddingStripped";
            case CodecStage::DECODED: return "Decoded";
        }
        return "Unknown";
    }

    inline void logStage(CodecStage stage, bool verbose, const std::string& detail = "")
    {
        if (!verbose) return;
        std::cout << " - " << codecStageToString(stage);
        if (!detail.empty())
        {
            std::cout << ": " << detail;
        }
        std::cout << std::endl;
    }
}
