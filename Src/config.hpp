#pragma once
#include <cstdint>
#include <string>

const std::string CompressedSuffix = "_huffman.huffman";
// stem marker dropped again when naming the decompressed file
const std::string CompressedStemMarker = "_huffman";
const std::string DecompressedSuffix = "_decompressed.txt";

// container header, see HuffmanSerializer
const std::string ContainerMagic = "HUFP";
const uint8_t ContainerVersion = 1;

const bool DefaultVerbose = false;
const bool DefaultTrimTrailingWhitespace = false;
