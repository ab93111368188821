#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "Result.hpp"

namespace huffpack::files
{
    Result<std::vector<uint8_t>> readFile(const std::string& path);

    Result<size_t> writeFile(
        const std::string& path,
        const std::vector<uint8_t>& data
    );

    // "dir/name.ext" + suffix -> "dir/name<suffix>"
    std::string deriveOutputPath(
        const std::string& inputPath,
        const std::string& suffix
    );

    // "dir/book_huffman.huffman" with "_huffman" -> "dir/book.huffman";
    // returns the path unchanged when the stem does not end in `suffix`.
    std::string stripStemSuffix(
        const std::string& path,
        const std::string& suffix
    );

    // Drops trailing ' ', '\t', '\n', '\v', '\f', '\r'. Lossy; only applied
    // when the user asks for it.
    std::vector<uint8_t> trimTrailingWhitespace(std::vector<uint8_t> data);
}
