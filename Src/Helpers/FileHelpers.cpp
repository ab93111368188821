#include "FileHelpers.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

Result<std::vector<uint8_t>> huffpack::files::readFile(const std::string& path)
{
    Result<std::vector<uint8_t>> result;

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good())
    {
        return makeError<std::vector<uint8_t>>(ErrorKind::IO_FAILURE, "failed to read: " + path);
    }

    std::vector<uint8_t> data(
        (std::istreambuf_iterator<char>(ifs)),
        std::istreambuf_iterator<char>()
    );
    if (ifs.bad())
    {
        return makeError<std::vector<uint8_t>>(ErrorKind::IO_FAILURE, "error while reading: " + path);
    }

    return makeResult<std::vector<uint8_t>>(std::move(data), &result);
}

Result<size_t> huffpack::files::writeFile(
    const std::string& path,
    const std::vector<uint8_t>& data
) {
    Result<size_t> result;

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file)
    {
        return makeError<size_t>(ErrorKind::IO_FAILURE, "failed to open for writing: " + path);
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file)
    {
        return makeError<size_t>(ErrorKind::IO_FAILURE, "failed to write: " + path);
    }

    return makeResult<size_t>(data.size(), &result);
}

std::string huffpack::files::deriveOutputPath(
    const std::string& inputPath,
    const std::string& suffix
) {
    std::filesystem::path path(inputPath);
    path.replace_filename(path.stem().string() + suffix);
    return path.string();
}

std::string huffpack::files::stripStemSuffix(
    const std::string& path,
    const std::string& suffix
) {
    std::filesystem::path result(path);
    const std::string stem = result.stem().string();
    if (suffix.empty() || stem.size() <= suffix.size()
        || stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) != 0)
    {
        return path;
    }
    result.replace_filename(stem.substr(0, stem.size() - suffix.size()) + result.extension().string());
    return result.string();
}

std::vector<uint8_t> huffpack::files::trimTrailingWhitespace(std::vector<uint8_t> data)
{
    auto isWhitespace = [](uint8_t c)
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
    };

    while (!data.empty() && isWhitespace(data.back()))
    {
        data.pop_back();
    }
    return data;
}
