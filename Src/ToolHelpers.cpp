#include "ToolHelpers.hpp"
#include "Helpers/FileHelpers.hpp"
#include "HuffmanSerializer/HuffmanSerializer.hpp"
#include <string>

std::string usage(const std::string &program)
{
    return "Usage: " + program + " <compress|decompress> --input <path>"
           " [--output <path>] [--trim] [--verbose]";
}

Result<ToolOptions> parseArguments(int argc, char **argv)
{
    Result<ToolOptions> result;
    ToolOptions options;

    if (argc < 2)
    {
        return makeError<ToolOptions>(ErrorKind::INVALID_ARGUMENT, "No command given");
    }

    options.command = argv[1];
    if (options.command != "compress" && options.command != "decompress")
    {
        return makeError<ToolOptions>(
            ErrorKind::INVALID_ARGUMENT,
            "Unknown command '" + options.command + "'"
        );
    }

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--input" || arg == "-i" || arg == "--output" || arg == "-o")
        {
            if (i + 1 >= argc)
            {
                return makeError<ToolOptions>(ErrorKind::INVALID_ARGUMENT, "Missing value for " + arg);
            }
            std::string &target = (arg == "--input" || arg == "-i")
                ? options.inputPath
                : options.outputPath;
            target = argv[++i];
        }
        else if (arg == "--trim")
        {
            options.trimTrailingWhitespace = true;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            options.verbose = true;
        }
        else
        {
            return makeError<ToolOptions>(ErrorKind::INVALID_ARGUMENT, "Unknown option '" + arg + "'");
        }
    }

    if (options.inputPath.empty())
    {
        return makeError<ToolOptions>(ErrorKind::INVALID_ARGUMENT, "--input is required");
    }

    if (options.outputPath.empty())
    {
        if (options.command == "compress")
        {
            options.outputPath = huffpack::files::deriveOutputPath(options.inputPath, CompressedSuffix);
        }
        else
        {
            options.outputPath = huffpack::files::deriveOutputPath(
                huffpack::files::stripStemSuffix(options.inputPath, CompressedStemMarker),
                DecompressedSuffix
            );
        }
    }

    return makeResult<ToolOptions>(options, &result);
}

Result<std::string> runCompress(const ToolOptions &options)
{
    Result<std::string> result;

    Result<std::vector<uint8_t>> input = huffpack::files::readFile(options.inputPath);
    if (!input.success())
    {
        return forwardError<std::string>(input);
    }

    std::vector<uint8_t> text = input.getValue();
    if (options.trimTrailingWhitespace)
    {
        text = huffpack::files::trimTrailingWhitespace(std::move(text));
    }

    Result<std::vector<uint8_t>> container = huffpack::serializer::serialize(text, options.verbose);
    if (!container.success())
    {
        return forwardError<std::string>(container);
    }

    const std::vector<uint8_t> &blob = container.value.value();
    Result<size_t> written = huffpack::files::writeFile(options.outputPath, blob);
    if (!written.success())
    {
        return forwardError<std::string>(written);
    }

    if (options.verbose)
    {
        std::cout << "Input size: " << text.size() << " bytes -> compressed size: "
                  << blob.size() << " bytes";
        if (!blob.empty())
        {
            std::cout << " (ratio " << static_cast<double>(text.size()) / blob.size() << ")";
        }
        std::cout << std::endl;
    }

    result.warnings = container.warnings;
    return makeResult<std::string>(options.outputPath, &result);
}

Result<std::string> runDecompress(const ToolOptions &options)
{
    Result<std::string> result;

    Result<std::vector<uint8_t>> input = huffpack::files::readFile(options.inputPath);
    if (!input.success())
    {
        return forwardError<std::string>(input);
    }

    Result<std::vector<uint8_t>> decoded = huffpack::serializer::deserialize(
        input.value.value(),
        options.verbose
    );
    if (!decoded.success())
    {
        return forwardError<std::string>(decoded);
    }

    Result<size_t> written = huffpack::files::writeFile(options.outputPath, decoded.value.value());
    if (!written.success())
    {
        return forwardError<std::string>(written);
    }

    result.warnings = decoded.warnings;
    return makeResult<std::string>(options.outputPath, &result);
}

Result<std::string> runCommand(const ToolOptions &options)
{
    if (options.command == "compress")
    {
        return runCompress(options);
    }
    if (options.command == "decompress")
    {
        return runDecompress(options);
    }
    return makeError<std::string>(
        ErrorKind::INVALID_ARGUMENT,
        "Unknown command '" + options.command + "'"
    );
}
