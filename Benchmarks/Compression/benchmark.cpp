#include "utilities.hpp"
#include "config.hpp"
#include "../../Src/HuffmanCoder/HuffmanCoder.hpp"
#include "../../Src/HuffmanSerializer/HuffmanSerializer.hpp"
#include <benchmark/benchmark.h>
#include <iostream>
#include <string>

using namespace huffpack;

static std::vector<uint8_t> inputFor(int kind, int size)
{
    switch (kind)
    {
        case 0: return benchmark::utilities::GenerateInput(InputSymbolsText, size);
        case 1: return benchmark::utilities::GenerateInput(InputSymbolsSkewed, size);
        default: return benchmark::utilities::GenerateRandomBytes(size);
    }
}

static void BM_Compress(benchmark::State& state)
{
    const std::vector<uint8_t> input = inputFor(state.range(0), state.range(1));
    size_t outputSize = 0;

    for (auto _ : state)
    {
        Result<coder::CompressedData> compressed = coder::compress(input, Verbose);
        if (!compressed.success())
        {
            state.SkipWithError(compressed.describeError().c_str());
            return;
        }
        outputSize = compressed.value->payload.size();
        benchmark::DoNotOptimize(outputSize);
    }

    benchmark::utilities::ReportCompression(state, input.size(), outputSize);
}

static void BM_Decompress(benchmark::State& state)
{
    const std::vector<uint8_t> input = inputFor(state.range(0), state.range(1));
    Result<coder::CompressedData> compressed = coder::compress(input, Verbose);
    if (!compressed.success())
    {
        std::cerr << "Error during compression: " << compressed.describeError() << std::endl;
        state.SkipWithError("compression failed");
        return;
    }
    const coder::CompressedData& data = compressed.value.value();

    for (auto _ : state)
    {
        Result<std::vector<uint8_t>> decompressed = coder::decompress(data.payload, data.codeTable, Verbose);
        if (!decompressed.success())
        {
            state.SkipWithError(decompressed.describeError().c_str());
            return;
        }
        benchmark::DoNotOptimize(decompressed.value->data());
    }

    benchmark::utilities::ReportCompression(state, input.size(), data.payload.size());
}

static void BM_ContainerRoundTrip(benchmark::State& state)
{
    const std::vector<uint8_t> input = inputFor(state.range(0), state.range(1));
    size_t outputSize = 0;

    for (auto _ : state)
    {
        Result<std::vector<uint8_t>> blob = serializer::serialize(input, Verbose);
        if (!blob.success())
        {
            state.SkipWithError(blob.describeError().c_str());
            return;
        }
        outputSize = blob.value->size();

        Result<std::vector<uint8_t>> decoded = serializer::deserialize(blob.value.value(), Verbose);
        if (!decoded.success() || decoded.value.value() != input)
        {
            state.SkipWithError("container round trip mismatch");
            return;
        }
    }

    benchmark::utilities::ReportCompression(state, input.size(), outputSize);
}

int main(int argc, char** argv)
{
    benchmark::Initialize(&argc, argv);

    const std::vector<std::string> inputKinds = {"Text", "Skewed", "RandomBytes"};
    for (int kind = 0; kind < static_cast<int>(inputKinds.size()); ++kind)
    {
        for (int size : InputSizes)
        {
            const std::string suffix = "/" + inputKinds[kind] + "/" + std::to_string(size);

            benchmark::RegisterBenchmark(
                ("BM_Compress" + suffix).c_str(),
                &BM_Compress
            )->Args({kind, size})->Iterations(IterationTimes);

            benchmark::RegisterBenchmark(
                ("BM_Decompress" + suffix).c_str(),
                &BM_Decompress
            )->Args({kind, size})->Iterations(IterationTimes);

            benchmark::RegisterBenchmark(
                ("BM_ContainerRoundTrip" + suffix).c_str(),
                &BM_ContainerRoundTrip
            )->Args({kind, size})->Iterations(IterationTimes);
        }
    }

    benchmark::RunSpecifiedBenchmarks();
    return 0;
}
