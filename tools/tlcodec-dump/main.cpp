//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `tlcodec-dump` command-line decoder.
///
/// The tool decodes one registered object from a file (or stdin) against the
/// core MTProto schema and prints it as JSON.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Codec/Decoder.h"
#include "tlcodec/Codec/JsonDump.h"
#include "tlcodec/Schema/Core.h"
#include "tlcodec/Support/DecoderConfig.h"
#include "tlcodec/Support/Errors.h"
#include "tlcodec/Support/Trace.h"
#include "tlcodec/Version.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace
{

constexpr int ExitSuccess     = 0;
constexpr int ExitUsage       = 1;
constexpr int ExitDecodeError = 2;
constexpr int ExitIoError     = 3;

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: tlcodec-dump [--hex] [--config <file>] [--trace off|basic|verbose] [--max-depth N] "
                    "<file|->\n"
                 << "Try: tlcodec-dump --help\n";
}

/// @brief Prints the full help text.
void printHelp()
{
    llvm::errs() << "NAME\n"
                 << "  tlcodec-dump - decode one Type Language object and print it as JSON\n\n"
                 << "SYNOPSIS\n"
                 << "  tlcodec-dump [options] <file|->\n\n"
                 << "OPTIONS\n"
                 << "  --hex\n"
                 << "      Input is hex text; whitespace is ignored.\n"
                 << "  --config <file>\n"
                 << "      JSON decoder settings: {\"maxDepth\": N, \"captureUnknownRemainder\": bool,\n"
                 << "      \"trace\": \"off|basic|verbose\"}. Command-line options win.\n"
                 << "  --trace <off|basic|verbose>\n"
                 << "      Print decoder trace events to stderr.\n"
                 << "  --max-depth <N>\n"
                 << "      Object nesting limit (0 disables the limit, default 64).\n"
                 << "  --version, -V\n"
                 << "      Print the version.\n\n"
                 << "EXIT STATUS\n"
                 << "  0 on success, 1 on invalid usage, 2 on decode failure, 3 on I/O failure.\n";
}

/// @brief Converts hex text to bytes.
///
/// @param[in] text Hex digits, optionally separated by whitespace.
/// @param[out] bytes Decoded bytes.
/// @return `false` on a non-hex character or an odd digit count.
bool parseHex(llvm::StringRef text, std::vector<std::uint8_t>& bytes)
{
    bytes.clear();
    int pending = -1;
    for (const char c : text)
    {
        if (llvm::isSpace(c))
        {
            continue;
        }
        if (!llvm::isHexDigit(c))
        {
            return false;
        }
        const int digit = static_cast<int>(llvm::hexDigitValue(c));
        if (pending < 0)
        {
            pending = digit;
        }
        else
        {
            bytes.push_back(static_cast<std::uint8_t>((pending << 4) | digit));
            pending = -1;
        }
    }
    return pending < 0;
}

/// @brief Prints a failed decode, with the raw remainder for unknown types.
void printDecodeError(llvm::Error err)
{
    llvm::handleAllErrors(
        std::move(err),
        [](const tlcodec::UnknownTypeError& unknown) {
            llvm::errs() << "[tlcodec-dump] error: " << unknown.message() << "\n"
                         << "[tlcodec-dump] unknown type code: " << tlcodec::formatTypeCode(unknown.code()) << "\n"
                         << "[tlcodec-dump] remainder (" << unknown.remainder().size()
                         << " bytes): " << llvm::toHex(unknown.remainder(), /*LowerCase=*/true) << "\n";
        },
        [](const llvm::ErrorInfoBase& other) { llvm::errs() << "[tlcodec-dump] error: " << other.message() << "\n"; });
}

}  // namespace

/// @brief Program entry point for `tlcodec-dump`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Exit status as listed by `--help`.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    bool                         hexInput = false;
    std::string                  configPath;
    std::string                  inputPath;
    std::optional<std::string>   traceOverride;
    std::optional<std::uint32_t> maxDepthOverride;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--version" || arg == "-V")
        {
            llvm::outs() << "tlcodec-dump " << tlcodec::kVersionString << "\n";
            return ExitSuccess;
        }
        if (arg == "--help" || arg == "-h")
        {
            printHelp();
            return ExitSuccess;
        }

        const bool takesValue = arg == "--config" || arg == "--trace" || arg == "--max-depth";
        if (takesValue && i + 1 >= argc)
        {
            llvm::errs() << "Missing value for " << arg << "\n";
            printUsage();
            return ExitUsage;
        }

        if (arg == "--hex")
        {
            hexInput = true;
        }
        else if (arg == "--config")
        {
            configPath = argv[++i];
        }
        else if (arg == "--trace")
        {
            traceOverride = std::string(argv[++i]);
        }
        else if (arg == "--max-depth")
        {
            const llvm::StringRef value(argv[++i]);
            std::uint64_t         parsed{};
            if (value.getAsInteger(10, parsed) || parsed > std::numeric_limits<std::uint32_t>::max())
            {
                llvm::errs() << "Invalid --max-depth value: " << value << "\n";
                printUsage();
                return ExitUsage;
            }
            maxDepthOverride = static_cast<std::uint32_t>(parsed);
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            llvm::errs() << "Unknown option: " << arg << "\n";
            printUsage();
            return ExitUsage;
        }
        else if (inputPath.empty())
        {
            inputPath = arg;
        }
        else
        {
            llvm::errs() << "Unexpected argument: " << arg << "\n";
            printUsage();
            return ExitUsage;
        }
    }

    if (inputPath.empty())
    {
        printUsage();
        return ExitUsage;
    }

    tlcodec::DecoderOptions options;
    if (!configPath.empty())
    {
        if (auto err = tlcodec::loadDecoderSettingsFile(configPath, options))
        {
            llvm::errs() << "[tlcodec-dump] " << llvm::toString(std::move(err)) << "\n";
            return ExitIoError;
        }
    }
    if (traceOverride && !tlcodec::parseTraceLevel(*traceOverride, options.traceLevel))
    {
        llvm::errs() << "Invalid --trace value: " << *traceOverride << "\n";
        printUsage();
        return ExitUsage;
    }
    if (maxDepthOverride)
    {
        options.maxDepth = *maxDepthOverride;
    }
    if (options.traceLevel != tlcodec::TraceLevel::Off)
    {
        options.traceSink = [](const tlcodec::DecodeTraceEvent& event) {
            llvm::errs() << "[tlcodec-dump][trace] " << tlcodec::formatTraceEvent(event) << "\n";
        };
    }

    auto bufferOrErr = llvm::MemoryBuffer::getFileOrSTDIN(inputPath);
    if (!bufferOrErr)
    {
        llvm::errs() << "[tlcodec-dump] cannot read '" << inputPath << "': " << bufferOrErr.getError().message()
                     << "\n";
        return ExitIoError;
    }

    const llvm::StringRef     contents = (*bufferOrErr)->getBuffer();
    std::vector<std::uint8_t> payload;
    if (hexInput)
    {
        if (!parseHex(contents, payload))
        {
            llvm::errs() << "[tlcodec-dump] '" << inputPath << "' is not valid hex text\n";
            return ExitIoError;
        }
    }
    else
    {
        payload.assign(contents.bytes_begin(), contents.bytes_end());
    }

    auto registryOrErr = tlcodec::schema::buildCoreRegistry();
    if (!registryOrErr)
    {
        printDecodeError(registryOrErr.takeError());
        return ExitDecodeError;
    }

    auto objectOrErr = tlcodec::decodeRegistered(payload, *registryOrErr, options);
    if (!objectOrErr)
    {
        printDecodeError(objectOrErr.takeError());
        return ExitDecodeError;
    }

    llvm::outs() << llvm::formatv("{0:2}", tlcodec::toJson(**objectOrErr)) << "\n";
    return ExitSuccess;
}
