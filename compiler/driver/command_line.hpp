#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sceneasm
{
    enum class DriverMode
    {
        Assemble,
        Disassemble,
        DumpTokens,
        DumpTree,
        DumpMir
    };

    struct CommandLineOptions
    {
        DriverMode mode{DriverMode::Assemble};
        std::vector<std::string> inputPaths;
        std::string outputPath;
        std::uint32_t baseAddress{0};
        std::optional<std::uint32_t> entryAddress;
        std::size_t jobs{0};
        bool verbose{false};
        bool showHelp{false};
        bool showVersion{false};
    };

    // Accepts decimal, 0x hexadecimal and 0 octal spellings.
    inline std::optional<std::uint32_t> parseAddress(std::string_view text)
    {
        if (text.empty() || text.front() == '-')
        {
            return std::nullopt;
        }

        const std::string digits{text};
        char* end = nullptr;
        errno = 0;
        const unsigned long long value = std::strtoull(digits.c_str(), &end, 0);
        if (errno != 0 || end == nullptr || *end != '\0' || value > 0xffffffffull)
        {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(value);
    }

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help" || argument == "-h")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument == "--disassemble" || argument == "-d")
                {
                    options.mode = DriverMode::Disassemble;
                    continue;
                }

                if (argument == "--dump-tokens")
                {
                    options.mode = DriverMode::DumpTokens;
                    continue;
                }

                if (argument == "--dump-tree")
                {
                    options.mode = DriverMode::DumpTree;
                    continue;
                }

                if (argument == "--dump-mir")
                {
                    options.mode = DriverMode::DumpMir;
                    continue;
                }

                if (argument == "--verbose" || argument == "-v")
                {
                    options.verbose = true;
                    continue;
                }

                if (argument.rfind("--base=", 0) == 0)
                {
                    const auto value = parseAddress(argument.substr(7));
                    if (!value.has_value())
                    {
                        std::cerr << "SASM-E1003 InvalidAddress: '" << argument.substr(7) << "' is not a 32-bit address.\n";
                        return std::nullopt;
                    }
                    options.baseAddress = *value;
                    continue;
                }

                if (argument.rfind("--entry=", 0) == 0)
                {
                    const auto value = parseAddress(argument.substr(8));
                    if (!value.has_value())
                    {
                        std::cerr << "SASM-E1003 InvalidAddress: '" << argument.substr(8) << "' is not a 32-bit address.\n";
                        return std::nullopt;
                    }
                    options.entryAddress = *value;
                    continue;
                }

                if (argument.rfind("--jobs=", 0) == 0)
                {
                    const auto value = parseAddress(argument.substr(7));
                    if (!value.has_value() || *value > 256)
                    {
                        std::cerr << "SASM-E1004 InvalidJobs: '" << argument.substr(7) << "' is not a worker count (0..256).\n";
                        return std::nullopt;
                    }
                    options.jobs = *value;
                    continue;
                }

                if (argument.rfind("--output=", 0) == 0)
                {
                    options.outputPath = std::string{argument.substr(9)};
                    continue;
                }

                if (argument.rfind("-o", 0) == 0)
                {
                    if (argument.size() > 2)
                    {
                        options.outputPath = std::string{argument.substr(2)};
                    }
                    else if (index + 1 < argc)
                    {
                        options.outputPath = std::string{argv[++index]};
                    }
                    else
                    {
                        std::cerr << "SASM-E1000 MissingOutput: expected path after -o option.\n";
                        return std::nullopt;
                    }

                    continue;
                }

                if (!argument.empty() && argument[0] == '-')
                {
                    std::cerr << "SASM-E1001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                options.inputPaths.emplace_back(argument);
            }

            if (!options.showHelp && !options.showVersion && options.inputPaths.empty())
            {
                std::cerr << "SASM-E1002 MissingInput: an input file is required.\n";
                return std::nullopt;
            }

            if (options.inputPaths.size() > 1 && !options.outputPath.empty())
            {
                std::cerr << "SASM-E1005 AmbiguousOutput: -o needs a single input file.\n";
                return std::nullopt;
            }

            return options;
        }
    };
} // namespace sceneasm
