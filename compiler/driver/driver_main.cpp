#include "../common/diagnostic.hpp"
#include "../disassembler/disassembler.hpp"
#include "../frontend/lexer.hpp"
#include "../frontend/parser.hpp"
#include "../pipeline/compilation_session.hpp"
#include "../pipeline/mir_listing.hpp"
#include "command_line.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifndef SCENEASM_BUILD_PROFILE
#define SCENEASM_BUILD_PROFILE "local"
#endif

namespace sceneasm
{
    void printHelp()
    {
        std::cout << "sceneasmc - scenario VM assembler and disassembler\n"
                  << "Usage: sceneasmc [options] <input>...\n\n"
                  << "Options:\n"
                  << "  --help                 Show this help text and exit.\n"
                  << "  --version              Show version information and exit.\n"
                  << "  --disassemble, -d      Turn a code block back into assembly.\n"
                  << "  --dump-tokens          Print the token stream of each input.\n"
                  << "  --dump-tree            Print the syntax tree of each input.\n"
                  << "  --dump-mir             Print the selected instructions of each unit with their hashes.\n"
                  << "  --base=<addr>          Address of the first byte. Default: 0.\n"
                  << "  --entry=<addr>         Entry address for --disassemble. Default: base.\n"
                  << "  --jobs=<n>             Worker threads for code generation. Default: all cores.\n"
                  << "  --verbose, -v          Print symbol addresses and cache statistics.\n"
                  << "  -o <path>              Write output to the specified path.\n";
    }

    void printVersion()
    {
        std::cout << "sceneasmc (build profile: " << SCENEASM_BUILD_PROFILE << ")\n";
    }

    std::optional<std::string> loadFile(const std::string& path)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return buffer.str();
    }

    bool writeFile(const std::string& path, const char* data, std::size_t size)
    {
        std::ofstream out(path, std::ios::binary);
        if (!out)
        {
            return false;
        }
        out.write(data, static_cast<std::streamsize>(size));
        return static_cast<bool>(out);
    }

    std::string defaultOutputPath(const std::string& inputPath, const char* extension)
    {
        std::filesystem::path output{inputPath};
        output.replace_extension(extension);
        return output.string();
    }

    void reportDiagnostics(const std::vector<common::Diagnostic>& diagnostics)
    {
        for (const auto& diagnostic : diagnostics)
        {
            std::cerr << common::format(diagnostic) << '\n';
        }
    }

    std::string hexAddress(std::uint32_t address)
    {
        std::ostringstream stream;
        stream << "0x" << std::hex << std::setw(8) << std::setfill('0') << address;
        return stream.str();
    }

    bool dumpTokens(const std::string& path, const std::string& content)
    {
        frontend::Lexer lexer{content};
        lexer.lex();

        const auto& tokens = lexer.tokens();
        std::cout << "[notice] Lexed " << tokens.size() << " tokens from '" << path << "'.\n";
        for (const auto& token : tokens)
        {
            std::cout << "    "
                      << toString(token.kind)
                      << " @ L" << token.span.begin.line << ":C" << token.span.begin.column;
            if (!token.text.empty() && token.kind != frontend::TokenKind::Newline)
            {
                std::cout << " -> '" << token.text << "'";
            }
            std::cout << '\n';
        }

        reportDiagnostics(lexer.diagnostics());
        return !common::hasErrors(lexer.diagnostics());
    }

    bool dumpTree(const std::string& path, const std::string& content)
    {
        const frontend::ParseResult parsed = frontend::parseSource(content);
        std::cout << "[notice] Syntax tree of '" << path << "':\n";
        if (parsed.root != nullptr)
        {
            frontend::dumpTree(*parsed.root, std::cout);
        }

        reportDiagnostics(parsed.diagnostics);
        return !common::hasErrors(parsed.diagnostics);
    }

    bool dumpMir(const std::string& path, const std::string& content)
    {
        const pipeline::MirListing listing = pipeline::lowerToMir(content);
        std::cout << "[notice] MIR of '" << path << "' lowered with " << listing.units.size() << " unit(s).\n";
        std::cout << pipeline::formatMirListing(listing);

        reportDiagnostics(listing.diagnostics);
        return listing.succeeded();
    }

    bool assembleFile(pipeline::CompilationSession& session, const std::string& path, const std::string& content,
                      const CommandLineOptions& options)
    {
        const pipeline::AssemblyResult result = session.assemble(content);
        reportDiagnostics(result.diagnostics);
        if (!result.succeeded())
        {
            std::cerr << "SASM-W1011 AssemblyHalted: no output written for '" << path << "'.\n";
            return false;
        }

        const std::string outputPath = options.outputPath.empty() ? defaultOutputPath(path, ".bin") : options.outputPath;
        if (!writeFile(outputPath, reinterpret_cast<const char*>(result.code.data()), result.code.size()))
        {
            std::cerr << "SASM-E1012 OutputWriteFailed: unable to write '" << outputPath << "'.\n";
            return false;
        }

        std::cout << "[notice] Assembled '" << path << "' into " << result.code.size() << " bytes at "
                  << hexAddress(result.baseAddress) << " (entry " << hexAddress(result.entryAddress) << ") -> "
                  << outputPath << '\n';

        if (options.verbose)
        {
            for (const auto& [name, address] : result.symbols)
            {
                std::cout << "[debug]   " << hexAddress(address) << ' ' << name << '\n';
            }
            const auto& statistics = session.statistics();
            std::cout << "[debug] Cache: parse " << statistics.parseHits << " hit(s) / " << statistics.parseMisses
                      << " miss(es), code " << statistics.codeHits << " hit(s) / " << statistics.codeMisses << " miss(es).\n";
        }
        return true;
    }

    bool disassembleFile(const std::string& path, const std::string& content, const CommandLineOptions& options)
    {
        const std::vector<std::uint8_t> code(content.begin(), content.end());
        disasm::DisassemblyOptions disassemblyOptions;
        disassemblyOptions.baseAddress = options.baseAddress;
        disassemblyOptions.entryAddress = options.entryAddress;

        const disasm::DisassemblyResult result = disasm::disassemble(code, disassemblyOptions);
        reportDiagnostics(result.diagnostics);

        if (options.outputPath.empty())
        {
            std::cout << result.text;
        }
        else
        {
            if (!writeFile(options.outputPath, result.text.data(), result.text.size()))
            {
                std::cerr << "SASM-E1012 OutputWriteFailed: unable to write '" << options.outputPath << "'.\n";
                return false;
            }
            std::cout << "[notice] Disassembled '" << path << "' -> " << options.outputPath << '\n';
        }

        if (options.verbose)
        {
            std::cout << "[debug] " << result.instructionCount << " instruction(s), " << result.rawByteCount
                      << " raw byte(s).\n";
        }
        return true;
    }

    int runDriver(const CommandLineOptions& options)
    {
        if (options.verbose)
        {
            std::cout << "[information] Starting sceneasmc.\n";
            std::cout << "  base: " << hexAddress(options.baseAddress) << "\n";
            if (!options.outputPath.empty())
            {
                std::cout << "  output: " << options.outputPath << "\n";
            }
            for (const auto& path : options.inputPaths)
            {
                std::cout << "  input: " << path << "\n";
            }
        }

        pipeline::AssemblyOptions assemblyOptions;
        assemblyOptions.baseAddress = options.baseAddress;
        assemblyOptions.jobs = options.jobs;
        pipeline::CompilationSession session{assemblyOptions};

        int exitCode = 0;
        for (const auto& path : options.inputPaths)
        {
            const auto content = loadFile(path);
            if (!content.has_value())
            {
                std::cerr << "SASM-E1010 InputReadFailed: unable to open '" << path << "'.\n";
                exitCode = 1;
                continue;
            }

            bool succeeded = false;
            switch (options.mode)
            {
            case DriverMode::Assemble:
                succeeded = assembleFile(session, path, *content, options);
                break;
            case DriverMode::Disassemble:
                succeeded = disassembleFile(path, *content, options);
                break;
            case DriverMode::DumpTokens:
                succeeded = dumpTokens(path, *content);
                break;
            case DriverMode::DumpTree:
                succeeded = dumpTree(path, *content);
                break;
            case DriverMode::DumpMir:
                succeeded = dumpMir(path, *content);
                break;
            }

            if (!succeeded)
            {
                exitCode = 1;
            }
        }

        return exitCode;
    }
} // namespace sceneasm

int main(int argc, char** argv)
{
    sceneasm::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        return 1;
    }

    if (options->showHelp)
    {
        sceneasm::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        sceneasm::printVersion();
        return 0;
    }

    return sceneasm::runDriver(options.value());
}
