#include <iostream>
#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <optional>

#include "common_defs.h"
#include "evmasm_parser.h"
#include "evmasm_opcodes.h"
#include "keccak.h"

#define CLR_RESET   "\033[0m"
#define CLR_ERROR   "\033[1;31m"
#define CLR_OPCODE  "\033[1;36m"
#define CLR_OFFSET  "\033[1;33m"
#define CLR_OPERAND "\033[1;32m"
#define CLR_HEX     "\033[1;35m"
#define CLR_COMMENT "\033[1;90m"

static bool useColor = true;

static const char* color(const char* code) {
    return useColor ? code : "";
}

static void drawAsciiBox(const std::string& title, const std::vector<std::string>& content) {
    size_t maxWidth = title.size();
    for (const auto& line : content) {
        if (line.size() > maxWidth) {
            maxWidth = line.size();
        }
    }

    const std::string hBar = "═";
    std::string horizontalLine;
    for (size_t i = 0; i < maxWidth + 2; ++i) {
        horizontalLine += hBar;
    }

    std::cout << color(CLR_HEX) << "╔" << horizontalLine << "╗" << color(CLR_RESET) << "\n";
    std::cout << color(CLR_HEX) << "║ " << color(CLR_OPCODE) << title << std::string(maxWidth - title.size(), ' ')
              << color(CLR_HEX) << " ║" << color(CLR_RESET) << "\n";
    std::cout << color(CLR_HEX) << "╠" << horizontalLine << "╣" << color(CLR_RESET) << "\n";
    for (const auto& line : content) {
        std::cout << color(CLR_HEX) << "║ " << color(CLR_OPERAND) << line << std::string(maxWidth - line.size(), ' ')
                  << color(CLR_HEX) << " ║" << color(CLR_RESET) << "\n";
    }
    std::cout << color(CLR_HEX) << "╚" << horizontalLine << "╝" << color(CLR_RESET) << "\n";
}

static void printUsage() {
    drawAsciiBox("evmasm " EVMASM_VERSION " Usage", {
        "Usage: evmasm [options] [mode] <argument>",
        "Modes:",
        "  -p <file>        Parse a source file and list its nodes (default).",
        "  -s <signature>   Print the selector of a function signature.",
        "  -t               Print the opcode table.",
        "Options:",
        "  -d, --debug      Trace every parsed node.",
        "  --no-color       Disable ANSI colors.",
        "Examples:",
        "  evmasm contract.etk",
        "  evmasm -s \"transfer(address,uint256)\""
    });
}

static std::string toHex(const uint8_t* bytes, size_t count) {
    std::ostringstream ss;
    for (size_t i = 0; i < count; ++i) {
        ss << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

static std::string readSourceFile(const std::string& sourceFile) {
    std::ifstream fileStream(sourceFile);
    if (!fileStream) {
        throw std::runtime_error("Could not open source file: " + sourceFile);
    }
    std::ostringstream buffer;
    buffer << fileStream.rdbuf();
    return buffer.str();
}

static int listProgram(const std::string& sourceFile, bool enableDebug) {
    try {
        std::string source = readSourceFile(sourceFile);

        AsmParser parser;
        parser.setDebugMode(enableDebug);
        std::vector<Node> program = parser.parse(source);

        // Offsets stop being known at the first node whose size is decided downstream
        std::optional<unsigned> offset = 0u;
        for (const Node& node : program) {
            std::ostringstream where;
            if (offset) {
                where << std::setw(4) << std::setfill('0') << std::hex << *offset;
            } else {
                where << "????";
            }
            std::cout << color(CLR_OFFSET) << where.str() << "  " << color(CLR_OPCODE) << formatNode(node)
                      << color(CLR_RESET) << "\n";

            const AbstractOp* aop = std::get_if<AbstractOp>(&node);
            std::optional<unsigned> size = aop ? abstractOpSize(*aop) : std::nullopt;
            if (offset && size) {
                *offset += *size;
            } else {
                offset.reset();
            }
        }

        std::vector<std::string> summary = {
            "Source: " + sourceFile,
            "Nodes:  " + std::to_string(program.size())
        };
        if (offset) summary.push_back("Size:   " + std::to_string(*offset) + " bytes");
        else summary.push_back("Size:   resolved by the assembler");
        drawAsciiBox("Parse successful", summary);
        return 0;
    } catch (const ParseError& e) {
        std::cerr << color(CLR_ERROR) << "Parse Error (" << errorKindName(e.kind()) << "): " << color(CLR_RESET)
                  << sourceFile << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << color(CLR_ERROR) << "Error: " << color(CLR_RESET) << e.what() << std::endl;
        return 1;
    }
}

static int printSelector(const std::string& signature) {
    Hash256 hash = keccak256(signature);
    std::cout << color(CLR_OPCODE) << "selector " << color(CLR_HEX) << "0x" << toHex(hash.data(), 4)
              << color(CLR_RESET) << "\n";
    std::cout << color(CLR_COMMENT) << "keccak256 0x" << toHex(hash.data(), hash.size()) << color(CLR_RESET) << "\n";
    return 0;
}

static int printOpcodeTable() {
    for (const auto& info : opcodeTable()) {
        uint8_t byte = static_cast<uint8_t>(info.spec.opcode);
        std::cout << color(CLR_HEX) << "0x" << toHex(&byte, 1) << "  " << color(CLR_OPCODE)
                  << std::left << std::setw(16) << info.mnemonic << std::right << color(CLR_COMMENT)
                  << info.spec.size() << (info.spec.size() == 1 ? " byte" : " bytes") << color(CLR_RESET) << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    // --- Flag Handling ---
    bool enableDebug = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-d" || arg == "--debug") {
            enableDebug = true;
        } else if (arg == "--no-color") {
            useColor = false;
        } else {
            args.push_back(arg);
        }
    }
    // --- End Flag Handling ---

    if (args.empty()) {
        std::cerr << color(CLR_ERROR) << "Error: No mode or file specified." << color(CLR_RESET) << "\n";
        printUsage();
        return 1;
    }

    const std::string& mode = args[0];
    if (mode == "-t") {
        return printOpcodeTable();
    }
    if (mode == "-s" || mode == "-p") {
        if (args.size() < 2) {
            std::cerr << color(CLR_ERROR) << "Error: " << mode << " needs an argument." << color(CLR_RESET) << "\n";
            printUsage();
            return 1;
        }
        return mode == "-s" ? printSelector(args[1]) : listProgram(args[1], enableDebug);
    }
    if (!mode.empty() && mode[0] == '-') {
        std::cerr << color(CLR_ERROR) << "Unknown mode: " << mode << color(CLR_RESET) << "\n";
        printUsage();
        return 1;
    }
    return listProgram(mode, enableDebug);
}
