#include "evmasm_capi.h"
#include "evmasm_parser.h" // Include the C++ parser class
#include <vector>
#include <string>
#include <new>
#include <stdexcept>

// --- Error Handling ---
// Per thread, parses on different threads do not see each other's errors.
static thread_local std::string lastErrorMessage;
static thread_local bool hasErrorDetail = false;
static thread_local EvmasmErrorDetail lastErrorDetail = {};

static void setLastError(const std::string& message) {
    lastErrorMessage = message;
}

static void clearLastError() {
    lastErrorMessage.clear();
    hasErrorDetail = false;
    lastErrorDetail = EvmasmErrorDetail{};
}

static EvmasmResult resultFor(ParseError::Kind kind) {
    switch (kind) {
        case ParseError::Kind::Lexer: return EVMASM_ERROR_LEXER;
        case ParseError::Kind::ImmediateTooLarge: return EVMASM_ERROR_IMMEDIATE_TOO_LARGE;
        case ParseError::Kind::ExtraArgument: return EVMASM_ERROR_EXTRA_ARGUMENT;
        case ParseError::Kind::MissingArgument: return EVMASM_ERROR_MISSING_ARGUMENT;
        case ParseError::Kind::ArgumentType: return EVMASM_ERROR_ARGUMENT_TYPE;
    }
    return EVMASM_ERROR_GENERAL;
}

static EvmasmNodeKind kindOf(const Node& node) {
    if (const AbstractOp* aop = std::get_if<AbstractOp>(&node)) {
        if (std::holds_alternative<Op>(*aop)) return EVMASM_NODE_INSTRUCTION;
        if (std::holds_alternative<LabelDef>(*aop)) return EVMASM_NODE_LABEL;
        return EVMASM_NODE_PUSH_LABEL;
    }
    if (std::holds_alternative<Import>(node)) return EVMASM_NODE_IMPORT;
    if (std::holds_alternative<Include>(node)) return EVMASM_NODE_INCLUDE;
    return EVMASM_NODE_INCLUDE_HEX;
}
// --- End Error Handling ---


// Define the opaque struct locally
struct ProgramOpaque {
    std::vector<Node> nodes;
    std::vector<std::string> listing; // formatNode() of each node, owned for evmasm_node_text

    explicit ProgramOpaque(std::vector<Node> parsed) : nodes(std::move(parsed)) {
        listing.reserve(nodes.size());
        for (const Node& node : nodes) {
            listing.push_back(formatNode(node));
        }
    }
};

// --- C API Implementation ---

extern "C" {

EvmasmResult evmasm_parse(const char* source, int debugMode, ProgramOpaque** outProgram) {
    clearLastError();
    if (outProgram == nullptr) {
        setLastError("Output program pointer cannot be null.");
        return EVMASM_ERROR_INVALID_ARGUMENT;
    }
    *outProgram = nullptr;
    if (source == nullptr) {
        setLastError("Source text cannot be null.");
        return EVMASM_ERROR_INVALID_ARGUMENT;
    }

    try {
        AsmParser parser;
        parser.setDebugMode(debugMode != 0);
        *outProgram = new ProgramOpaque(parser.parse(source));
        return EVMASM_OK;
    } catch (const ParseError& e) {
        setLastError(e.what());
        hasErrorDetail = true;
        lastErrorDetail.line = e.location().line;
        lastErrorDetail.column = e.location().column;
        lastErrorDetail.expected = e.expected();
        lastErrorDetail.got = e.got();
        lastErrorDetail.position = e.position();
        return resultFor(e.kind());
    } catch (const std::bad_alloc&) {
        setLastError("Failed to allocate memory for the parsed program.");
        return EVMASM_ERROR_GENERAL;
    } catch (const std::exception& e) {
        setLastError("Failed to parse: " + std::string(e.what()));
        return EVMASM_ERROR_GENERAL;
    }
}

void evmasm_destroy_program(ProgramOpaque* handle) {
    clearLastError();
    delete handle;
}

EvmasmResult evmasm_node_count(ProgramOpaque* handle, size_t* outCount) {
    clearLastError();
    if (handle == nullptr) {
        setLastError("Invalid program handle.");
        return EVMASM_ERROR_INVALID_HANDLE;
    }
    if (outCount == nullptr) {
        setLastError("Output count pointer cannot be null.");
        return EVMASM_ERROR_INVALID_ARGUMENT;
    }
    *outCount = handle->nodes.size();
    return EVMASM_OK;
}

EvmasmResult evmasm_node_kind(ProgramOpaque* handle, size_t index, EvmasmNodeKind* outKind) {
    clearLastError();
    if (handle == nullptr) {
        setLastError("Invalid program handle.");
        return EVMASM_ERROR_INVALID_HANDLE;
    }
    if (outKind == nullptr) {
        setLastError("Output kind pointer cannot be null.");
        return EVMASM_ERROR_INVALID_ARGUMENT;
    }
    if (index >= handle->nodes.size()) {
        setLastError("Node index out of bounds.");
        return EVMASM_ERROR_INVALID_ARGUMENT;
    }
    *outKind = kindOf(handle->nodes[index]);
    return EVMASM_OK;
}

EvmasmResult evmasm_node_text(ProgramOpaque* handle, size_t index, const char** outText) {
    clearLastError();
    if (handle == nullptr) {
        setLastError("Invalid program handle.");
        return EVMASM_ERROR_INVALID_HANDLE;
    }
    if (outText == nullptr) {
        setLastError("Output text pointer cannot be null.");
        return EVMASM_ERROR_INVALID_ARGUMENT;
    }
    if (index >= handle->listing.size()) {
        setLastError("Node index out of bounds.");
        return EVMASM_ERROR_INVALID_ARGUMENT;
    }
    *outText = handle->listing[index].c_str();
    return EVMASM_OK;
}

// Does not clear the recorded error, that is what it reads
EvmasmResult evmasm_get_error_detail(EvmasmErrorDetail* outDetail) {
    if (outDetail == nullptr || !hasErrorDetail) {
        return EVMASM_ERROR_INVALID_ARGUMENT;
    }
    *outDetail = lastErrorDetail;
    return EVMASM_OK;
}

const char* evmasm_get_last_error() {
    return lastErrorMessage.empty() ? nullptr : lastErrorMessage.c_str();
}

} // extern "C"
