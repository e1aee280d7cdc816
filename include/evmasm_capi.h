#ifndef EVMASM_CAPI_H
#define EVMASM_CAPI_H

#include "common_defs.h" // For EVMASM_API
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Opaque handle to a parsed program
typedef struct ProgramOpaque* EvmasmProgramHandle;

// Result codes; one per parse error kind
typedef enum {
    EVMASM_OK = 0,
    EVMASM_ERROR_GENERAL = -1,
    EVMASM_ERROR_INVALID_HANDLE = -2,
    EVMASM_ERROR_INVALID_ARGUMENT = -3,
    EVMASM_ERROR_LEXER = -4,
    EVMASM_ERROR_IMMEDIATE_TOO_LARGE = -5,
    EVMASM_ERROR_EXTRA_ARGUMENT = -6,
    EVMASM_ERROR_MISSING_ARGUMENT = -7,
    EVMASM_ERROR_ARGUMENT_TYPE = -8
} EvmasmResult;

typedef enum {
    EVMASM_NODE_INSTRUCTION = 0, // concrete instruction, possibly with a label operand
    EVMASM_NODE_LABEL = 1,
    EVMASM_NODE_PUSH_LABEL = 2,  // %push(label)
    EVMASM_NODE_IMPORT = 3,
    EVMASM_NODE_INCLUDE = 4,
    EVMASM_NODE_INCLUDE_HEX = 5
} EvmasmNodeKind;

// Structured context of the last parse error on this thread
typedef struct {
    size_t line;     // 0 when unknown
    size_t column;
    size_t expected; // arity or immediate width
    size_t got;      // supplied argument count
    size_t position; // 0-based argument index for EVMASM_ERROR_ARGUMENT_TYPE
} EvmasmErrorDetail;

/**
 * @brief Parses assembly source text.
 * @param source NUL-terminated source text.
 * @param debugMode 1 to trace every parsed node on stdout, 0 otherwise.
 * @param outProgram Receives the program handle on success, NULL otherwise.
 * @return EVMASM_OK on success, or the code of the first error.
 */
EVMASM_API EvmasmResult evmasm_parse(const char* source, int debugMode, EvmasmProgramHandle* outProgram);

/**
 * @brief Frees a program returned by evmasm_parse. NULL is ignored.
 */
EVMASM_API void evmasm_destroy_program(EvmasmProgramHandle handle);

EVMASM_API EvmasmResult evmasm_node_count(EvmasmProgramHandle handle, size_t* outCount);

EVMASM_API EvmasmResult evmasm_node_kind(EvmasmProgramHandle handle, size_t index, EvmasmNodeKind* outKind);

/**
 * @brief Listing text of one node (e.g. "push2 0x002a").
 * The string stays valid until the program is destroyed.
 */
EVMASM_API EvmasmResult evmasm_node_text(EvmasmProgramHandle handle, size_t index, const char** outText);

/**
 * @brief Copies the structured context of the last parse error.
 * @return EVMASM_ERROR_INVALID_ARGUMENT if no parse error was recorded.
 */
EVMASM_API EvmasmResult evmasm_get_error_detail(EvmasmErrorDetail* outDetail);

/**
 * @brief Message of the last failed call on this thread, or NULL.
 */
EVMASM_API const char* evmasm_get_last_error();

#ifdef __cplusplus
} // extern "C"
#endif

#endif // EVMASM_CAPI_H
