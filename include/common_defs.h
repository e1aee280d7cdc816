#ifndef COMMON_DEFS_H
#define COMMON_DEFS_H

#include <cstdint> // Required for uint types
#include <cstddef>

// --- API Export/Import Macros ---
#ifdef _WIN32
    #ifdef EVMASM_DLL_EXPORT
        #define EVMASM_API __declspec(dllexport) // Export for DLL
    #else
        #define EVMASM_API __declspec(dllimport) // Import for client
    #endif
#else
    #define EVMASM_API __attribute__((visibility("default"))) // GCC/Clang
#endif
// --- End API Macros ---

#define EVMASM_VERSION "0.3.0"

// Widest immediate a push instruction can carry (push32)
#define EVMASM_MAX_PUSH_WIDTH 32
// Binary/octal/decimal literals are parsed into a 128-bit integer
#define EVMASM_NUMERIC_LITERAL_BYTES 16
// Keccak-256 digest size
#define EVMASM_HASH_SIZE 32

#endif // COMMON_DEFS_H
