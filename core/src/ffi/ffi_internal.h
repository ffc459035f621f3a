// ffi_internal.h — Internal shared declarations for FFI implementation

#ifndef IR_FFI_INTERNAL_H
#define IR_FFI_INTERNAL_H

#include "innerocket/innerocket_c.h"
#include <string>
#include <cstring>

#ifdef _WIN32
    #define ir_strdup _strdup
#else
    #define ir_strdup strdup
#endif

// Thread-local error state
extern thread_local IRError g_lastError;
extern thread_local std::string g_lastErrorMessage;

// Error handling functions (defined in innerocket_c.cpp)
// Note: default argument only in declaration, not in definition
void setLastError(IRError error, const std::string& message = "");
inline void clearLastError() { setLastError(IR_OK); }

// String allocation (defined in innerocket_c.cpp)
char* alloc_string(const std::string& str);

/// Validate a required C string argument, sets IR_ERROR_INVALID_ARGUMENT on failure
inline bool requireArg(const char* value, const char* name) {
    if (value && *value) return true;
    setLastError(IR_ERROR_INVALID_ARGUMENT, std::string(name) + " is null or empty");
    return false;
}

#endif // IR_FFI_INTERNAL_H
