// innerocket_c.cpp — реализация общих функций C API

#include "ffi_internal.h"
#include "innerocket/innerocket_c.h"
#include "innerocket/core.h"

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <string>

// ═══════════════════════════════════════════════════════════
// Thread-local error state for proper C API error handling
// ═══════════════════════════════════════════════════════════

// Shared across ffi_*.cpp files
thread_local IRError g_lastError = IR_OK;
thread_local std::string g_lastErrorMessage;

void setLastError(IRError error, const std::string& message) {
    g_lastError = error;
    g_lastErrorMessage = message;
    if (error != IR_OK) {
        spdlog::error("FFI error (code {}): {}", static_cast<int>(error), message);
    }
}

char* alloc_string(const std::string& str) {
    return ir_strdup(str.c_str());
}

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

const char* ir_version(void) {
    return Innerocket::VERSION;
}

const char* ir_error_message(IRError error) {
    switch (error) {
        case IR_OK: return "Success";
        case IR_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case IR_ERROR_IO: return "I/O error";
        case IR_ERROR_NOT_FOUND: return "Not found";
        case IR_ERROR_ALREADY_EXISTS: return "Already exists";
        case IR_ERROR_NETWORK: return "Network error";
        case IR_ERROR_CAPACITY: return "Capacity exceeded";
        case IR_ERROR_INTERNAL:
        default: return "Internal error";
    }
}

IRError ir_last_error(void) {
    return g_lastError;
}

const char* ir_last_error_message(void) {
    return g_lastErrorMessage.c_str();
}

void ir_clear_error(void) {
    g_lastError = IR_OK;
    g_lastErrorMessage.clear();
}

void ir_free_string(char* str) {
    std::free(str);
}

IRError ir_set_log_level(const char* level) {
    clearLastError();
    if (!requireArg(level, "level")) {
        return IR_ERROR_INVALID_ARGUMENT;
    }

    // from_str maps unknown names to off; only accept the names it round-trips
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && std::string(level) != "off") {
        setLastError(IR_ERROR_INVALID_ARGUMENT, std::string("Unknown log level: ") + level);
        return IR_ERROR_INVALID_ARGUMENT;
    }
    spdlog::set_level(parsed);
    return IR_OK;
}
