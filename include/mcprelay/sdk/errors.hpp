#pragma once

#include <string>

namespace mcprelay {
namespace sdk {

/**
 * @brief Error codes shared by the relay and the bridge
 */
enum class ErrorCode {
    SUCCESS = 0,
    INVALID_PARAMETER,
    UNAUTHENTICATED,
    UNAUTHORIZED,
    NOT_CONNECTED,
    REQUEST_TIMEOUT,
    DOWNSTREAM_FAILED,
    SESSION_INIT_FAILED,
    NETWORK_ERROR,
    MALFORMED_MESSAGE,
    CONFIG_ERROR,
    FILE_IO_ERROR,
    HASH_FAILED,
    INVALID_STATE,
    INTERNAL_ERROR
};

/**
 * @brief Convert error code to string
 */
inline std::string ErrorCodeToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::INVALID_PARAMETER: return "Invalid parameter";
        case ErrorCode::UNAUTHENTICATED: return "Missing or invalid Authorization header";
        case ErrorCode::UNAUTHORIZED: return "Invalid key";
        case ErrorCode::NOT_CONNECTED: return "Bridge not online";
        case ErrorCode::REQUEST_TIMEOUT: return "Request timeout";
        case ErrorCode::DOWNSTREAM_FAILED: return "Downstream request failed";
        case ErrorCode::SESSION_INIT_FAILED: return "Session initialization failed";
        case ErrorCode::NETWORK_ERROR: return "Network error";
        case ErrorCode::MALFORMED_MESSAGE: return "Malformed message";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::FILE_IO_ERROR: return "File I/O error";
        case ErrorCode::HASH_FAILED: return "Hash computation failed";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

} // namespace sdk
} // namespace mcprelay
