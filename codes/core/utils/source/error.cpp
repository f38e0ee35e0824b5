#include "utils/error.hpp"

namespace http_mock_server {
namespace utils {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::NULL_POINTER: return "NULL_POINTER";
        case ErrorCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case ErrorCode::OPERATION_FAILED: return "OPERATION_FAILED";
        case ErrorCode::TIMEOUT: return "TIMEOUT";

        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";

        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_MISSING_REQUIRED: return "CONFIG_MISSING_REQUIRED";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_INVALID_PORT: return "CONFIG_INVALID_PORT";
        case ErrorCode::CONFIG_INVALID_THREAD_COUNT: return "CONFIG_INVALID_THREAD_COUNT";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "CONFIG_INVALID_LOG_LEVEL";

        case ErrorCode::NETWORK_SOCKET_ERROR: return "NETWORK_SOCKET_ERROR";
        case ErrorCode::NETWORK_BIND_ERROR: return "NETWORK_BIND_ERROR";
        case ErrorCode::NETWORK_LISTEN_ERROR: return "NETWORK_LISTEN_ERROR";
        case ErrorCode::NETWORK_ACCEPT_ERROR: return "NETWORK_ACCEPT_ERROR";
        case ErrorCode::NETWORK_READ_ERROR: return "NETWORK_READ_ERROR";
        case ErrorCode::NETWORK_WRITE_ERROR: return "NETWORK_WRITE_ERROR";
        case ErrorCode::NETWORK_CLOSED: return "NETWORK_CLOSED";

        case ErrorCode::PROTOCOL_INVALID_REQUEST: return "PROTOCOL_INVALID_REQUEST";
        case ErrorCode::PROTOCOL_INVALID_HEADER: return "PROTOCOL_INVALID_HEADER";
        case ErrorCode::PROTOCOL_BODY_TOO_LARGE: return "PROTOCOL_BODY_TOO_LARGE";
        case ErrorCode::PROTOCOL_UNSUPPORTED_ENCODING: return "PROTOCOL_UNSUPPORTED_ENCODING";
        case ErrorCode::PROTOCOL_UNSUPPORTED_VERSION: return "PROTOCOL_UNSUPPORTED_VERSION";

        case ErrorCode::SERVER_INVALID_STATE: return "SERVER_INVALID_STATE";
        case ErrorCode::SERVER_ALREADY_STOPPED: return "SERVER_ALREADY_STOPPED";

        case ErrorCode::MOCK_RULE_NOT_FOUND: return "MOCK_RULE_NOT_FOUND";
        case ErrorCode::MOCK_EXPECTATION_VIOLATED: return "MOCK_EXPECTATION_VIOLATED";
        case ErrorCode::MOCK_MATCH_EVALUATION_ERROR: return "MOCK_MATCH_EVALUATION_ERROR";

        default: return "UNKNOWN_ERROR_CODE";
    }
}

const char* error_code_to_description(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Operation completed successfully";
        case ErrorCode::UNKNOWN_ERROR: return "An unknown error occurred";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::NULL_POINTER: return "Null pointer";
        case ErrorCode::OUT_OF_RANGE: return "Out of range";
        case ErrorCode::OPERATION_FAILED: return "Operation failed";
        case ErrorCode::TIMEOUT: return "Operation timed out";

        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::FILE_READ_ERROR: return "File read error";

        case ErrorCode::CONFIG_PARSE_ERROR: return "Config parse error";
        case ErrorCode::CONFIG_MISSING_REQUIRED: return "Missing required config";
        case ErrorCode::CONFIG_INVALID_VALUE: return "Invalid config value";
        case ErrorCode::CONFIG_INVALID_PORT: return "Invalid port number";
        case ErrorCode::CONFIG_INVALID_THREAD_COUNT: return "Invalid thread count";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "Invalid log level";

        case ErrorCode::NETWORK_SOCKET_ERROR: return "Socket error";
        case ErrorCode::NETWORK_BIND_ERROR: return "Bind error";
        case ErrorCode::NETWORK_LISTEN_ERROR: return "Listen error";
        case ErrorCode::NETWORK_ACCEPT_ERROR: return "Accept error";
        case ErrorCode::NETWORK_READ_ERROR: return "Network read error";
        case ErrorCode::NETWORK_WRITE_ERROR: return "Network write error";
        case ErrorCode::NETWORK_CLOSED: return "Connection closed";

        case ErrorCode::PROTOCOL_INVALID_REQUEST: return "Malformed HTTP request";
        case ErrorCode::PROTOCOL_INVALID_HEADER: return "Malformed HTTP header";
        case ErrorCode::PROTOCOL_BODY_TOO_LARGE: return "Request body too large";
        case ErrorCode::PROTOCOL_UNSUPPORTED_ENCODING: return "Unsupported transfer encoding";
        case ErrorCode::PROTOCOL_UNSUPPORTED_VERSION: return "HTTP version not supported";

        case ErrorCode::SERVER_INVALID_STATE: return "Operation not allowed in current server state";
        case ErrorCode::SERVER_ALREADY_STOPPED: return "Server already stopped";

        case ErrorCode::MOCK_RULE_NOT_FOUND: return "Mock rule not mounted";
        case ErrorCode::MOCK_EXPECTATION_VIOLATED: return "Mock expectation violated";
        case ErrorCode::MOCK_MATCH_EVALUATION_ERROR: return "Matcher failed while evaluating request";

        default: return "Unknown error";
    }
}

} // namespace utils
} // namespace http_mock_server
