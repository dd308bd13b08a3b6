#pragma once
#include <cstdint>

// =====================
// Error codes
// - 라이브러리는 예외를 던지지 않고 코드로 보고한다
// - tick 단위 에러(WRITE/TRANSFORM/SOURCE/MALFORMED/NAK)는 카운터로만 남음
// =====================
enum class ErrorCode : std::uint16_t {
    NONE = 0,

    VALIDATION         = 10,
    CONFIG             = 15,
    CONNECTION         = 20,

    WRITE              = 30,
    TRANSFORM_FAILURE  = 40,
    SOURCE_FAILURE     = 45,
    MALFORMED_RESPONSE = 50,
    NAK                = 55,

    BAD_STATE          = 60
};

inline const char* error_to_string(ErrorCode e) {
    switch (e) {
        case ErrorCode::NONE:               return "NONE";
        case ErrorCode::VALIDATION:         return "VALIDATION";
        case ErrorCode::CONFIG:             return "CONFIG";
        case ErrorCode::CONNECTION:         return "CONNECTION";
        case ErrorCode::WRITE:              return "WRITE";
        case ErrorCode::TRANSFORM_FAILURE:  return "TRANSFORM_FAILURE";
        case ErrorCode::SOURCE_FAILURE:     return "SOURCE_FAILURE";
        case ErrorCode::MALFORMED_RESPONSE: return "MALFORMED_RESPONSE";
        case ErrorCode::NAK:                return "NAK";
        case ErrorCode::BAD_STATE:          return "BAD_STATE";
        default:                            return "UNKNOWN_ERROR";
    }
}
