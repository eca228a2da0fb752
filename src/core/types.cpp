#include "core/types.hpp"

namespace forge {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::FILE_NOT_FOUND: return "file not found";
        case ErrorCode::INVALID_INPUT: return "invalid input";
        case ErrorCode::PARSE_ERROR: return "parse error";
        case ErrorCode::IO_ERROR: return "i/o failure";
        case ErrorCode::FONT_ERROR: return "font error";
        case ErrorCode::MISSING_CAPABILITY: return "missing capability";
    }
    return "unknown";
}

}
