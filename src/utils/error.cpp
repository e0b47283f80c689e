#include "fairtoken/error.hpp"
#include <sstream>

namespace fairtoken {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";

        case ErrorCode::AlphabetEmpty: return "Empty alphabet";
        case ErrorCode::AlphabetUnsupported: return "Unsupported alphabet";
        case ErrorCode::AlphabetTooLarge: return "Alphabet too large";

        case ErrorCode::LengthNotPositive: return "Length not positive";
        case ErrorCode::RandomSourceUnavailable: return "Secure random source unavailable";

        case ErrorCode::ConfigFileNotFound: return "Config file not found";
        case ErrorCode::ConfigParseFailed: return "Config parse failed";
        case ErrorCode::ConfigInvalidValue: return "Invalid config value";

        default: return "Unknown error code";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace fairtoken
