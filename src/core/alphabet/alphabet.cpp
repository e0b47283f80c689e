#include "alphabet.hpp"
#include "fairtoken/error.hpp"

namespace fairtoken::core {

namespace {
    constexpr std::string_view LOWERCASE = "abcdefghijklmnopqrstuvwxyz";
    constexpr std::string_view UPPERCASE = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    constexpr std::string_view DIGITS = "0123456789";
    constexpr std::string_view DASH_UNDERSCORE = "-_";

    [[noreturn]] void unsupported(const std::string& name) {
        throw ConfigurationError(ErrorCode::AlphabetUnsupported,
                                 "Unsupported alphabet: " + name);
    }
}

AlphabetTag alphabet_from_string(const std::string& name) {
    if (name == "a-z") return AlphabetTag::Lowercase;
    if (name == "A-Z") return AlphabetTag::Uppercase;
    if (name == "0-9") return AlphabetTag::Digits;
    if (name == "-_") return AlphabetTag::DashUnderscore;
    unsupported(name);
}

std::string alphabet_to_string(AlphabetTag tag) {
    switch (tag) {
        case AlphabetTag::Lowercase: return "a-z";
        case AlphabetTag::Uppercase: return "A-Z";
        case AlphabetTag::Digits: return "0-9";
        case AlphabetTag::DashUnderscore: return "-_";
    }
    unsupported(std::to_string(static_cast<int>(tag)));
}

std::string_view expand(AlphabetTag tag) {
    switch (tag) {
        case AlphabetTag::Lowercase: return LOWERCASE;
        case AlphabetTag::Uppercase: return UPPERCASE;
        case AlphabetTag::Digits: return DIGITS;
        case AlphabetTag::DashUnderscore: return DASH_UNDERSCORE;
    }
    unsupported(std::to_string(static_cast<int>(tag)));
}

CharacterSet resolve(const std::vector<AlphabetTag>& tags) {
    CharacterSet charset;
    for (auto tag : tags) {
        charset.append(expand(tag));
    }

    if (charset.empty()) {
        throw ConfigurationError(ErrorCode::AlphabetEmpty,
                                 "No valid characters provided for random string generation.");
    }
    return charset;
}

} // namespace fairtoken::core
