#include "settings.hpp"
#include <string>

namespace fairtoken::core {

namespace {
    Result<std::vector<AlphabetTag>> parse_alphabets(const utils::json& node) {
        if (!node.is_array()) {
            return Result<std::vector<AlphabetTag>>::Err(
                ErrorCode::ConfigInvalidValue, "\"alphabets\" must be an array of strings");
        }

        std::vector<AlphabetTag> tags;
        for (const auto& item : node) {
            if (!item.is_string()) {
                return Result<std::vector<AlphabetTag>>::Err(
                    ErrorCode::ConfigInvalidValue, "\"alphabets\" must be an array of strings");
            }
            try {
                tags.push_back(alphabet_from_string(item.get<std::string>()));
            } catch (const ConfigurationError& e) {
                return Result<std::vector<AlphabetTag>>::Err(Error(e.code(), e.what()));
            }
        }

        if (tags.empty()) {
            return Result<std::vector<AlphabetTag>>::Err(
                ErrorCode::AlphabetEmpty,
                "No valid characters provided for random string generation.");
        }
        return Result<std::vector<AlphabetTag>>::Ok(std::move(tags));
    }
}

Result<GeneratorSettings> GeneratorSettings::from_config(const utils::Config& config) {
    GeneratorSettings settings;

    if (config.has("alphabets")) {
        auto tags = parse_alphabets(config.data().at("alphabets"));
        if (tags.is_err()) {
            return Result<GeneratorSettings>::Err(tags.error());
        }
        settings.alphabets = std::move(tags.value());
    }

    if (config.has("length")) {
        auto length = config.get<int64_t>("length");
        if (!length || !config.data().at("length").is_number_integer()) {
            return Result<GeneratorSettings>::Err(
                ErrorCode::ConfigInvalidValue, "\"length\" must be an integer");
        }
        if (*length <= 0) {
            return Result<GeneratorSettings>::Err(
                ErrorCode::LengthNotPositive, "Length must be a positive integer.");
        }
        settings.length = *length;
    }

    if (config.has("count")) {
        auto count = config.get<int64_t>("count");
        if (!count || !config.data().at("count").is_number_integer() || *count <= 0) {
            return Result<GeneratorSettings>::Err(
                ErrorCode::ConfigInvalidValue, "\"count\" must be a positive integer");
        }
        settings.count = static_cast<size_t>(*count);
    }

    return Result<GeneratorSettings>::Ok(std::move(settings));
}

void GeneratorSettings::apply_to(utils::Config& config) const {
    std::vector<std::string> names;
    names.reserve(alphabets.size());
    for (auto tag : alphabets) {
        names.push_back(alphabet_to_string(tag));
    }
    config.set("alphabets", names);
    config.set("length", length);
    config.set("count", count);
}

} // namespace fairtoken::core
