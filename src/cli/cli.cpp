#include "cli.hpp"
#include "core/generator/generator.hpp"
#include "utils/logger.hpp"
#include <filesystem>
#include <stdexcept>

namespace fairtoken::cli {

namespace {
    std::optional<int64_t> parse_integer(const std::string& text) {
        try {
            size_t consumed = 0;
            int64_t value = std::stoll(text, &consumed);
            if (consumed != text.size()) {
                return std::nullopt;
            }
            return value;
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
}

std::optional<CommandLine> parse_command_line(const std::vector<std::string>& args) {
    CommandLine cmd;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if ((arg == "-c" || arg == "--config") && has_value) {
            cmd.config_path = args[++i];
        } else if ((arg == "-l" || arg == "--length") && has_value) {
            cmd.length = parse_integer(args[++i]);
            if (!cmd.length) return std::nullopt;
        } else if ((arg == "-n" || arg == "--count") && has_value) {
            cmd.count = parse_integer(args[++i]);
            if (!cmd.count) return std::nullopt;
        } else if (arg == "-_") {
            // Alphabet tag, not a flag
            cmd.alphabets.push_back(arg);
        } else if (!arg.empty() && arg[0] == '-') {
            return std::nullopt;
        } else {
            cmd.alphabets.push_back(arg);
        }
    }
    return cmd;
}

void print_usage(std::ostream& err) {
    err << "Usage: fairtoken [-c config] [-n count] [-l length] [alphabet ...]\n"
        << "  alphabets: a-z A-Z 0-9 -_\n"
        << "fairtoken " << FAIRTOKEN_VERSION_STRING << std::endl;
}

utils::Config load_config(const CommandLine& cmd) {
    if (std::filesystem::exists(cmd.config_path)) {
        return utils::Config::load_from_file(cmd.config_path);
    }

    utils::Config config;
    config.set("log_level", "warn");
    config.set("log_to_file", false);
    return config;
}

void apply_overrides(const CommandLine& cmd, utils::Config& config) {
    if (!cmd.alphabets.empty()) {
        config.set("alphabets", cmd.alphabets);
    }
    if (cmd.length) {
        config.set("length", *cmd.length);
    }
    if (cmd.count) {
        config.set("count", *cmd.count);
    }
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto cmd = parse_command_line(args);
    if (!cmd) {
        print_usage(err);
        return EXIT_USAGE;
    }

    try {
        auto config = load_config(*cmd);
        utils::Logger::init(config.get_or<std::string>("log_level", "warn"),
                            config.get_or<bool>("log_to_file", false));

        apply_overrides(*cmd, config);
        auto settings = core::GeneratorSettings::from_config(config);
        if (settings.is_err()) {
            FAIRTOKEN_LOG_ERROR("Invalid configuration: {}", settings.error().to_string());
            return EXIT_ERROR;
        }

        const auto& resolved = settings.value();
        auto generator = core::create_generator(resolved.alphabets);
        FAIRTOKEN_LOG_INFO("Generating {} token(s) of {} characters from {} characters",
                           resolved.count, resolved.length, generator.base_charset().size());

        for (size_t i = 0; i < resolved.count; ++i) {
            out << generator(resolved.length) << '\n';
        }
        out.flush();

    } catch (const FairtokenException& e) {
        FAIRTOKEN_LOG_ERROR("{} ({})", e.what(), error_code_to_string(e.code()));
        return EXIT_ERROR;
    } catch (const std::exception& e) {
        FAIRTOKEN_LOG_CRITICAL("Fatal error: {}", e.what());
        return EXIT_ERROR;
    }

    return EXIT_OK;
}

} // namespace fairtoken::cli
