// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/core/config.hpp>
#include <parcel/core/query.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace parcel::core {

namespace {

std::expected<spdlog::level::level_enum, std::error_code> parse_level(const std::string& name) {
    static constexpr std::pair<std::string_view, spdlog::level::level_enum> LEVELS[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info",  spdlog::level::info},
        {"warn",  spdlog::level::warn},
        {"error", spdlog::level::err},
        {"off",   spdlog::level::off},
    };
    for (const auto& [key, level] : LEVELS) {
        if (key == name) {
            return level;
        }
    }
    return std::unexpected(make_error_code(Errc::invalid_config));
}

} // namespace

std::expected<Config, std::error_code> Config::parse(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(Errc::invalid_config));
        }

        Config config;
        config.database = j.value("database", config.database);

        if (j.contains("log")) {
            const auto& log = j.at("log");
            if (log.contains("level")) {
                auto level = parse_level(log.at("level").get<std::string>());
                if (!level) {
                    return std::unexpected(level.error());
                }
                config.log.level = *level;
            }
            config.log.file = log.value("file", config.log.file);
        }

        if (j.contains("retry")) {
            config.max_retry_attempts = j.at("retry").value("max_attempts", config.max_retry_attempts);
        }

        if (j.contains("query")) {
            const auto& query = j.at("query");
            config.order_column = query.value("order_by", config.order_column);
            config.order_direction = query.value("direction", config.order_direction);
            config.only_visible = query.value("only_visible", config.only_visible);

            // Reject a bad ordering at load time rather than on the first list
            Query ordering;
            if (ordering.order_by(config.order_column, config.order_direction)) {
                return std::unexpected(make_error_code(Errc::invalid_config));
            }
        }

        return config;
    } catch (const nlohmann::json::exception& e) {
        logger()->warn("Invalid configuration: {}", e.what());
        return std::unexpected(make_error_code(Errc::invalid_config));
    }
}

std::expected<Config, std::error_code> Config::load(const std::string& path) noexcept {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(Errc::not_found));
    }
    std::ostringstream text;
    text << file.rdbuf();
    return parse(text.str());
}

} // namespace parcel::core
