// ==============================================================================
// config.cpp - Профиль аудита (YAML)
// ==============================================================================

#include "sgaudit/config.hpp"

#include "sgaudit/platform.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace sgaudit::config {

namespace {

ProfileResult failure(std::string message, const std::string& path) {
    ProfileResult result;
    result.ok = false;
    result.error.message = std::move(message);
    result.error.path = path;
    return result;
}

/// Скаляр или последовательность скаляров -> список строк
bool read_string_list(const YAML::Node& node, std::vector<std::string>& out) {
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return true;
    }
    if (!node.IsSequence()) {
        return false;
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return false;
        }
        out.push_back(item.as<std::string>());
    }
    return true;
}

}  // namespace

// ============================================================================
// OutputFormat
// ============================================================================

std::string to_string(OutputFormat format) {
    return format == OutputFormat::Json ? "json" : "text";
}

std::optional<OutputFormat> parse_output_format(std::string_view s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "text")
        return OutputFormat::Text;
    if (lower == "json")
        return OutputFormat::Json;
    return std::nullopt;
}

std::string ConfigError::format() const {
    return "failed to load profile '" + path + "' - " + message;
}

// ============================================================================
// Загрузка профиля
// ============================================================================

ProfileResult parse_profile(std::string_view yaml, const std::string& path) {
    ProfileResult result;

    try {
        YAML::Node root = YAML::Load(std::string(yaml));

        // Пустой файл = профиль без настроек
        if (root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            return failure("profile root is not a mapping", path);
        }

        if (root["regions"]) {
            if (!read_string_list(root["regions"], result.profile.regions)) {
                return failure("field 'regions' must be a list of region names", path);
            }
        }

        if (root["levels"]) {
            std::vector<std::string> names;
            if (!read_string_list(root["levels"], names)) {
                return failure("field 'levels' must be a list of levels", path);
            }
            for (const auto& name : names) {
                try {
                    result.profile.levels.push_back(audit::parse_severity(name));
                } catch (const std::invalid_argument& e) {
                    return failure("invalid level '" + name + "': " + e.what(), path);
                }
            }
        }

        if (const YAML::Node output = root["output"]) {
            if (!output.IsMap()) {
                return failure("field 'output' is not a mapping", path);
            }
            if (output["format"]) {
                const auto name = output["format"].as<std::string>();
                auto format = parse_output_format(name);
                if (!format) {
                    return failure("invalid output format '" + name + "', must be: text or json",
                                   path);
                }
                result.profile.format = *format;
            }
            if (output["path"]) {
                result.profile.output_path =
                    platform::path_from_utf8(output["path"].as<std::string>());
            }
            if (output["full"]) {
                result.profile.full = output["full"].as<bool>();
            }
        }

        result.ok = true;
        return result;

    } catch (const YAML::Exception& e) {
        return failure(std::string("YAML parse error: ") + e.what(), path);
    }
}

ProfileResult load_profile(const std::filesystem::path& path) {
    const std::string display = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return failure("file does not exist", display);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return failure("could not open file", display);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_profile(ss.str(), display);
}

// ============================================================================
// Слияние
// ============================================================================

AuditSettings merge_settings(const AuditProfile& profile, const AuditOverrides& overrides) {
    AuditSettings settings;

    settings.regions = overrides.regions.empty() ? profile.regions : overrides.regions;
    settings.levels = overrides.levels.empty() ? profile.levels : overrides.levels;

    if (overrides.json) {
        settings.format = OutputFormat::Json;
    } else if (profile.format) {
        settings.format = *profile.format;
    }

    settings.output_path = overrides.output_path ? overrides.output_path : profile.output_path;
    settings.full = overrides.full || profile.full.value_or(false);
    return settings;
}

}  // namespace sgaudit::config
