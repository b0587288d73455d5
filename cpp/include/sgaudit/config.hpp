// ==============================================================================
// sgaudit/config.hpp - Профиль аудита (YAML)
// ==============================================================================
//
// Назначение:
// - Загрузка необязательного профиля через yaml-cpp
// - Слияние профиля с опциями командной строки
//
// Формат:
//   regions: [us-east-1, eu-west-1]
//   levels: [critical, high]
//   output:
//     format: json        # text | json
//     path: report.json
//     full: false
//
// Профиль влияет только на выбор регионов и вывод. Таблицы портов и правила
// классификации не настраиваются.
//
// ==============================================================================

#ifndef SGAUDIT_CONFIG_HPP
#define SGAUDIT_CONFIG_HPP

#include <sgaudit/classify.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sgaudit::config {

// ----------------------------------------------------------------------------
// Формат отчёта
// ----------------------------------------------------------------------------

enum class OutputFormat { Text, Json };

std::string to_string(OutputFormat format);

/// "text" / "json" (без учёта регистра)
std::optional<OutputFormat> parse_output_format(std::string_view s);

// ----------------------------------------------------------------------------
// Профиль
// ----------------------------------------------------------------------------

struct AuditProfile {
    std::vector<std::string> regions;       // пусто = все регионы
    std::vector<audit::Severity> levels;    // пусто = все уровни
    std::optional<OutputFormat> format;
    std::optional<std::filesystem::path> output_path;
    std::optional<bool> full;
};

struct ConfigError {
    std::string message;
    std::string path;

    /// "failed to load profile '<path>' - <message>"
    std::string format() const;
};

struct ProfileResult {
    bool ok = false;
    AuditProfile profile;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Прочитать профиль из файла
ProfileResult load_profile(const std::filesystem::path& path);

/// Разобрать профиль из строки YAML
ProfileResult parse_profile(std::string_view yaml, const std::string& path = "<memory>");

// ----------------------------------------------------------------------------
// Итоговые настройки запуска
// ----------------------------------------------------------------------------

/// Значения из командной строки; заданные поля перекрывают профиль
struct AuditOverrides {
    std::vector<std::string> regions;     // --region
    std::vector<audit::Severity> levels;  // --level
    bool json = false;                    // -j, --json
    std::optional<std::filesystem::path> output_path;  // -o, --output
    bool full = false;                    // -F, --full
};

struct AuditSettings {
    std::vector<std::string> regions;
    std::vector<audit::Severity> levels;
    OutputFormat format = OutputFormat::Text;
    std::optional<std::filesystem::path> output_path;
    bool full = false;
};

/// Слить профиль и опции командной строки
AuditSettings merge_settings(const AuditProfile& profile, const AuditOverrides& overrides);

}  // namespace sgaudit::config

#endif  // SGAUDIT_CONFIG_HPP
