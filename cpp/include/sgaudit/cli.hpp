// ==============================================================================
// sgaudit/cli.hpp - Парсинг командной строки
// ==============================================================================
//
// Назначение:
// - Парсинг argv (без сторонних библиотек)
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef SGAUDIT_CLI_HPP
#define SGAUDIT_CLI_HPP

#include <sgaudit/config.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace sgaudit::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// audit - классификация инвентаря и отчёт
struct AuditCommand {
    std::filesystem::path input;                  // <INPUT>
    std::optional<std::filesystem::path> config;  // -c, --config

    // --region, --level, --json, --output, --full
    config::AuditOverrides overrides;
};

/// check - проверка инвентаря без классификации
struct CheckCommand {
    std::filesystem::path input;
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<AuditCommand, CheckCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика и результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "1.0.0";

constexpr const char* ABOUT = "Audit cloud security groups for internet exposure";

}  // namespace sgaudit::cli

#endif  // SGAUDIT_CLI_HPP
