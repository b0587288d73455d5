// ==============================================================================
// sgaudit/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Имя ОС для --version
//
// Вся платформенная специфика изолирована здесь, остальные модули
// не включают <windows.h>/<unistd.h> напрямую.
//
// ==============================================================================

#ifndef SGAUDIT_PLATFORM_HPP
#define SGAUDIT_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace sgaudit::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить path из UTF-8 строки (argv, значения из YAML профиля)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути (для сообщений и отчёта)
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// "Linux", "macOS", "Windows" или "Unknown"
std::string os_name();

}  // namespace sgaudit::platform

#endif  // SGAUDIT_PLATFORM_HPP
