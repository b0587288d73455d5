// ==============================================================================
// sgaudit/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*] [~] (логирование)
// - Вывод отчёта в файл (--output)
// - Таблицы для текстового отчёта
//
// Остальные модули не пишут в потоки сами: они возвращают строки или
// структуры, а app передаёт их Writer'у.
//
// ==============================================================================

#ifndef SGAUDIT_OUTPUT_HPP
#define SGAUDIT_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace sgaudit::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // [+] информация
    Yellow,  // [!] предупреждения
    Red,     // [x] ошибки
    Cyan,    // [*] отладка
    Magenta  // [~] трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить [+] и [!]
    int verbose = 0;         // -v: 1 = [*], 2 = [~]
    bool no_banner = false;  // --no-banner

    // Файл для stdout (--output). Stderr всегда остаётся терминалом.
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток без преобразований
    void write(Stream s, std::string_view bytes);

    /// Записать строку и '\n'
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr, подавляется при quiet
    void info(std::string_view message);

    /// "[!] <message>" в stderr, подавляется при quiet
    void warn(std::string_view message);

    /// "[x] <message>" в stderr, печатается всегда
    void error(std::string_view message);

    /// "[*] <message>" в stderr, только при verbose > 0
    void debug(std::string_view message);

    /// "[~] <message>" в stderr, только при verbose > 1
    void trace(std::string_view message);

    /// Pretty JSON (2 пробела) + '\n' в stdout
    void write_json_pretty(const rapidjson::Value& value);

    /// Сбросить буферы
    void flush();

    const OutputConfig& config() const { return config_; }

    /// true если output_path задан и файл успешно открыт
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    FILE* target(Stream s) const;
    void close_output_file();

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

class Table {
public:
    Table() = default;

    void set_headers(std::vector<std::string> headers);

    void add_row(std::vector<std::string> cells);

    /// Ограничить ширину всех столбцов (0 = без ограничения).
    /// Длинные ячейки обрезаются и получают суффикс "..."
    void set_max_column_width(size_t width) { max_width_ = width; }

    size_t row_count() const { return rows_.size(); }

    std::string to_string() const;

private:
    std::vector<size_t> column_widths() const;
    std::string format_border(const std::vector<size_t>& widths, const char* left,
                              const char* middle, const char* right) const;
    std::string format_row(const std::vector<size_t>& widths,
                           const std::vector<std::string>& cells) const;
    std::string fit(const std::string& cell) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    size_t max_width_ = 0;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[+] <message>\n"
std::string format_info(std::string_view message);

/// "[!] <message>\n"
std::string format_warning(std::string_view message);

/// "[x] <message>\n"
std::string format_error(std::string_view message);

/// "[*] <message>\n"
std::string format_debug(std::string_view message);

/// Ширина строки в символах (UTF-8 code points)
size_t display_width(std::string_view s);

/// Удаляет \n, \r, \t и схлопывает повторные пробелы
std::string flatten_field(std::string_view field);

std::string ansi_color_code(Color color);

std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY и не перенаправлен в файл)
bool supports_color(Stream s);

}  // namespace sgaudit::output

#endif  // SGAUDIT_OUTPUT_HPP
