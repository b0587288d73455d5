// ==============================================================================
// sgaudit/report.hpp - Отчёт по результату анализа
// ==============================================================================
//
// Назначение:
// - render_text(): заголовок, сводка, таблицы находок по severity, таблицы
//   используемых и неиспользуемых групп
// - render_json(): тот же результат как RapidJSON документ
//
// Рендерер не классифицирует: он только отображает AnalysisResult.
//
// ==============================================================================

#ifndef SGAUDIT_REPORT_HPP
#define SGAUDIT_REPORT_HPP

#include <sgaudit/analyzer.hpp>
#include <sgaudit/inventory.hpp>

#include <cstddef>
#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace sgaudit::report {

/// Ширина столбцов текстовых таблиц по умолчанию
constexpr std::size_t DEFAULT_COLUMN_WIDTH = 40;

struct ReportOptions {
    /// Выводимые корзины (пусто = все). Отфильтрованные корзины в JSON пустые.
    std::vector<audit::Severity> levels;

    /// Не обрезать ячейки таблиц
    bool full = false;

    bool level_enabled(audit::Severity s) const;
};

/// Дата сканирования для заголовка: DateTime::to_display() или исходная строка
std::string scan_date(const io::Inventory& inventory);

/// Текстовый отчёт (таблицы Unicode)
std::string render_text(const io::Inventory& inventory, const audit::AnalysisResult& result,
                        const ReportOptions& options);

/// JSON отчёт
rapidjson::Document render_json(const io::Inventory& inventory,
                                const audit::AnalysisResult& result,
                                const ReportOptions& options);

}  // namespace sgaudit::report

#endif  // SGAUDIT_REPORT_HPP
