// ==============================================================================
// sgaudit/analyzer.hpp - Обход security groups и агрегация находок
// ==============================================================================
//
// Назначение:
// - Finding, SummaryStats, GroupSummary: выход движка для рендерера отчёта
// - Aggregator: корзины находок по severity + счётчики
// - analyze(): однопроходный обход Inventory (регион -> группа -> правило ->
//   адресный диапазон)
//
// Порядок находок внутри корзины = порядок регионов, затем групп, правил и
// адресных диапазонов в документе. Движок не выполняет ввод-вывод и не хранит
// состояние между вызовами analyze().
//
// ==============================================================================

#ifndef SGAUDIT_ANALYZER_HPP
#define SGAUDIT_ANALYZER_HPP

#include <sgaudit/attachment.hpp>
#include <sgaudit/classify.hpp>
#include <sgaudit/inventory.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sgaudit::audit {

// ----------------------------------------------------------------------------
// Finding
// ----------------------------------------------------------------------------

struct Finding {
    Severity severity = Severity::Info;
    std::string type;
    std::string region;
    std::string group_id;
    std::string group_name;
    std::string vpc_id;

    /// "INGRESS: Port 22 (SSH) (tcp) -> 0.0.0.0/0"; нет у Unused Security Group
    std::optional<std::string> rule;

    std::string description;

    /// Полное число привязок группы
    std::size_t attached_count = 0;

    /// Первые ATTACHMENT_SAMPLE_LIMIT привязок
    std::vector<Attachment> attachments;

    std::string recommendation;
};

// ----------------------------------------------------------------------------
// Статистика и сводка по группам
// ----------------------------------------------------------------------------

struct SummaryStats {
    std::size_t total_groups = 0;
    std::size_t unused_groups = 0;

    /// Ingress-правила, открытые в интернет (по одному на адресный диапазон)
    std::size_t risky_rules = 0;

    bool operator==(const SummaryStats& other) const {
        return total_groups == other.total_groups && unused_groups == other.unused_groups &&
               risky_rules == other.risky_rules;
    }
};

struct IngressRow {
    std::string port;      // "All Ports" / "22" / "8000-8080"
    std::string protocol;  // "All" / "tcp" / ...
    std::string source;    // CIDR через ", "
};

struct GroupSummary {
    std::string group_id;
    std::string group_name;
    std::string region;
    std::string vpc_id;
    std::size_t attached_count = 0;
    bool is_used = false;
    std::vector<IngressRow> ingress_rules;
};

// ----------------------------------------------------------------------------
// AnalysisResult
// ----------------------------------------------------------------------------

struct AnalysisResult {
    /// Корзины по severity_index(): critical, high, medium, low, info
    std::array<std::vector<Finding>, SEVERITY_COUNT> findings;

    SummaryStats stats;

    /// Все группы в порядке обхода
    std::vector<GroupSummary> groups;

    /// Разбиение groups по наличию привязок (заполняется в finish())
    std::vector<GroupSummary> used_groups;
    std::vector<GroupSummary> unused_groups;

    const std::vector<Finding>& bucket(Severity s) const { return findings[severity_index(s)]; }

    std::size_t count(Severity s) const { return bucket(s).size(); }

    /// Размеры корзин в порядке ALL_SEVERITIES
    std::array<std::size_t, SEVERITY_COUNT> severity_counts() const;

    std::size_t total_findings() const;
};

// ----------------------------------------------------------------------------
// Aggregator
// ----------------------------------------------------------------------------

/// Накопитель результата одного прохода. Только добавление: находки не
/// объединяются и не переклассифицируются, счётчики не уменьшаются.
class Aggregator {
public:
    void add_finding(Finding finding);
    void add_group_summary(GroupSummary summary);

    void count_group() { ++result_.stats.total_groups; }
    void count_unused_group() { ++result_.stats.unused_groups; }
    void count_risky_rule() { ++result_.stats.risky_rules; }

    /// Разбить сводку на used/unused и отдать результат
    AnalysisResult finish();

private:
    AnalysisResult result_;
};

// ----------------------------------------------------------------------------
// Обход
// ----------------------------------------------------------------------------

/// Обработать одну группу региона
void walk_group(const io::SecurityGroup& group, const std::string& region,
                const AttachmentIndex& index, Aggregator& aggregator);

/// Обработать все группы региона (индекс привязок строится по региону)
void walk_region(const io::Region& region, Aggregator& aggregator);

/// Полный анализ инвентаря
AnalysisResult analyze(const io::Inventory& inventory);

}  // namespace sgaudit::audit

#endif  // SGAUDIT_ANALYZER_HPP
