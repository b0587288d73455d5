// ==============================================================================
// sgaudit/classify.hpp - Классификация правил security group
// ==============================================================================
//
// Назначение:
// - Уровни критичности находок (Severity)
// - Статические таблицы портов: critical / management / известные рискованные
// - classify(): решение по одному правилу + направлению + адресному диапазону
// - recommendation(): рекомендация по (порт, протокол)
// - Строковые представления правила для отчёта
//
// Все функции чистые: результат зависит только от аргументов, состояние
// между вызовами не сохраняется.
//
// ==============================================================================

#ifndef SGAUDIT_CLASSIFY_HPP
#define SGAUDIT_CLASSIFY_HPP

#include <sgaudit/inventory.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sgaudit::audit {

// ============================================================================
// Severity
// ============================================================================

/// Уровень критичности находки, упорядочен по убыванию риска
enum class Severity { Critical, High, Medium, Low, Info };

constexpr std::size_t SEVERITY_COUNT = 5;

/// Все уровни в порядке убывания риска
constexpr std::array<Severity, SEVERITY_COUNT> ALL_SEVERITIES = {
    Severity::Critical, Severity::High, Severity::Medium, Severity::Low, Severity::Info};

/// Индекс корзины находок (Critical = 0 ... Info = 4)
constexpr std::size_t severity_index(Severity s) {
    return static_cast<std::size_t>(s);
}

/// Ключ корзины в нижнем регистре: "critical", "high", ...
std::string to_string(Severity s);

/// Метка в верхнем регистре: "CRITICAL", "HIGH", ...
std::string severity_label(Severity s);

/// Разобрать уровень без учёта регистра
/// @throw std::invalid_argument если строка не распознана
Severity parse_severity(std::string_view s);

// ============================================================================
// Direction
// ============================================================================

enum class Direction { Ingress, Egress };

/// "INGRESS" / "EGRESS"
std::string to_string(Direction d);

// ============================================================================
// Типы находок и фиксированные тексты
// ============================================================================

namespace finding_type {
constexpr const char* CRITICAL_PORT = "Critical Port Exposed to Internet";
constexpr const char* MANAGEMENT_PORT = "Management Port Exposed to Internet";
constexpr const char* RISKY_PORT = "Risky Port Exposed to Internet";
constexpr const char* EXPOSED_PORT = "Internet-Exposed Port";
constexpr const char* ALL_OPEN = "All Protocols/Ports Open to Internet";
constexpr const char* PERMISSIVE_EGRESS = "Permissive Egress Rule";
constexpr const char* UNUSED_GROUP = "Unused Security Group";
}  // namespace finding_type

/// Сколько привязок сохраняется в находке для отображения
constexpr std::size_t ATTACHMENT_SAMPLE_LIMIT = 5;

/// Имя группы по умолчанию: никогда не считается неиспользуемой
constexpr const char* DEFAULT_GROUP_NAME = "default";

constexpr const char* NO_DESCRIPTION = "No description provided";
constexpr const char* EGRESS_DESCRIPTION = "All outbound traffic allowed to internet";
constexpr const char* EGRESS_RECOMMENDATION =
    "Consider restricting egress to specific ports/protocols";
constexpr const char* UNUSED_RECOMMENDATION =
    "Consider removing unused security groups to reduce complexity";

// ============================================================================
// Таблицы портов
// ============================================================================

/// {22, 23, 3389, 1433, 3306, 5432, 6379, 27017, 9200}
bool is_critical_port(std::int64_t port);

/// {22, 3389, 5900, 5985, 5986}
bool is_management_port(std::int64_t port);

/// Имя сервиса для известного рискованного порта (22 -> "SSH")
std::optional<std::string_view> risky_port_name(std::int64_t port);

/// Адрес равен 0.0.0.0/0 или ::/0 (другие диапазоны публичными не считаются)
bool is_public_cidr(std::string_view cidr);

// ============================================================================
// Классификация
// ============================================================================

struct Classification {
    Severity severity = Severity::Medium;
    std::string type;

    /// Учитывается в счётчике risky rules (только ingress из интернета)
    bool risky_rule = false;
};

/// Классифицировать правило для одного адресного диапазона.
/// nullopt - правило не является находкой.
std::optional<Classification> classify(std::optional<std::int64_t> from_port,
                                       std::optional<std::int64_t> to_port,
                                       std::string_view protocol, Direction direction,
                                       std::string_view cidr);

/// То же для Permission из инвентаря
std::optional<Classification> classify(const io::Permission& rule, Direction direction,
                                       std::string_view cidr);

/// Рекомендация по исправлению; всегда непустая строка
std::string recommendation(std::optional<std::int64_t> port, std::string_view protocol);

// ============================================================================
// Представление правила
// ============================================================================

/// "All" для sentinel, иначе токен протокола как есть
std::string protocol_display(std::string_view protocol);

/// "All Ports" / "Port 22" / "Ports 8000-8080"
std::string port_display(const io::Permission& rule);

/// "All Ports" / "22" / "8000-8080" (для сводной таблицы групп)
std::string port_summary(const io::Permission& rule);

/// "INGRESS: Port 22 (SSH) (tcp) -> 0.0.0.0/0"
std::string describe_rule(const io::Permission& rule, Direction direction, std::string_view cidr);

}  // namespace sgaudit::audit

#endif  // SGAUDIT_CLASSIFY_HPP
