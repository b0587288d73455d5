// ==============================================================================
// classify.cpp - Классификация правил security group
// ==============================================================================

#include "sgaudit/classify.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sgaudit::audit {

namespace {

// ----------------------------------------------------------------------------
// Таблицы портов
// ----------------------------------------------------------------------------

constexpr std::int64_t CRITICAL_PORTS[] = {22, 23, 3389, 1433, 3306, 5432, 6379, 27017, 9200};

constexpr std::int64_t MANAGEMENT_PORTS[] = {22, 3389, 5900, 5985, 5986};

/// Порты баз данных и поисковых движков
constexpr std::int64_t DATABASE_PORTS[] = {1433, 3306, 5432, 27017, 6379, 9200};

struct RiskyPort {
    std::int64_t port;
    const char* name;
};

constexpr RiskyPort RISKY_PORTS[] = {
    {20, "FTP Data"},     {21, "FTP Control"},  {22, "SSH"},           {23, "Telnet"},
    {25, "SMTP"},         {53, "DNS"},          {80, "HTTP"},          {135, "MS RPC"},
    {137, "NetBIOS"},     {138, "NetBIOS"},     {139, "NetBIOS"},      {443, "HTTPS"},
    {445, "SMB"},         {1433, "SQL Server"}, {1434, "SQL Server"},  {3306, "MySQL"},
    {3389, "RDP"},        {5432, "PostgreSQL"}, {5900, "VNC"},         {6379, "Redis"},
    {8080, "HTTP Alt"},   {8443, "HTTPS Alt"},  {9200, "Elasticsearch"}, {27017, "MongoDB"},
};

template <std::size_t N>
bool contains(const std::int64_t (&table)[N], std::int64_t port) {
    return std::find(std::begin(table), std::end(table), port) != std::end(table);
}

/// Хотя бы одна граница диапазона входит в таблицу
template <std::size_t N>
bool bound_in(const std::int64_t (&table)[N], std::int64_t from, std::optional<std::int64_t> to) {
    return contains(table, from) || (to && contains(table, *to));
}

bool bound_is_risky(std::int64_t from, std::optional<std::int64_t> to) {
    return risky_port_name(from).has_value() || (to && risky_port_name(*to).has_value());
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ----------------------------------------------------------------------------
// Рекомендации
// ----------------------------------------------------------------------------

constexpr const char* REC_ALL_PROTOCOLS =
    "URGENT: Restrict to specific protocols and ports. Use VPN or bastion host for management "
    "access.";
constexpr const char* REC_REMOTE_ACCESS =
    "Use AWS Systems Manager Session Manager or VPN instead of direct internet access";
constexpr const char* REC_DATABASE =
    "Database should NEVER be exposed to internet. Use VPN, VPC peering, or PrivateLink";
constexpr const char* REC_TELNET =
    "Telnet is insecure and deprecated. Use SSH instead and restrict access";
constexpr const char* REC_DEFAULT =
    "Restrict source to specific IP addresses or use AWS security services (CloudFront, ALB, "
    "etc.)";

}  // namespace

// ============================================================================
// Severity / Direction
// ============================================================================

std::string to_string(Severity s) {
    switch (s) {
    case Severity::Critical:
        return "critical";
    case Severity::High:
        return "high";
    case Severity::Medium:
        return "medium";
    case Severity::Low:
        return "low";
    case Severity::Info:
        return "info";
    }
    return "info";
}

std::string severity_label(Severity s) {
    switch (s) {
    case Severity::Critical:
        return "CRITICAL";
    case Severity::High:
        return "HIGH";
    case Severity::Medium:
        return "MEDIUM";
    case Severity::Low:
        return "LOW";
    case Severity::Info:
        return "INFO";
    }
    return "INFO";
}

Severity parse_severity(std::string_view s) {
    const std::string lower = to_lower(s);
    if (lower == "critical")
        return Severity::Critical;
    if (lower == "high")
        return Severity::High;
    if (lower == "medium")
        return Severity::Medium;
    if (lower == "low")
        return Severity::Low;
    if (lower == "info")
        return Severity::Info;
    throw std::invalid_argument("unknown level, must be: critical, high, medium, low or info");
}

std::string to_string(Direction d) {
    return d == Direction::Ingress ? "INGRESS" : "EGRESS";
}

// ============================================================================
// Таблицы портов
// ============================================================================

bool is_critical_port(std::int64_t port) {
    return contains(CRITICAL_PORTS, port);
}

bool is_management_port(std::int64_t port) {
    return contains(MANAGEMENT_PORTS, port);
}

std::optional<std::string_view> risky_port_name(std::int64_t port) {
    for (const auto& entry : RISKY_PORTS) {
        if (entry.port == port) {
            return std::string_view(entry.name);
        }
    }
    return std::nullopt;
}

bool is_public_cidr(std::string_view cidr) {
    return cidr == "0.0.0.0/0" || cidr == "::/0";
}

// ============================================================================
// Классификация
// ============================================================================

std::optional<Classification> classify(std::optional<std::int64_t> from_port,
                                       std::optional<std::int64_t> to_port,
                                       std::string_view protocol, Direction direction,
                                       std::string_view cidr) {
    if (!is_public_cidr(cidr)) {
        return std::nullopt;
    }

    const bool all_protocols = protocol == io::PROTOCOL_ALL;

    // Egress: находкой считается только "весь трафик наружу"
    if (direction == Direction::Egress) {
        if (!all_protocols) {
            return std::nullopt;
        }
        return Classification{Severity::Low, finding_type::PERMISSIVE_EGRESS, false};
    }

    if (all_protocols) {
        return Classification{Severity::Critical, finding_type::ALL_OPEN, true};
    }

    // Уровни по портам применяются только при заданном from_port
    if (from_port) {
        if (bound_in(CRITICAL_PORTS, *from_port, to_port)) {
            return Classification{Severity::Critical, finding_type::CRITICAL_PORT, true};
        }
        if (bound_in(MANAGEMENT_PORTS, *from_port, to_port)) {
            return Classification{Severity::High, finding_type::MANAGEMENT_PORT, true};
        }
        if (bound_is_risky(*from_port, to_port)) {
            return Classification{Severity::High, finding_type::RISKY_PORT, true};
        }
    }

    return Classification{Severity::Medium, finding_type::EXPOSED_PORT, true};
}

std::optional<Classification> classify(const io::Permission& rule, Direction direction,
                                       std::string_view cidr) {
    return classify(rule.from_port, rule.to_port, rule.protocol, direction, cidr);
}

std::string recommendation(std::optional<std::int64_t> port, std::string_view protocol) {
    if (protocol == io::PROTOCOL_ALL) {
        return REC_ALL_PROTOCOLS;
    }
    if (!port) {
        return REC_DEFAULT;
    }
    if (*port == 22 || *port == 3389) {
        return REC_REMOTE_ACCESS;
    }
    if (contains(DATABASE_PORTS, *port)) {
        return REC_DATABASE;
    }
    if (*port == 23) {
        return REC_TELNET;
    }
    return REC_DEFAULT;
}

// ============================================================================
// Представление правила
// ============================================================================

std::string protocol_display(std::string_view protocol) {
    if (protocol == io::PROTOCOL_ALL) {
        return "All";
    }
    return std::string(protocol);
}

std::string port_display(const io::Permission& rule) {
    if (rule.is_all_protocols() || (!rule.from_port && !rule.to_port)) {
        return "All Ports";
    }
    const std::string from = rule.from_port ? std::to_string(*rule.from_port) : "*";
    const std::string to = rule.to_port ? std::to_string(*rule.to_port) : "*";
    if (rule.from_port == rule.to_port) {
        return "Port " + from;
    }
    return "Ports " + from + "-" + to;
}

std::string port_summary(const io::Permission& rule) {
    if (rule.is_all_protocols() || (!rule.from_port && !rule.to_port)) {
        return "All Ports";
    }
    const std::string from = rule.from_port ? std::to_string(*rule.from_port) : "*";
    const std::string to = rule.to_port ? std::to_string(*rule.to_port) : "*";
    if (rule.from_port == rule.to_port) {
        return from;
    }
    return from + "-" + to;
}

std::string describe_rule(const io::Permission& rule, Direction direction,
                          std::string_view cidr) {
    std::string out = to_string(direction);
    out += ": ";
    out += port_display(rule);

    // Имя сервиса только для ingress и только по from_port
    if (direction == Direction::Ingress && rule.from_port) {
        if (auto name = risky_port_name(*rule.from_port)) {
            out += " (";
            out += *name;
            out += ")";
        }
    }

    out += " (";
    out += protocol_display(rule.protocol);
    out += ") -> ";
    out += cidr;
    return out;
}

}  // namespace sgaudit::audit
