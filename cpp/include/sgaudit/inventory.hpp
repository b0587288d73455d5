// ==============================================================================
// sgaudit/inventory.hpp - Инвентарь сетевых объектов (входной документ)
// ==============================================================================
//
// Назначение:
// - Типизированная модель входного документа: регионы, security groups,
//   правила (permissions), адресные диапазоны, сетевые интерфейсы
// - Загрузка документа через RapidJSON
// - Разбор scan_timestamp (ISO 8601)
//
// Политика ошибок:
// - Структурная ошибка (файл не читается, невалидный JSON, нет "regions")
//   -> LoadResult.ok = false, анализ не запускается
// - Испорченная запись (нет GroupId, нет region_name, ...) -> запись
//   пропускается, в LoadResult.warnings добавляется сообщение
// - Неизвестный протокол или нецелый порт -> sentinel "all"
//
// ==============================================================================

#ifndef SGAUDIT_INVENTORY_HPP
#define SGAUDIT_INVENTORY_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace sgaudit::io {

// ----------------------------------------------------------------------------
// Константы значений по умолчанию
// ----------------------------------------------------------------------------

/// Sentinel протокола: все протоколы (IpProtocol "-1", отсутствует, неизвестен)
constexpr const char* PROTOCOL_ALL = "all";

/// VpcId по умолчанию для групп без VPC
constexpr const char* DEFAULT_VPC_ID = "EC2-Classic";

/// Значение для отсутствующих account_id / account_alias
constexpr const char* NOT_AVAILABLE = "N/A";

// ----------------------------------------------------------------------------
// DateTime - дата и время без timezone (UTC)
// ----------------------------------------------------------------------------

struct DateTime {
    int year = 0;
    int month = 1;        // 1-12
    int day = 1;          // 1-31
    int hour = 0;         // 0-23
    int minute = 0;       // 0-59
    int second = 0;       // 0-59
    int microsecond = 0;  // 0-999999

    /// Форматы: %Y-%m-%dT%H:%M:%S, с дробной частью и/или суффиксом Z
    static std::optional<DateTime> parse(std::string_view str);

    /// "January 12, 2026 14:30 UTC"
    std::string to_display() const;

    /// "2026-01-12T14:30:22Z"
    std::string to_string() const;

    bool operator==(const DateTime& other) const;
};

// ----------------------------------------------------------------------------
// Модель security group
// ----------------------------------------------------------------------------

/// Адресный диапазон правила (IpRanges / Ipv6Ranges)
struct AddressRange {
    std::string cidr;
    std::optional<std::string> description;
};

/// Правило доступа (IpPermissions / IpPermissionsEgress)
struct Permission {
    /// Нормализованный протокол: "tcp", "udp", "icmp", "icmpv6", "6" ... или PROTOCOL_ALL
    std::string protocol = PROTOCOL_ALL;

    /// Отсутствующий порт = "все порты"
    std::optional<std::int64_t> from_port;
    std::optional<std::int64_t> to_port;

    std::vector<AddressRange> ipv4_ranges;
    std::vector<AddressRange> ipv6_ranges;

    bool is_all_protocols() const { return protocol == PROTOCOL_ALL; }
};

struct SecurityGroup {
    std::string group_id;
    std::string group_name;
    std::string vpc_id = DEFAULT_VPC_ID;
    std::vector<Permission> ingress;
    std::vector<Permission> egress;
};

/// Ссылка интерфейса на security group
struct GroupRef {
    std::string group_id;
};

struct NetworkInterface {
    std::string interface_id = "unknown";
    std::string description;
    std::string private_ip = NOT_AVAILABLE;
    std::vector<GroupRef> groups;
};

struct Region {
    std::string name;
    std::vector<SecurityGroup> security_groups;
    std::vector<NetworkInterface> network_interfaces;
};

/// Входной документ целиком
struct Inventory {
    std::string scan_timestamp;                  // как в документе
    std::optional<DateTime> scan_time;           // разобранный scan_timestamp
    std::string account_id = NOT_AVAILABLE;
    std::string account_alias = NOT_AVAILABLE;
    std::vector<Region> regions;

    /// Общее число security groups во всех регионах
    std::size_t group_count() const;

    /// Общее число сетевых интерфейсов во всех регионах
    std::size_t interface_count() const;
};

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

enum class LoadErrorKind {
    FileNotFound,  // файл не найден / не открывается
    ParseError,    // невалидный JSON
    Structure      // корень не объект, нет "regions"
};

struct LoadError {
    LoadErrorKind kind = LoadErrorKind::Structure;
    std::string message;
    std::string path;

    /// "failed to load inventory '<path>' - <message>"
    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    Inventory inventory;
    LoadError error;

    /// Предупреждения best-effort загрузки (пропущенные записи и прочее)
    std::vector<std::string> warnings;

    /// Число пропущенных записей (регионы, группы, правила, диапазоны, ссылки)
    std::size_t skipped = 0;

    explicit operator bool() const { return ok; }
};

/// Прочитать и разобрать файл инвентаря
LoadResult load_inventory(const std::filesystem::path& path);

/// Разобрать инвентарь из строки JSON (path используется только в ошибках)
LoadResult parse_inventory(std::string_view json, const std::string& path = "<memory>");

/// Разобрать уже распарсенный документ
LoadResult parse_inventory_document(const rapidjson::Value& root,
                                    const std::string& path = "<memory>");

/// Нормализовать значение IpProtocol
std::string normalize_protocol(const rapidjson::Value* value);

/// Оставить только регионы с указанными именами (порядок документа сохраняется).
/// Пустой список - оставить все.
Inventory filter_regions(Inventory inventory, const std::vector<std::string>& names);

}  // namespace sgaudit::io

#endif  // SGAUDIT_INVENTORY_HPP
