// ==============================================================================
// inventory.cpp - Загрузка инвентаря security groups
// ==============================================================================
//
// Документ читается целиком в память и разбирается RapidJSON. Затем дерево
// обходится один раз, из него строится типизированный Inventory.
//
// ==============================================================================

#include "sgaudit/inventory.hpp"

#include "sgaudit/platform.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <rapidjson/error/en.h>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace sgaudit::io {

// ============================================================================
// DateTime
// ============================================================================

namespace {

constexpr std::array<const char*, 12> MONTH_NAMES = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

bool parse_digits(std::string_view s, int& out) {
    if (s.empty()) {
        return false;
    }
    out = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
        out = out * 10 + (c - '0');
    }
    return true;
}

int days_in_month(int year, int month) {
    static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && (year % 4 == 0 && (year % 100 != 0 || year % 400 == 0))) {
        return 29;
    }
    return DAYS[month - 1];
}

std::string two_digits(int v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d", v);
    return buf;
}

}  // namespace

std::optional<DateTime> DateTime::parse(std::string_view str) {
    // YYYY-MM-DDTHH:MM:SS = 19 символов
    if (str.size() < 19) {
        return std::nullopt;
    }

    DateTime dt;
    if (!parse_digits(str.substr(0, 4), dt.year) || str[4] != '-') {
        return std::nullopt;
    }
    if (!parse_digits(str.substr(5, 2), dt.month) || dt.month < 1 || dt.month > 12 ||
        str[7] != '-') {
        return std::nullopt;
    }
    if (!parse_digits(str.substr(8, 2), dt.day) || dt.day < 1 ||
        dt.day > days_in_month(dt.year, dt.month)) {
        return std::nullopt;
    }
    // Допускаем пробел вместо 'T'
    if (str[10] != 'T' && str[10] != ' ') {
        return std::nullopt;
    }
    if (!parse_digits(str.substr(11, 2), dt.hour) || dt.hour > 23 || str[13] != ':') {
        return std::nullopt;
    }
    if (!parse_digits(str.substr(14, 2), dt.minute) || dt.minute > 59 || str[16] != ':') {
        return std::nullopt;
    }
    if (!parse_digits(str.substr(17, 2), dt.second) || dt.second > 59) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    if (pos < str.size() && str[pos] == '.') {
        ++pos;
        std::size_t frac_start = pos;
        while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
            ++pos;
        }
        if (pos == frac_start) {
            return std::nullopt;
        }
        // Дробная часть нормализуется к микросекундам
        std::string frac(str.substr(frac_start, std::min<std::size_t>(pos - frac_start, 6)));
        frac.append(6 - frac.size(), '0');
        if (!parse_digits(frac, dt.microsecond)) {
            return std::nullopt;
        }
    }

    std::string_view rest = str.substr(pos);
    if (rest.empty() || rest == "Z" || rest == "+00:00") {
        return dt;
    }
    return std::nullopt;
}

std::string DateTime::to_display() const {
    std::string result = MONTH_NAMES[static_cast<std::size_t>(month - 1)];
    result += ' ';
    result += two_digits(day);
    result += ", ";
    result += std::to_string(year);
    result += ' ';
    result += two_digits(hour);
    result += ':';
    result += two_digits(minute);
    result += " UTC";
    return result;
}

std::string DateTime::to_string() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", year, month, day, hour,
                  minute, second);
    return buf;
}

bool DateTime::operator==(const DateTime& other) const {
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute && second == other.second &&
           microsecond == other.microsecond;
}

// ============================================================================
// Inventory
// ============================================================================

std::size_t Inventory::group_count() const {
    std::size_t count = 0;
    for (const auto& region : regions) {
        count += region.security_groups.size();
    }
    return count;
}

std::size_t Inventory::interface_count() const {
    std::size_t count = 0;
    for (const auto& region : regions) {
        count += region.network_interfaces.size();
    }
    return count;
}

// ============================================================================
// LoadError
// ============================================================================

std::string LoadError::format() const {
    return "failed to load inventory '" + path + "' - " + message;
}

// ============================================================================
// Разбор документа
// ============================================================================

namespace {

/// Предупреждения загрузки и счётчик пропущенных записей
struct Diagnostics {
    std::vector<std::string>& warnings;
    std::size_t& skipped;

    void warn(std::string message) { warnings.push_back(std::move(message)); }

    void skip(const std::string& message) {
        warnings.push_back(message + ", skipped");
        ++skipped;
    }
};

const rapidjson::Value* member(const rapidjson::Value& obj, const char* key) {
    if (!obj.IsObject()) {
        return nullptr;
    }
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return nullptr;
    }
    return &it->value;
}

std::optional<std::string> string_member(const rapidjson::Value& obj, const char* key) {
    const rapidjson::Value* v = member(obj, key);
    if (v == nullptr || !v->IsString()) {
        return std::nullopt;
    }
    return std::string(v->GetString(), v->GetStringLength());
}

std::optional<std::int64_t> port_member(const rapidjson::Value& obj, const char* key) {
    const rapidjson::Value* v = member(obj, key);
    if (v == nullptr || !v->IsInt64()) {
        return std::nullopt;
    }
    return v->GetInt64();
}

/// Массив-член объекта; отсутствие и null дают nullptr без предупреждения
const rapidjson::Value* array_member(const rapidjson::Value& obj, const char* key,
                                     const std::string& context,
                                     Diagnostics& diag) {
    const rapidjson::Value* v = member(obj, key);
    if (v == nullptr || v->IsNull()) {
        return nullptr;
    }
    if (!v->IsArray()) {
        diag.warn(context + ": '" + key + "' is not an array, ignored");
        return nullptr;
    }
    return v;
}

void parse_ranges(const rapidjson::Value* ranges, const char* cidr_key,
                  std::vector<AddressRange>& out, const std::string& context,
                  Diagnostics& diag) {
    if (ranges == nullptr) {
        return;
    }
    for (rapidjson::SizeType i = 0; i < ranges->Size(); ++i) {
        const auto& entry = (*ranges)[i];
        auto cidr = string_member(entry, cidr_key);
        if (!cidr) {
            diag.skip(context + ": address range #" + std::to_string(i) + " has no '" +
                      cidr_key + "'");
            continue;
        }
        AddressRange range;
        range.cidr = std::move(*cidr);
        range.description = string_member(entry, "Description");
        out.push_back(std::move(range));
    }
}

void parse_permissions(const rapidjson::Value* perms, std::vector<Permission>& out,
                       const std::string& context, Diagnostics& diag) {
    if (perms == nullptr) {
        return;
    }
    for (rapidjson::SizeType i = 0; i < perms->Size(); ++i) {
        const auto& entry = (*perms)[i];
        std::string rule_context = context + " rule #" + std::to_string(i);
        if (!entry.IsObject()) {
            diag.skip(rule_context + ": not an object");
            continue;
        }

        Permission perm;
        perm.protocol = normalize_protocol(member(entry, "IpProtocol"));
        perm.from_port = port_member(entry, "FromPort");
        perm.to_port = port_member(entry, "ToPort");
        parse_ranges(array_member(entry, "IpRanges", rule_context, diag), "CidrIp",
                     perm.ipv4_ranges, rule_context, diag);
        parse_ranges(array_member(entry, "Ipv6Ranges", rule_context, diag), "CidrIpv6",
                     perm.ipv6_ranges, rule_context, diag);
        out.push_back(std::move(perm));
    }
}

std::optional<SecurityGroup> parse_group(const rapidjson::Value& entry, const std::string& context,
                                         Diagnostics& diag) {
    if (!entry.IsObject()) {
        diag.skip(context + ": not an object");
        return std::nullopt;
    }

    auto group_id = string_member(entry, "GroupId");
    if (!group_id || group_id->empty()) {
        diag.skip(context + ": missing 'GroupId'");
        return std::nullopt;
    }
    auto group_name = string_member(entry, "GroupName");
    if (!group_name) {
        diag.skip(context + " (" + *group_id + "): missing 'GroupName'");
        return std::nullopt;
    }

    SecurityGroup group;
    group.group_id = std::move(*group_id);
    group.group_name = std::move(*group_name);
    if (auto vpc = string_member(entry, "VpcId")) {
        group.vpc_id = std::move(*vpc);
    }

    std::string group_context = context + " (" + group.group_id + ")";
    parse_permissions(array_member(entry, "IpPermissions", group_context, diag),
                      group.ingress, group_context + " ingress", diag);
    parse_permissions(array_member(entry, "IpPermissionsEgress", group_context, diag),
                      group.egress, group_context + " egress", diag);
    return group;
}

std::optional<NetworkInterface> parse_interface(const rapidjson::Value& entry,
                                                const std::string& context,
                                                Diagnostics& diag) {
    if (!entry.IsObject()) {
        diag.skip(context + ": not an object");
        return std::nullopt;
    }

    NetworkInterface eni;
    if (auto id = string_member(entry, "NetworkInterfaceId")) {
        eni.interface_id = std::move(*id);
    }
    if (auto description = string_member(entry, "Description")) {
        eni.description = std::move(*description);
    }
    if (auto ip = string_member(entry, "PrivateIpAddress")) {
        eni.private_ip = std::move(*ip);
    }

    std::string eni_context = context + " (" + eni.interface_id + ")";
    if (const auto* groups = array_member(entry, "Groups", eni_context, diag)) {
        for (rapidjson::SizeType i = 0; i < groups->Size(); ++i) {
            auto group_id = string_member((*groups)[i], "GroupId");
            if (!group_id || group_id->empty()) {
                diag.skip(eni_context + ": group reference #" + std::to_string(i) +
                          " has no 'GroupId'");
                continue;
            }
            eni.groups.push_back(GroupRef{std::move(*group_id)});
        }
    }
    return eni;
}

std::optional<Region> parse_region(const rapidjson::Value& entry, rapidjson::SizeType index,
                                   Diagnostics& diag) {
    std::string context = "region #" + std::to_string(index);
    if (!entry.IsObject()) {
        diag.skip(context + ": not an object");
        return std::nullopt;
    }

    auto name = string_member(entry, "region_name");
    if (!name || name->empty()) {
        diag.skip(context + ": missing 'region_name'");
        return std::nullopt;
    }

    Region region;
    region.name = std::move(*name);
    context = "region " + region.name;

    if (const auto* groups = array_member(entry, "security_groups", context, diag)) {
        for (rapidjson::SizeType i = 0; i < groups->Size(); ++i) {
            auto group = parse_group((*groups)[i],
                                     context + " security group #" + std::to_string(i), diag);
            if (group) {
                region.security_groups.push_back(std::move(*group));
            }
        }
    }

    if (const auto* enis = array_member(entry, "network_interfaces", context, diag)) {
        for (rapidjson::SizeType i = 0; i < enis->Size(); ++i) {
            auto eni = parse_interface(
                (*enis)[i], context + " network interface #" + std::to_string(i), diag);
            if (eni) {
                region.network_interfaces.push_back(std::move(*eni));
            }
        }
    }

    return region;
}

bool is_known_protocol(const std::string& token) {
    static const std::unordered_set<std::string> KNOWN = {"tcp", "udp", "icmp", "icmpv6"};
    if (KNOWN.count(token) > 0) {
        return true;
    }
    // Номер протокола IANA 0-255
    int number = 0;
    return token.size() <= 3 && parse_digits(token, number) && number <= 255;
}

}  // namespace

std::string normalize_protocol(const rapidjson::Value* value) {
    if (value == nullptr || !value->IsString()) {
        return PROTOCOL_ALL;
    }

    std::string token(value->GetString(), value->GetStringLength());
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (token == "-1" || token == PROTOCOL_ALL || !is_known_protocol(token)) {
        return PROTOCOL_ALL;
    }
    return token;
}

LoadResult parse_inventory_document(const rapidjson::Value& root, const std::string& path) {
    LoadResult result;

    if (!root.IsObject()) {
        result.error = LoadError{LoadErrorKind::Structure, "document root is not an object", path};
        return result;
    }

    const rapidjson::Value* regions = member(root, "regions");
    if (regions == nullptr) {
        result.error =
            LoadError{LoadErrorKind::Structure, "required field 'regions' is missing", path};
        return result;
    }
    if (!regions->IsArray()) {
        result.error =
            LoadError{LoadErrorKind::Structure, "field 'regions' is not an array", path};
        return result;
    }

    Inventory& inv = result.inventory;
    if (auto ts = string_member(root, "scan_timestamp")) {
        inv.scan_timestamp = std::move(*ts);
        inv.scan_time = DateTime::parse(inv.scan_timestamp);
        if (!inv.scan_time) {
            result.warnings.push_back("unrecognised scan_timestamp '" + inv.scan_timestamp + "'");
        }
    }
    if (auto id = string_member(root, "account_id")) {
        inv.account_id = std::move(*id);
    }
    if (auto alias = string_member(root, "account_alias")) {
        inv.account_alias = std::move(*alias);
    }

    Diagnostics diag{result.warnings, result.skipped};
    for (rapidjson::SizeType i = 0; i < regions->Size(); ++i) {
        auto region = parse_region((*regions)[i], i, diag);
        if (region) {
            inv.regions.push_back(std::move(*region));
        }
    }

    result.ok = true;
    return result;
}

LoadResult parse_inventory(std::string_view json, const std::string& path) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        LoadResult result;
        result.error = LoadError{LoadErrorKind::ParseError,
                                 std::string("JSON parse error: ") +
                                     rapidjson::GetParseError_En(doc.GetParseError()) +
                                     " at offset " + std::to_string(doc.GetErrorOffset()),
                                 path};
        return result;
    }

    return parse_inventory_document(doc, path);
}

LoadResult load_inventory(const std::filesystem::path& path) {
    std::string path_str = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        LoadResult result;
        result.error = LoadError{LoadErrorKind::FileNotFound, "file does not exist", path_str};
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LoadResult result;
        result.error = LoadError{LoadErrorKind::FileNotFound, "could not open file", path_str};
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    return parse_inventory(std::string_view(content), path_str);
}

Inventory filter_regions(Inventory inventory, const std::vector<std::string>& names) {
    if (names.empty()) {
        return inventory;
    }
    std::unordered_set<std::string> wanted(names.begin(), names.end());
    auto& regions = inventory.regions;
    regions.erase(std::remove_if(regions.begin(), regions.end(),
                                 [&](const Region& r) { return wanted.count(r.name) == 0; }),
                  regions.end());
    return inventory;
}

}  // namespace sgaudit::io
