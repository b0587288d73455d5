// ==============================================================================
// report.cpp - Отчёт по результату анализа
// ==============================================================================

#include "sgaudit/report.hpp"

#include "sgaudit/output.hpp"

#include <algorithm>
#include <cstdint>

namespace sgaudit::report {

namespace {

using rapidjson::Value;
using Allocator = rapidjson::Document::AllocatorType;

Value str(const std::string& s, Allocator& alloc) {
    Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

Value count(std::size_t n) {
    return Value(static_cast<std::uint64_t>(n));
}

// ----------------------------------------------------------------------------
// Текст
// ----------------------------------------------------------------------------

std::string group_cell(const std::string& name, const std::string& id) {
    return name + " (" + id + ")";
}

/// "22/tcp <- 0.0.0.0/0; All Ports/All <- 10.0.0.0/8"
std::string ingress_cell(const std::vector<audit::IngressRow>& rows) {
    if (rows.empty()) {
        return "-";
    }
    std::string out;
    for (const auto& row : rows) {
        if (!out.empty()) {
            out += "; ";
        }
        out += row.port + "/" + row.protocol + " <- " + row.source;
    }
    return out;
}

std::string section_title(const std::string& title, std::size_t n) {
    return title + " (" + std::to_string(n) + ")";
}

std::string findings_table(const std::vector<audit::Finding>& findings, std::size_t width) {
    output::Table table;
    table.set_max_column_width(width);
    table.set_headers({"Type", "Region", "Group", "Rule", "Attached", "Recommendation"});
    for (const auto& f : findings) {
        table.add_row({f.type, f.region, group_cell(f.group_name, f.group_id),
                       f.rule.value_or("-"), std::to_string(f.attached_count),
                       f.recommendation});
    }
    return table.to_string();
}

std::string groups_table(const std::vector<audit::GroupSummary>& groups, std::size_t width) {
    output::Table table;
    table.set_max_column_width(width);
    table.set_headers({"Group ID", "Name", "Region", "VPC", "Attached", "Ingress Rules"});
    for (const auto& g : groups) {
        table.add_row({g.group_id, g.group_name, g.region, g.vpc_id,
                       std::to_string(g.attached_count), ingress_cell(g.ingress_rules)});
    }
    return table.to_string();
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

Value finding_json(const audit::Finding& f, Allocator& alloc) {
    Value obj(rapidjson::kObjectType);
    obj.AddMember("type", str(f.type, alloc), alloc);
    obj.AddMember("severity", str(audit::severity_label(f.severity), alloc), alloc);
    obj.AddMember("region", str(f.region, alloc), alloc);
    obj.AddMember("group_id", str(f.group_id, alloc), alloc);
    obj.AddMember("group_name", str(f.group_name, alloc), alloc);
    obj.AddMember("vpc_id", str(f.vpc_id, alloc), alloc);
    if (f.rule) {
        obj.AddMember("rule", str(*f.rule, alloc), alloc);
    } else {
        obj.AddMember("rule", Value(rapidjson::kNullType), alloc);
    }
    obj.AddMember("description", str(f.description, alloc), alloc);
    obj.AddMember("attached_resources", count(f.attached_count), alloc);

    Value attachments(rapidjson::kArrayType);
    for (const auto& a : f.attachments) {
        Value item(rapidjson::kObjectType);
        item.AddMember("interface_id", str(a.interface_id, alloc), alloc);
        item.AddMember("description", str(a.description, alloc), alloc);
        item.AddMember("private_ip", str(a.private_ip, alloc), alloc);
        attachments.PushBack(item, alloc);
    }
    obj.AddMember("attachments", attachments, alloc);
    obj.AddMember("recommendation", str(f.recommendation, alloc), alloc);
    return obj;
}

Value group_json(const audit::GroupSummary& g, Allocator& alloc) {
    Value obj(rapidjson::kObjectType);
    obj.AddMember("group_id", str(g.group_id, alloc), alloc);
    obj.AddMember("group_name", str(g.group_name, alloc), alloc);
    obj.AddMember("region", str(g.region, alloc), alloc);
    obj.AddMember("vpc_id", str(g.vpc_id, alloc), alloc);
    obj.AddMember("attached_resources", count(g.attached_count), alloc);
    obj.AddMember("is_used", g.is_used, alloc);

    Value rules(rapidjson::kArrayType);
    for (const auto& row : g.ingress_rules) {
        Value item(rapidjson::kObjectType);
        item.AddMember("port", str(row.port, alloc), alloc);
        item.AddMember("protocol", str(row.protocol, alloc), alloc);
        item.AddMember("source", str(row.source, alloc), alloc);
        rules.PushBack(item, alloc);
    }
    obj.AddMember("ingress_rules", rules, alloc);
    return obj;
}

Value groups_json(const std::vector<audit::GroupSummary>& groups, Allocator& alloc) {
    Value arr(rapidjson::kArrayType);
    for (const auto& g : groups) {
        arr.PushBack(group_json(g, alloc), alloc);
    }
    return arr;
}

}  // namespace

bool ReportOptions::level_enabled(audit::Severity s) const {
    return levels.empty() || std::find(levels.begin(), levels.end(), s) != levels.end();
}

std::string scan_date(const io::Inventory& inventory) {
    if (inventory.scan_time) {
        return inventory.scan_time->to_display();
    }
    return inventory.scan_timestamp.empty() ? std::string(io::NOT_AVAILABLE)
                                            : inventory.scan_timestamp;
}

// ============================================================================
// render_text
// ============================================================================

std::string render_text(const io::Inventory& inventory, const audit::AnalysisResult& result,
                        const ReportOptions& options) {
    const std::size_t width = options.full ? 0 : DEFAULT_COLUMN_WIDTH;
    std::string out;

    out += "Security Group Audit Report\n";
    out += "Account: " + inventory.account_id + " (" + inventory.account_alias + ")\n";
    out += "Scan date: " + scan_date(inventory) + "\n";
    out += "Regions: " + std::to_string(inventory.regions.size()) + "\n\n";

    output::Table summary;
    summary.set_headers({"Metric", "Value"});
    summary.add_row({"Total Security Groups", std::to_string(result.stats.total_groups)});
    summary.add_row({"Unused Security Groups", std::to_string(result.stats.unused_groups)});
    summary.add_row({"Risky Rules", std::to_string(result.stats.risky_rules)});
    for (auto s : audit::ALL_SEVERITIES) {
        summary.add_row({audit::severity_label(s) + " Findings", std::to_string(result.count(s))});
    }
    out += summary.to_string();

    for (auto s : audit::ALL_SEVERITIES) {
        const auto& bucket = result.bucket(s);
        if (bucket.empty() || !options.level_enabled(s)) {
            continue;
        }
        out += "\n";
        out += section_title(audit::severity_label(s) + " Findings", bucket.size()) + "\n";
        out += findings_table(bucket, width);
    }

    if (!result.used_groups.empty()) {
        out += "\n";
        out += section_title("Used Security Groups", result.used_groups.size()) + "\n";
        out += groups_table(result.used_groups, width);
    }
    if (!result.unused_groups.empty()) {
        out += "\n";
        out += section_title("Unused Security Groups", result.unused_groups.size()) + "\n";
        out += groups_table(result.unused_groups, width);
    }

    return out;
}

// ============================================================================
// render_json
// ============================================================================

rapidjson::Document render_json(const io::Inventory& inventory,
                                const audit::AnalysisResult& result,
                                const ReportOptions& options) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("account_id", str(inventory.account_id, alloc), alloc);
    doc.AddMember("account_alias", str(inventory.account_alias, alloc), alloc);
    doc.AddMember("scan_timestamp", str(inventory.scan_timestamp, alloc), alloc);
    doc.AddMember("scan_date", str(scan_date(inventory), alloc), alloc);
    doc.AddMember("total_regions", count(inventory.regions.size()), alloc);

    Value stats(rapidjson::kObjectType);
    stats.AddMember("total_groups", count(result.stats.total_groups), alloc);
    stats.AddMember("unused_groups", count(result.stats.unused_groups), alloc);
    stats.AddMember("risky_rules", count(result.stats.risky_rules), alloc);
    doc.AddMember("stats", stats, alloc);

    Value counts(rapidjson::kObjectType);
    Value findings(rapidjson::kObjectType);
    for (auto s : audit::ALL_SEVERITIES) {
        const std::string key = audit::to_string(s);
        counts.AddMember(str(key, alloc), count(result.count(s)), alloc);

        Value bucket(rapidjson::kArrayType);
        if (options.level_enabled(s)) {
            for (const auto& f : result.bucket(s)) {
                bucket.PushBack(finding_json(f, alloc), alloc);
            }
        }
        findings.AddMember(str(key, alloc), bucket, alloc);
    }
    doc.AddMember("severity_counts", counts, alloc);
    doc.AddMember("findings", findings, alloc);

    doc.AddMember("used_security_groups", groups_json(result.used_groups, alloc), alloc);
    doc.AddMember("unused_security_groups", groups_json(result.unused_groups, alloc), alloc);

    return doc;
}

}  // namespace sgaudit::report
