// ==============================================================================
// analyzer.cpp - Обход security groups и агрегация находок
// ==============================================================================

#include "sgaudit/analyzer.hpp"

#include <algorithm>
#include <utility>

namespace sgaudit::audit {

namespace {

std::vector<Attachment> sample_attachments(const std::vector<Attachment>& all) {
    const auto n = std::min(all.size(), ATTACHMENT_SAMPLE_LIMIT);
    return std::vector<Attachment>(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(n));
}

/// Общая часть находки, привязанная к группе
Finding make_group_finding(const io::SecurityGroup& group, const std::string& region,
                           const std::vector<Attachment>& attached) {
    Finding f;
    f.region = region;
    f.group_id = group.group_id;
    f.group_name = group.group_name;
    f.vpc_id = group.vpc_id;
    f.attached_count = attached.size();
    f.attachments = sample_attachments(attached);
    return f;
}

void check_range(const io::Permission& rule, Direction direction, const io::AddressRange& range,
                 const io::SecurityGroup& group, const std::string& region,
                 const std::vector<Attachment>& attached, Aggregator& aggregator) {
    auto verdict = classify(rule, direction, range.cidr);
    if (!verdict) {
        return;
    }
    if (verdict->risky_rule) {
        aggregator.count_risky_rule();
    }

    Finding f = make_group_finding(group, region, attached);
    f.severity = verdict->severity;
    f.type = std::move(verdict->type);
    f.rule = describe_rule(rule, direction, range.cidr);

    if (direction == Direction::Egress) {
        f.description = EGRESS_DESCRIPTION;
        f.recommendation = EGRESS_RECOMMENDATION;
    } else {
        f.description = range.description.value_or(NO_DESCRIPTION);
        f.recommendation = recommendation(rule.from_port, rule.protocol);
    }

    aggregator.add_finding(std::move(f));
}

void walk_rules(const std::vector<io::Permission>& rules, Direction direction,
                const io::SecurityGroup& group, const std::string& region,
                const std::vector<Attachment>& attached, Aggregator& aggregator) {
    for (const auto& rule : rules) {
        // IPv4 и IPv6 диапазоны проверяются независимо
        for (const auto& range : rule.ipv4_ranges) {
            check_range(rule, direction, range, group, region, attached, aggregator);
        }
        for (const auto& range : rule.ipv6_ranges) {
            check_range(rule, direction, range, group, region, attached, aggregator);
        }
    }
}

GroupSummary summarize(const io::SecurityGroup& group, const std::string& region,
                       std::size_t attached_count) {
    GroupSummary s;
    s.group_id = group.group_id;
    s.group_name = group.group_name;
    s.region = region;
    s.vpc_id = group.vpc_id;
    s.attached_count = attached_count;
    s.is_used = attached_count > 0;

    for (const auto& rule : group.ingress) {
        std::string source;
        auto append = [&source](const std::string& cidr) {
            if (!source.empty()) {
                source += ", ";
            }
            source += cidr;
        };
        for (const auto& range : rule.ipv4_ranges) {
            append(range.cidr);
        }
        for (const auto& range : rule.ipv6_ranges) {
            append(range.cidr);
        }
        if (rule.ipv4_ranges.empty() && rule.ipv6_ranges.empty()) {
            continue;
        }
        s.ingress_rules.push_back(
            IngressRow{port_summary(rule), protocol_display(rule.protocol), std::move(source)});
    }
    return s;
}

}  // namespace

// ============================================================================
// AnalysisResult
// ============================================================================

std::array<std::size_t, SEVERITY_COUNT> AnalysisResult::severity_counts() const {
    std::array<std::size_t, SEVERITY_COUNT> counts{};
    for (std::size_t i = 0; i < SEVERITY_COUNT; ++i) {
        counts[i] = findings[i].size();
    }
    return counts;
}

std::size_t AnalysisResult::total_findings() const {
    std::size_t total = 0;
    for (const auto& b : findings) {
        total += b.size();
    }
    return total;
}

// ============================================================================
// Aggregator
// ============================================================================

void Aggregator::add_finding(Finding finding) {
    result_.findings[severity_index(finding.severity)].push_back(std::move(finding));
}

void Aggregator::add_group_summary(GroupSummary summary) {
    result_.groups.push_back(std::move(summary));
}

AnalysisResult Aggregator::finish() {
    result_.used_groups.clear();
    result_.unused_groups.clear();
    for (const auto& g : result_.groups) {
        if (g.is_used) {
            result_.used_groups.push_back(g);
        } else {
            result_.unused_groups.push_back(g);
        }
    }
    AnalysisResult out = std::move(result_);
    result_ = AnalysisResult{};
    return out;
}

// ============================================================================
// Обход
// ============================================================================

void walk_group(const io::SecurityGroup& group, const std::string& region,
                const AttachmentIndex& index, Aggregator& aggregator) {
    const auto& attached = index.attachments(group.group_id);

    aggregator.count_group();

    if (attached.empty() && group.group_name != DEFAULT_GROUP_NAME) {
        aggregator.count_unused_group();
        Finding f = make_group_finding(group, region, attached);
        f.severity = Severity::Info;
        f.type = finding_type::UNUSED_GROUP;
        f.description = "Security group '" + group.group_name + "' has no attached resources";
        f.recommendation = UNUSED_RECOMMENDATION;
        aggregator.add_finding(std::move(f));
    }

    walk_rules(group.ingress, Direction::Ingress, group, region, attached, aggregator);
    walk_rules(group.egress, Direction::Egress, group, region, attached, aggregator);

    aggregator.add_group_summary(summarize(group, region, attached.size()));
}

void walk_region(const io::Region& region, Aggregator& aggregator) {
    const auto index = AttachmentIndex::build(region.network_interfaces);
    for (const auto& group : region.security_groups) {
        walk_group(group, region.name, index, aggregator);
    }
}

AnalysisResult analyze(const io::Inventory& inventory) {
    Aggregator aggregator;
    for (const auto& region : inventory.regions) {
        walk_region(region, aggregator);
    }
    return aggregator.finish();
}

}  // namespace sgaudit::audit
