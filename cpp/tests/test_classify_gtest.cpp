// ==============================================================================
// test_classify_gtest.cpp - Тесты классификации правил (GoogleTest)
// ==============================================================================

#include "sgaudit/classify.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sgaudit::audit::test {

namespace {

const std::vector<std::int64_t> CRITICAL = {22, 23, 3389, 1433, 3306, 5432, 6379, 27017, 9200};

std::optional<Classification> ingress(std::optional<std::int64_t> from,
                                      std::optional<std::int64_t> to, const char* protocol,
                                      const char* cidr = "0.0.0.0/0") {
    return classify(from, to, protocol, Direction::Ingress, cidr);
}

io::Permission rule(const char* protocol, std::optional<std::int64_t> from,
                    std::optional<std::int64_t> to) {
    io::Permission p;
    p.protocol = protocol;
    p.from_port = from;
    p.to_port = to;
    return p;
}

}  // namespace

// ==============================================================================
// Severity / Direction
// ==============================================================================

TEST(SeverityTest, ToString_LowercaseBucketKeys) {
    EXPECT_EQ(to_string(Severity::Critical), "critical");
    EXPECT_EQ(to_string(Severity::High), "high");
    EXPECT_EQ(to_string(Severity::Medium), "medium");
    EXPECT_EQ(to_string(Severity::Low), "low");
    EXPECT_EQ(to_string(Severity::Info), "info");
}

TEST(SeverityTest, Label_Uppercase) {
    EXPECT_EQ(severity_label(Severity::Critical), "CRITICAL");
    EXPECT_EQ(severity_label(Severity::Info), "INFO");
}

TEST(SeverityTest, Parse_CaseInsensitive) {
    EXPECT_EQ(parse_severity("critical"), Severity::Critical);
    EXPECT_EQ(parse_severity("HIGH"), Severity::High);
    EXPECT_EQ(parse_severity("Medium"), Severity::Medium);
    EXPECT_EQ(parse_severity("low"), Severity::Low);
    EXPECT_EQ(parse_severity("info"), Severity::Info);
}

TEST(SeverityTest, Parse_UnknownThrows) {
    EXPECT_THROW(parse_severity("severe"), std::invalid_argument);
    EXPECT_THROW(parse_severity(""), std::invalid_argument);
}

TEST(SeverityTest, OrderedByRisk) {
    EXPECT_EQ(severity_index(Severity::Critical), 0u);
    EXPECT_EQ(severity_index(Severity::Info), 4u);
    EXPECT_EQ(ALL_SEVERITIES[1], Severity::High);
}

TEST(DirectionTest, ToString) {
    EXPECT_EQ(to_string(Direction::Ingress), "INGRESS");
    EXPECT_EQ(to_string(Direction::Egress), "EGRESS");
}

// ==============================================================================
// Таблицы портов
// ==============================================================================

TEST(PortTableTest, CriticalPorts) {
    for (auto port : CRITICAL) {
        EXPECT_TRUE(is_critical_port(port)) << port;
    }
    EXPECT_FALSE(is_critical_port(80));
    EXPECT_FALSE(is_critical_port(5900));
}

TEST(PortTableTest, ManagementPorts) {
    for (std::int64_t port : {22, 3389, 5900, 5985, 5986}) {
        EXPECT_TRUE(is_management_port(port)) << port;
    }
    EXPECT_FALSE(is_management_port(23));
}

TEST(PortTableTest, RiskyPortNames) {
    EXPECT_EQ(risky_port_name(22), "SSH");
    EXPECT_EQ(risky_port_name(3389), "RDP");
    EXPECT_EQ(risky_port_name(3306), "MySQL");
    EXPECT_EQ(risky_port_name(138), "NetBIOS");
    EXPECT_EQ(risky_port_name(1434), "SQL Server");
    EXPECT_EQ(risky_port_name(8443), "HTTPS Alt");
    EXPECT_EQ(risky_port_name(27017), "MongoDB");
    EXPECT_FALSE(risky_port_name(8000).has_value());
    EXPECT_FALSE(risky_port_name(-1).has_value());
}

TEST(PortTableTest, PublicCidr_ExactOnly) {
    EXPECT_TRUE(is_public_cidr("0.0.0.0/0"));
    EXPECT_TRUE(is_public_cidr("::/0"));
    EXPECT_FALSE(is_public_cidr("0.0.0.0/1"));
    EXPECT_FALSE(is_public_cidr("10.0.0.0/8"));
    EXPECT_FALSE(is_public_cidr("::/1"));
    EXPECT_FALSE(is_public_cidr(" 0.0.0.0/0"));
    EXPECT_FALSE(is_public_cidr(""));
}

// ==============================================================================
// Только публичные диапазоны дают находку
// ==============================================================================

TEST(ClassifyTest, NonPublicRange_NoFinding) {
    for (const char* cidr : {"10.0.0.0/8", "192.168.1.0/24", "0.0.0.0/1", "2001:db8::/32"}) {
        EXPECT_FALSE(ingress(22, 22, "tcp", cidr).has_value()) << cidr;
        EXPECT_FALSE(ingress(std::nullopt, std::nullopt, io::PROTOCOL_ALL, cidr).has_value());
        EXPECT_FALSE(
            classify(std::nullopt, std::nullopt, io::PROTOCOL_ALL, Direction::Egress, cidr)
                .has_value());
    }
}

// ==============================================================================
// Ingress
// ==============================================================================

TEST(ClassifyTest, CriticalPorts_AlwaysCritical) {
    for (auto port : CRITICAL) {
        for (const char* proto : {"tcp", "udp"}) {
            auto c = ingress(port, port, proto);
            ASSERT_TRUE(c.has_value());
            EXPECT_EQ(c->severity, Severity::Critical) << port;
            EXPECT_EQ(c->type, finding_type::CRITICAL_PORT);
            EXPECT_TRUE(c->risky_rule);
        }
    }
}

TEST(ClassifyTest, CriticalPort_AsUpperBound) {
    auto c = ingress(20, 22, "tcp");

    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->severity, Severity::Critical);
}

TEST(ClassifyTest, ManagementPort_High) {
    for (std::int64_t port : {5900, 5985, 5986}) {
        auto c = ingress(port, port, "tcp");
        ASSERT_TRUE(c.has_value());
        EXPECT_EQ(c->severity, Severity::High) << port;
        EXPECT_EQ(c->type, finding_type::MANAGEMENT_PORT);
    }
}

TEST(ClassifyTest, RiskyPort_High) {
    for (std::int64_t port : {20, 21, 25, 53, 80, 135, 139, 443, 445, 1434, 8080, 8443}) {
        auto c = ingress(port, port, "tcp");
        ASSERT_TRUE(c.has_value());
        EXPECT_EQ(c->severity, Severity::High) << port;
        EXPECT_EQ(c->type, finding_type::RISKY_PORT);
    }
}

TEST(ClassifyTest, UnlistedPort_Medium) {
    auto c = ingress(8000, 8100, "tcp");

    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->severity, Severity::Medium);
    EXPECT_EQ(c->type, finding_type::EXPOSED_PORT);
    EXPECT_TRUE(c->risky_rule);
}

TEST(ClassifyTest, RangeContainingCriticalPort_OnlyBoundsChecked) {
    // 22 внутри 1-65535, но проверяются только границы
    auto c = ingress(1, 65535, "tcp");

    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->severity, Severity::Medium);
}

TEST(ClassifyTest, MissingFromPort_SkipsPortTiers) {
    auto c = ingress(std::nullopt, 22, "tcp");

    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->severity, Severity::Medium);
    EXPECT_EQ(c->type, finding_type::EXPOSED_PORT);
}

TEST(ClassifyTest, AllProtocols_OverridesPortTiers) {
    for (std::optional<std::int64_t> port : {std::optional<std::int64_t>{}, std::optional<std::int64_t>{22},
                                             std::optional<std::int64_t>{8000}}) {
        for (const char* cidr : {"0.0.0.0/0", "::/0"}) {
            auto c = ingress(port, port, io::PROTOCOL_ALL, cidr);
            ASSERT_TRUE(c.has_value());
            EXPECT_EQ(c->severity, Severity::Critical);
            EXPECT_EQ(c->type, finding_type::ALL_OPEN);
            EXPECT_TRUE(c->risky_rule);
        }
    }
}

TEST(ClassifyTest, Ipv6AnyAddress_IsPublic) {
    auto c = ingress(3389, 3389, "tcp", "::/0");

    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->severity, Severity::Critical);
}

// ==============================================================================
// Egress
// ==============================================================================

TEST(ClassifyTest, Egress_AllProtocols_Low) {
    auto c = classify(std::nullopt, std::nullopt, io::PROTOCOL_ALL, Direction::Egress, "0.0.0.0/0");

    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->severity, Severity::Low);
    EXPECT_EQ(c->type, finding_type::PERMISSIVE_EGRESS);
    EXPECT_FALSE(c->risky_rule);
}

TEST(ClassifyTest, Egress_SpecificProtocol_Ignored) {
    EXPECT_FALSE(classify(443, 443, "tcp", Direction::Egress, "0.0.0.0/0").has_value());
    EXPECT_FALSE(classify(22, 22, "tcp", Direction::Egress, "::/0").has_value());
}

// ==============================================================================
// Рекомендации
// ==============================================================================

TEST(RecommendationTest, AllProtocols_Urgent) {
    EXPECT_EQ(recommendation(22, io::PROTOCOL_ALL),
              "URGENT: Restrict to specific protocols and ports. Use VPN or bastion host for "
              "management access.");
    EXPECT_EQ(recommendation(std::nullopt, io::PROTOCOL_ALL), recommendation(22, io::PROTOCOL_ALL));
}

TEST(RecommendationTest, RemoteAccessPorts) {
    const std::string expected =
        "Use AWS Systems Manager Session Manager or VPN instead of direct internet access";
    EXPECT_EQ(recommendation(22, "tcp"), expected);
    EXPECT_EQ(recommendation(3389, "tcp"), expected);
}

TEST(RecommendationTest, DatabasePorts) {
    for (std::int64_t port : {1433, 3306, 5432, 27017, 6379, 9200}) {
        EXPECT_EQ(recommendation(port, "tcp"),
                  "Database should NEVER be exposed to internet. Use VPN, VPC peering, or "
                  "PrivateLink")
            << port;
    }
}

TEST(RecommendationTest, Telnet) {
    EXPECT_EQ(recommendation(23, "tcp"),
              "Telnet is insecure and deprecated. Use SSH instead and restrict access");
}

TEST(RecommendationTest, Fallback) {
    const std::string expected =
        "Restrict source to specific IP addresses or use AWS security services (CloudFront, "
        "ALB, etc.)";
    EXPECT_EQ(recommendation(443, "tcp"), expected);
    EXPECT_EQ(recommendation(std::nullopt, "tcp"), expected);
    EXPECT_EQ(recommendation(1434, "udp"), expected);
}

TEST(RecommendationTest, NeverEmpty) {
    for (std::int64_t port = -1; port < 70000; port += 97) {
        EXPECT_FALSE(recommendation(port, "tcp").empty());
    }
}

// ==============================================================================
// Представление правила
// ==============================================================================

TEST(RuleDisplayTest, PortDisplay) {
    EXPECT_EQ(port_display(rule("tcp", 22, 22)), "Port 22");
    EXPECT_EQ(port_display(rule("tcp", 8000, 8100)), "Ports 8000-8100");
    EXPECT_EQ(port_display(rule(io::PROTOCOL_ALL, 22, 22)), "All Ports");
    EXPECT_EQ(port_display(rule("tcp", std::nullopt, std::nullopt)), "All Ports");
}

TEST(RuleDisplayTest, PortSummary) {
    EXPECT_EQ(port_summary(rule("tcp", 22, 22)), "22");
    EXPECT_EQ(port_summary(rule("udp", 1000, 2000)), "1000-2000");
    EXPECT_EQ(port_summary(rule(io::PROTOCOL_ALL, std::nullopt, std::nullopt)), "All Ports");
}

TEST(RuleDisplayTest, ProtocolDisplay) {
    EXPECT_EQ(protocol_display(io::PROTOCOL_ALL), "All");
    EXPECT_EQ(protocol_display("tcp"), "tcp");
}

TEST(RuleDisplayTest, DescribeRule_IngressWithServiceName) {
    EXPECT_EQ(describe_rule(rule("tcp", 22, 22), Direction::Ingress, "0.0.0.0/0"),
              "INGRESS: Port 22 (SSH) (tcp) -> 0.0.0.0/0");
    EXPECT_EQ(describe_rule(rule("tcp", 8000, 8100), Direction::Ingress, "::/0"),
              "INGRESS: Ports 8000-8100 (tcp) -> ::/0");
}

TEST(RuleDisplayTest, DescribeRule_ServiceNameFromLowerBound) {
    EXPECT_EQ(describe_rule(rule("tcp", 20, 21), Direction::Ingress, "0.0.0.0/0"),
              "INGRESS: Ports 20-21 (FTP Data) (tcp) -> 0.0.0.0/0");
}

TEST(RuleDisplayTest, DescribeRule_AllProtocols) {
    EXPECT_EQ(describe_rule(rule(io::PROTOCOL_ALL, std::nullopt, std::nullopt),
                            Direction::Egress, "0.0.0.0/0"),
              "EGRESS: All Ports (All) -> 0.0.0.0/0");
}

}  // namespace sgaudit::audit::test
