// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "sgaudit/cli.hpp"
#include "sgaudit/platform.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sgaudit::cli::test {

using audit::Severity;

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

// ==============================================================================
// Справка и версия
// ==============================================================================

TEST(CliTest, Parse_NoArgs_PrintsHelpWithExitCode2) {
    // Arrange
    Args args{"sgaudit"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: sgaudit [OPTIONS] <COMMAND>"),
              std::string::npos);
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    for (const char* flag : {"-h", "--help"}) {
        Args args{"sgaudit", flag};

        ParseResult result = parse(args.argc(), args.argv());

        EXPECT_TRUE(result.ok);
        ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
        EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
    }
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    for (const char* flag : {"-V", "--version", "version"}) {
        Args args{"sgaudit", flag};

        ParseResult result = parse(args.argc(), args.argv());

        EXPECT_TRUE(result.ok) << flag;
        EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command)) << flag;
    }
}

TEST(CliTest, Parse_OnlyGlobalOptions_ReturnsHelp) {
    Args args{"sgaudit", "--no-banner"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, Parse_HelpSubcommand_WithTarget) {
    Args args{"sgaudit", "help", "audit"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("audit"));
}

TEST(CliTest, Parse_HelpSubcommand_UnknownTarget_UsageError) {
    Args args{"sgaudit", "help", "scan"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unrecognized subcommand 'scan'\n\n"
              "Usage: sgaudit [OPTIONS] <COMMAND>\n\n"
              "For more information, try '--help'.\n");
}

TEST(CliTest, Parse_HelpSubcommand_CheckTarget) {
    Args args{"sgaudit", "help", "check"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("check"));
}

TEST(CliTest, RenderVersion_ContainsVersionAndOs) {
    std::string version = render_version();

    EXPECT_EQ(version, std::string("sgaudit 1.0.0 (") + platform::os_name() + ")\n");
}

TEST(CliTest, RenderHelp_General) {
    std::string help = render_help();

    EXPECT_EQ(help.rfind(ABOUT, 0), 0u);
    EXPECT_NE(help.find("  audit "), std::string::npos);
    EXPECT_NE(help.find("  check "), std::string::npos);
    EXPECT_NE(help.find("--no-banner"), std::string::npos);
}

TEST(CliTest, RenderHelp_Subcommands) {
    EXPECT_NE(render_help(std::string("audit")).find("Usage: sgaudit audit [OPTIONS] <INPUT>"),
              std::string::npos);
    EXPECT_NE(render_help(std::string("audit")).find("--level <LEVEL>"), std::string::npos);
    EXPECT_NE(render_help(std::string("check")).find("Usage: sgaudit check <INPUT>"),
              std::string::npos);
}

TEST(CliTest, RenderHelp_UnknownSubcommand) {
    EXPECT_EQ(render_help(std::string("scan")), "error: unrecognized subcommand 'scan'\n");
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptions_BeforeSubcommand) {
    Args args{"sgaudit", "--no-banner", "-v", "-v", "-q", "check", "inv.json"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_TRUE(result.global.quiet);
}

TEST(CliTest, Parse_UnknownGlobalFlag_UsageError) {
    Args args{"sgaudit", "--colour", "audit", "inv.json"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unexpected argument '--colour' found\n\n"
              "Usage: sgaudit [OPTIONS] <COMMAND>\n\n"
              "For more information, try '--help'.\n");
}

TEST(CliTest, Parse_UnknownSubcommand_UsageError) {
    Args args{"sgaudit", "scan", "inv.json"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: unrecognized subcommand 'scan'", 0),
              0u);
}

// ==============================================================================
// audit
// ==============================================================================

TEST(CliTest, Parse_Audit_Minimal) {
    // Arrange
    Args args{"sgaudit", "audit", "sg_data.json"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<AuditCommand>(result.command));
    const auto& cmd = std::get<AuditCommand>(result.command);
    EXPECT_EQ(cmd.input, std::filesystem::path("sg_data.json"));
    EXPECT_FALSE(cmd.config.has_value());
    EXPECT_TRUE(cmd.overrides.regions.empty());
    EXPECT_TRUE(cmd.overrides.levels.empty());
    EXPECT_FALSE(cmd.overrides.json);
    EXPECT_FALSE(cmd.overrides.full);
    EXPECT_FALSE(cmd.overrides.output_path.has_value());
}

TEST(CliTest, Parse_Audit_AllOptions) {
    Args args{"sgaudit", "audit",      "--region", "us-east-1", "--region",  "eu-west-1",
              "--level", "critical",   "--level",  "HIGH",      "-j",        "-F",
              "-o",      "out.json",   "-c",       "prof.yaml", "inv.json",  "-q"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<AuditCommand>(result.command);
    EXPECT_EQ(cmd.input, std::filesystem::path("inv.json"));
    EXPECT_EQ(cmd.overrides.regions, (std::vector<std::string>{"us-east-1", "eu-west-1"}));
    EXPECT_EQ(cmd.overrides.levels, (std::vector<Severity>{Severity::Critical, Severity::High}));
    EXPECT_TRUE(cmd.overrides.json);
    EXPECT_TRUE(cmd.overrides.full);
    EXPECT_EQ(cmd.overrides.output_path, std::filesystem::path("out.json"));
    EXPECT_EQ(cmd.config, std::filesystem::path("prof.yaml"));
    EXPECT_TRUE(result.global.quiet);
}

TEST(CliTest, Parse_Audit_LongOptions) {
    Args args{"sgaudit", "audit", "--json", "--full", "--output", "r.json", "--config",
              "p.yaml",  "inv.json"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<AuditCommand>(result.command);
    EXPECT_TRUE(cmd.overrides.json);
    EXPECT_TRUE(cmd.overrides.full);
    EXPECT_EQ(cmd.overrides.output_path, std::filesystem::path("r.json"));
    EXPECT_EQ(cmd.config, std::filesystem::path("p.yaml"));
}

TEST(CliTest, Parse_Audit_Help) {
    Args args{"sgaudit", "audit", "--help"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("audit"));
}

TEST(CliTest, Parse_Audit_MissingInput) {
    Args args{"sgaudit", "audit", "--json"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find(
                  "the following required arguments were not provided:\n  <INPUT>"),
              std::string::npos);
}

TEST(CliTest, Parse_Audit_MissingOptionValue) {
    Args args{"sgaudit", "audit", "inv.json", "--output"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find(
                  "a value is required for '--output <OUTPUT>' but none was supplied"),
              std::string::npos);
}

TEST(CliTest, Parse_Audit_InvalidLevel) {
    Args args{"sgaudit", "audit", "inv.json", "--level", "severe"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find(
                  "invalid value 'severe' for '--level <LEVEL>': unknown level"),
              std::string::npos);
}

TEST(CliTest, Parse_Audit_SecondPositional_UsageError) {
    Args args{"sgaudit", "audit", "a.json", "b.json"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument 'b.json' found"),
              std::string::npos);
}

TEST(CliTest, Parse_Audit_UnknownFlag_UsageError) {
    Args args{"sgaudit", "audit", "inv.json", "--timezone", "UTC"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--timezone' found"),
              std::string::npos);
}

// ==============================================================================
// check
// ==============================================================================

TEST(CliTest, Parse_Check_Input) {
    Args args{"sgaudit", "check", "-v", "inv.json"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<CheckCommand>(result.command));
    EXPECT_EQ(std::get<CheckCommand>(result.command).input, std::filesystem::path("inv.json"));
    EXPECT_EQ(result.global.verbose, 1);
}

TEST(CliTest, Parse_Check_RejectsAuditOptions) {
    Args args{"sgaudit", "check", "inv.json", "--json"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--json' found"),
              std::string::npos);
}

TEST(CliTest, Parse_Check_MissingInput) {
    Args args{"sgaudit", "check"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("<INPUT>"), std::string::npos);
}

}  // namespace sgaudit::cli::test
