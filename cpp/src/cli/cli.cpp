// ==============================================================================
// cli.cpp - Парсинг командной строки
// ==============================================================================

#include "sgaudit/cli.hpp"

#include "sgaudit/classify.hpp"
#include "sgaudit/platform.hpp"

#include <cstring>
#include <stdexcept>
#include <utility>

namespace sgaudit::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

ParseResult usage_error(ParseResult result, const std::string& message) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = "error: " + message +
                                       "\n\n"
                                       "Usage: sgaudit [OPTIONS] <COMMAND>\n\n"
                                       "For more information, try '--help'.\n";
    return result;
}

std::string missing_value(const char* option) {
    return std::string("a value is required for '") + option + "' but none was supplied";
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("sgaudit ") + VERSION + " (" + platform::os_name() + ")\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: sgaudit [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  audit    Classify security group exposure and print a report\n"
               "  check    Validate an inventory document without classifying it\n"
               "  help     Print this message or the help of the given subcommand\n"
               "  version  Print version\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -v...            Print verbose output\n"
               "  -q               Suppress informational output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Audit every region of an inventory:\n"
               "        ./sgaudit audit sg_data.json\n"
               "\n"
               "    Only critical and high findings for one region, as JSON:\n"
               "        ./sgaudit audit sg_data.json --region us-east-1 --level critical "
               "--level high --json\n";
    } else if (*command == "audit") {
        return "Classify security group exposure and print a report\n"
               "\n"
               "Usage: sgaudit audit [OPTIONS] <INPUT>\n"
               "\n"
               "Arguments:\n"
               "  <INPUT>  Inventory document (JSON)\n"
               "\n"
               "Options:\n"
               "  -j, --json               Output as JSON\n"
               "  -o, --output <OUTPUT>    Save the report to a file\n"
               "  -c, --config <CONFIG>    Audit profile (YAML)\n"
               "      --region <REGION>    Only analyse this region (repeatable)\n"
               "      --level <LEVEL>      Only report this level: critical, high, medium, "
               "low or info (repeatable)\n"
               "  -F, --full               Do not truncate table cells\n"
               "  -h, --help               Print help\n";
    } else if (*command == "check") {
        return "Validate an inventory document without classifying it\n"
               "\n"
               "Usage: sgaudit check <INPUT>\n"
               "\n"
               "Arguments:\n"
               "  <INPUT>  Inventory document (JSON)\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found");
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "audit")) {
        AuditCommand audit_cmd;
        bool have_input = false;

        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"audit"};
                return result;
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                audit_cmd.overrides.json = true;
            } else if (str_eq(arg, "-F") || str_eq(arg, "--full")) {
                audit_cmd.overrides.full = true;
            } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
                if (i + 1 >= argc) {
                    return usage_error(result, missing_value("--output <OUTPUT>"));
                }
                audit_cmd.overrides.output_path = platform::path_from_utf8(argv[++i]);
            } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
                if (i + 1 >= argc) {
                    return usage_error(result, missing_value("--config <CONFIG>"));
                }
                audit_cmd.config = platform::path_from_utf8(argv[++i]);
            } else if (str_eq(arg, "--region")) {
                if (i + 1 >= argc) {
                    return usage_error(result, missing_value("--region <REGION>"));
                }
                audit_cmd.overrides.regions.emplace_back(argv[++i]);
            } else if (str_eq(arg, "--level")) {
                if (i + 1 >= argc) {
                    return usage_error(result, missing_value("--level <LEVEL>"));
                }
                const char* level_val = argv[++i];
                try {
                    audit_cmd.overrides.levels.push_back(audit::parse_severity(level_val));
                } catch (const std::invalid_argument& e) {
                    return usage_error(result, std::string("invalid value '") + level_val +
                                                   "' for '--level <LEVEL>': " + e.what());
                }
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (str_eq(arg, "-v")) {
                result.global.verbose++;
            } else if (arg[0] != '-' && !have_input) {
                audit_cmd.input = platform::path_from_utf8(arg);
                have_input = true;
            } else {
                return usage_error(result, std::string("unexpected argument '") + arg + "' found");
            }
        }

        if (!have_input) {
            return usage_error(result,
                               "the following required arguments were not provided:\n  <INPUT>");
        }

        result.ok = true;
        result.command = std::move(audit_cmd);
    } else if (str_eq(cmd, "check")) {
        CheckCommand check_cmd;
        bool have_input = false;

        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"check"};
                return result;
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (str_eq(arg, "-v")) {
                result.global.verbose++;
            } else if (arg[0] != '-' && !have_input) {
                check_cmd.input = platform::path_from_utf8(arg);
                have_input = true;
            } else {
                return usage_error(result, std::string("unexpected argument '") + arg + "' found");
            }
        }

        if (!have_input) {
            return usage_error(result,
                               "the following required arguments were not provided:\n  <INPUT>");
        }

        result.ok = true;
        result.command = std::move(check_cmd);
    } else if (str_eq(cmd, "help")) {
        HelpCommand help_cmd;
        if (cmd_idx + 1 < argc) {
            const char* target = argv[cmd_idx + 1];
            if (!str_eq(target, "audit") && !str_eq(target, "check")) {
                return usage_error(result,
                                   std::string("unrecognized subcommand '") + target + "'");
            }
            help_cmd.command = target;
        }
        result.ok = true;
        result.command = help_cmd;
    } else if (str_eq(cmd, "version")) {
        result.ok = true;
        result.command = VersionCommand{};
    } else {
        return usage_error(result, std::string("unrecognized subcommand '") + cmd + "'");
    }

    return result;
}

}  // namespace sgaudit::cli
