// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды: audit / check / help / version
// 4. Возврат exit code: 0 успех, 1 ошибка выполнения, 2 ошибка использования
//
// Исключения перехватываются только здесь.
//
// ==============================================================================

#include "sgaudit/analyzer.hpp"
#include "sgaudit/cli.hpp"
#include "sgaudit/config.hpp"
#include "sgaudit/inventory.hpp"
#include "sgaudit/output.hpp"
#include "sgaudit/platform.hpp"
#include "sgaudit/report.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
  ███████╗ ██████╗  █████╗ ██╗   ██╗██████╗ ██╗████████╗
  ██╔════╝██╔════╝ ██╔══██╗██║   ██║██╔══██╗██║╚══██╔══╝
  ███████╗██║  ███╗███████║██║   ██║██║  ██║██║   ██║
  ╚════██║██║   ██║██╔══██║██║   ██║██║  ██║██║   ██║
  ███████║╚██████╔╝██║  ██║╚██████╔╝██████╔╝██║   ██║
  ╚══════╝ ╚═════╝ ╚═╝  ╚═╝ ╚═════╝ ╚═════╝ ╚═╝   ╚═╝
)";

void print_banner(sgaudit::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(sgaudit::output::Stream::Stderr, BANNER);
    writer.write_line(sgaudit::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Загрузка инвентаря с выводом предупреждений
// ----------------------------------------------------------------------------

std::optional<sgaudit::io::Inventory> load(const std::filesystem::path& input,
                                           sgaudit::output::Writer& writer) {
    using namespace sgaudit;

    writer.info("Loading inventory from: " + platform::path_to_utf8(input));

    io::LoadResult loaded = io::load_inventory(input);
    if (!loaded) {
        writer.error(loaded.error.format());
        return std::nullopt;
    }
    for (const auto& warning : loaded.warnings) {
        writer.warn(warning);
    }
    return std::move(loaded.inventory);
}

// ----------------------------------------------------------------------------
// audit
// ----------------------------------------------------------------------------

int run_audit(const sgaudit::cli::AuditCommand& cmd, sgaudit::output::Writer& writer) {
    using namespace sgaudit;

    // Профиль + опции командной строки
    config::AuditProfile profile;
    if (cmd.config) {
        config::ProfileResult loaded = config::load_profile(*cmd.config);
        if (!loaded) {
            writer.error(loaded.error.format());
            return 1;
        }
        writer.debug("Loaded audit profile: " + platform::path_to_utf8(*cmd.config));
        profile = std::move(loaded.profile);
    }
    const config::AuditSettings settings = config::merge_settings(profile, cmd.overrides);

    auto inventory = load(cmd.input, writer);
    if (!inventory) {
        return 1;
    }

    if (!settings.regions.empty()) {
        for (const auto& name : settings.regions) {
            const bool found =
                std::any_of(inventory->regions.begin(), inventory->regions.end(),
                            [&name](const io::Region& r) { return r.name == name; });
            if (!found) {
                writer.warn("Region '" + name + "' is not present in the inventory");
            }
        }
        *inventory = io::filter_regions(std::move(*inventory), settings.regions);
    }

    writer.info("Analysing " + std::to_string(inventory->group_count()) +
                " security groups across " + std::to_string(inventory->regions.size()) +
                " regions...");
    for (const auto& region : inventory->regions) {
        writer.debug("Region " + region.name + ": " +
                     std::to_string(region.security_groups.size()) + " security groups, " +
                     std::to_string(region.network_interfaces.size()) + " network interfaces");
    }

    const audit::AnalysisResult result = audit::analyze(*inventory);

    // Отчёт: stdout или файл (--output / output.path)
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (settings.output_path) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = settings.output_path;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("Unable to write to output file '" +
                         platform::path_to_utf8(*settings.output_path) + "'");
            return 1;
        }
        out = file_writer.get();
    }

    report::ReportOptions options;
    options.levels = settings.levels;
    options.full = settings.full;

    if (settings.format == config::OutputFormat::Json) {
        const rapidjson::Document doc = report::render_json(*inventory, result, options);
        out->write_json_pretty(doc);
    } else {
        out->write(output::Stream::Stdout, report::render_text(*inventory, result, options));
    }
    out->flush();

    writer.info("Found " + std::to_string(result.count(audit::Severity::Critical)) +
                " critical, " + std::to_string(result.count(audit::Severity::High)) +
                " high and " + std::to_string(result.count(audit::Severity::Medium)) +
                " medium findings in " + std::to_string(result.stats.total_groups) +
                " security groups (" + std::to_string(result.stats.unused_groups) + " unused)");
    if (file_writer) {
        writer.info("Report written to: " + platform::path_to_utf8(*settings.output_path));
    }
    return 0;
}

// ----------------------------------------------------------------------------
// check
// ----------------------------------------------------------------------------

int run_check(const sgaudit::cli::CheckCommand& cmd, sgaudit::output::Writer& writer) {
    using namespace sgaudit;

    io::LoadResult loaded = io::load_inventory(cmd.input);
    if (!loaded) {
        writer.error(loaded.error.format());
        return 1;
    }
    for (const auto& warning : loaded.warnings) {
        writer.warn(warning);
    }

    const io::Inventory& inv = loaded.inventory;
    writer.info("Inventory is valid: " + std::to_string(inv.regions.size()) + " regions, " +
                std::to_string(inv.group_count()) + " security groups, " +
                std::to_string(inv.interface_count()) + " network interfaces");
    if (loaded.skipped > 0) {
        writer.warn("Skipped " + std::to_string(loaded.skipped) + " malformed records");
    }
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace sgaudit;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // Сообщение парсера выводится как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::AuditCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_audit(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::CheckCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_check(cmd, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
