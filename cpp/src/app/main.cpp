// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code: 0 успех, 1 ошибка, 2 ошибка использования, 130 прервано
//
// Исключения перехватываются только на границе app.
//
// ==============================================================================

#include "salvage/classifier.hpp"
#include "salvage/cli.hpp"
#include "salvage/config.hpp"
#include "salvage/output.hpp"
#include "salvage/pipeline.hpp"
#include "salvage/platform.hpp"
#include "salvage/report.hpp"
#include "salvage/scheduler.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <rapidjson/document.h>
#include <system_error>
#include <type_traits>
#include <variant>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_RUNTIME_ERROR = 1;
constexpr int EXIT_INTERRUPTED = 130;

// ----------------------------------------------------------------------------
// ASCII Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
    ███████╗ █████╗ ██╗    ██╗   ██╗ █████╗  ██████╗ ███████╗
    ██╔════╝██╔══██╗██║    ██║   ██║██╔══██╗██╔════╝ ██╔════╝
    ███████╗███████║██║    ██║   ██║███████║██║  ███╗█████╗
    ╚════██║██╔══██║██║    ╚██╗ ██╔╝██╔══██║██║   ██║██╔══╝
    ███████║██║  ██║███████╗╚████╔╝ ██║  ██║╚██████╔╝███████╗
    ╚══════╝╚═╝  ╚═╝╚══════╝ ╚═══╝  ╚═╝  ╚═╝ ╚═════╝ ╚══════╝
)";

void print_banner(salvage::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(salvage::output::Stream::Stderr, BANNER);
    writer.write_line(salvage::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Прерывание (SIGINT)
// ----------------------------------------------------------------------------

salvage::scan::CancellationToken g_cancel;

void on_interrupt(int) {
    g_cancel.cancel();
}

void install_interrupt_handler() {
    std::signal(SIGINT, on_interrupt);
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += items[i];
    }
    return out;
}

// ----------------------------------------------------------------------------
// scan
// ----------------------------------------------------------------------------

/// Собрать конфигурацию: YAML-файл, затем аргументы командной строки поверх
bool build_config(const salvage::cli::ScanCommand& cmd, const salvage::cli::GlobalOptions& global,
                  salvage::config::ScanConfig& cfg, salvage::output::Writer& writer) {
    using namespace salvage;

    if (cmd.config.has_value()) {
        writer.debug("Loading config from " + platform::path_to_utf8(*cmd.config));
        if (auto loaded = config::load_file(*cmd.config, cfg); !loaded) {
            writer.error(loaded.error);
            return false;
        }
    }

    cfg.scan_root = cmd.scan_root;
    cfg.output_root = cmd.output_root;
    cfg.keywords.insert(cfg.keywords.end(), cmd.keywords.begin(), cmd.keywords.end());
    cfg.excludes.insert(cfg.excludes.end(), cmd.excludes.begin(), cmd.excludes.end());
    cfg.verify_headers = cfg.verify_headers || cmd.verify_headers;
    cfg.dry_run = cmd.dry_run;

    if (cmd.no_parallel) {
        cfg.workers = 1;
    } else if (global.num_threads > 0) {
        cfg.workers = global.num_threads;
    }

    if (auto valid = config::validate(cfg); !valid) {
        writer.error(valid.error);
        return false;
    }
    return true;
}

int run_scan(const salvage::cli::ScanCommand& cmd, const salvage::cli::GlobalOptions& global,
             salvage::output::Writer& writer) {
    using namespace salvage;

    config::ScanConfig cfg;
    if (!build_config(cmd, global, cfg, writer)) {
        return EXIT_RUNTIME_ERROR;
    }

    writer.info("Scanning " + platform::path_to_utf8(cfg.scan_root) + " into " +
                platform::path_to_utf8(cfg.output_root) +
                (cfg.dry_run ? " (dry run)" : ""));
    if (!cfg.keywords.empty()) {
        writer.info("Keywords: " + join(classify::KeywordSet(cfg.keywords).words(), ", "));
    }
    if (writer.has_output_file()) {
        writer.info("Writing report to " + platform::path_to_utf8(*writer.config().output_path));
    }
    writer.debug("Platform: " + platform::os_name() + ", workers: " +
                 std::to_string(scan::resolve_worker_count(cfg.workers)));

    install_interrupt_handler();

    output::ConsoleSink sink(writer);
    scan::RunReport report = scan::run_recovery(cfg, &sink, &g_cancel);
    writer.progress_end();

    const output::Format format = writer.config().format;

    if (format == output::Format::Json) {
        rapidjson::Document doc;
        output::report_to_json(report, doc);
        writer.write_json_pretty(doc);
    } else if (format == output::Format::Jsonl) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& alloc = doc.GetAllocator();
        doc.AddMember("event", "summary", alloc);
        doc.AddMember("outcome",
                      rapidjson::StringRef(scan::run_outcome_to_string(report.outcome)), alloc);
        rapidjson::Value progress;
        output::progress_to_json(report.progress, progress, alloc);
        doc.AddMember("progress", progress, alloc);
        writer.write_json_line(doc);
    }

    if (report.outcome == scan::RunOutcome::Fatal) {
        writer.error(report.fatal_error);
        return EXIT_RUNTIME_ERROR;
    }

    if (format == output::Format::Std) {
        output::summary_table(report).print(writer);
    }
    writer.info(output::summary_line(report));

    if (report.progress.total_errors() > 0) {
        writer.warn(std::to_string(report.progress.total_errors()) +
                    " error(s) occurred; affected entries were skipped");
    }

    if (report.cancelled) {
        writer.warn("Interrupted; output directory contains only completed copies");
        return EXIT_INTERRUPTED;
    }
    return EXIT_OK;
}

// ----------------------------------------------------------------------------
// classify
// ----------------------------------------------------------------------------

int run_classify(const salvage::cli::ClassifyCommand& cmd, salvage::output::Writer& writer) {
    using namespace salvage;

    classify::ClassifierRules rules;
    rules.verify_headers = true;
    const classify::FileClassifier classifier(rules, classify::KeywordSet(cmd.keywords));

    for (const auto& path : cmd.paths) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            writer.warn("Not a regular file: " + platform::path_to_utf8(path));
            continue;
        }

        classify::Inspection ins = classifier.inspect(path);
        if (ins.header_error.has_value()) {
            writer.warn("Could not read header of " + platform::path_to_utf8(path) + " - " +
                        ins.header_error->message());
        }

        if (cmd.json) {
            rapidjson::Document doc;
            output::classification_to_json(ins.result, doc, doc.GetAllocator());
            writer.write_json_line(doc);
        } else {
            std::string line = platform::path_to_utf8(path) + ": " +
                               classify::kind_to_string(ins.result.kind);
            if (ins.result.matched()) {
                line += std::string(" (") + classify::basis_to_string(ins.result.basis) + ")";
            }
            writer.write_line(output::Stream::Stdout, line);
        }
    }
    return EXIT_OK;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace salvage;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    if (const auto* scan_cmd = std::get_if<cli::ScanCommand>(&parse_result.command)) {
        if (scan_cmd->json) {
            out_cfg.format = output::Format::Json;
        } else if (scan_cmd->jsonl) {
            out_cfg.format = output::Format::Jsonl;
        }
        out_cfg.output_path = scan_cmd->output;
    }
    output::Writer writer(out_cfg);

    // Сообщение парсера печатается как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    if (out_cfg.output_path.has_value() && !writer.has_output_file()) {
        writer.error("cannot open output file: " + platform::path_to_utf8(*out_cfg.output_path));
        return EXIT_RUNTIME_ERROR;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return EXIT_OK;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return EXIT_OK;
            } else if constexpr (std::is_same_v<T, cli::ScanCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_scan(cmd, parse_result.global, writer);
            } else if constexpr (std::is_same_v<T, cli::ClassifyCommand>) {
                return run_classify(cmd, writer);
            } else {
                return EXIT_RUNTIME_ERROR;
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
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return EXIT_RUNTIME_ERROR;
    }
}
