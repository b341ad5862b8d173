// ==============================================================================
// pipeline.cpp - Конвейер восстановления
// ==============================================================================
//
// Две фазы на одном размере пула:
//   1. Scanning: общий DirectoryEnumerator под мьютексом планировщика,
//      каждый поток классифицирует и копит WorkerBatch
//   2. Copying: отсортированный список совпадений -> планы -> FileCopier
//
// Порядок обработки зависит от числа потоков, итог - нет: совпадения
// сортируются, счётчики складываются.
//
// ==============================================================================

#include "salvage/pipeline.hpp"

#include "salvage/discovery.hpp"
#include "salvage/platform.hpp"

#include <system_error>
#include <vector>

namespace salvage::scan {

namespace {

RunReport fatal(RunReport report, std::string message) {
    report.outcome = RunOutcome::Fatal;
    report.fatal_error = std::move(message);
    return report;
}

std::filesystem::path absolute_normal(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(p, ec);
    if (ec) {
        abs = p;
    }
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

/// Подкаталоги вывода по типам: ProjectFiles, ProjectArchives, KeywordMatches
std::vector<std::filesystem::path> kind_dirs(const std::filesystem::path& output_root) {
    std::vector<std::filesystem::path> dirs;
    for (classify::Kind kind : classify::kRecoverableKinds) {
        dirs.push_back(output_root / classify::kind_subdir(kind));
    }
    return dirs;
}

bool is_cancelled(const CancellationToken* cancel) {
    return cancel != nullptr && cancel->cancelled();
}

}  // namespace

const char* run_outcome_to_string(RunOutcome outcome) {
    switch (outcome) {
    case RunOutcome::Success:
        return "success";
    case RunOutcome::PartialFailure:
        return "partial_failure";
    case RunOutcome::Fatal:
        return "fatal";
    }
    return "fatal";
}

RunReport run_recovery(config::ScanConfig cfg, EventSink* sink, const CancellationToken* cancel) {
    const auto started = std::chrono::steady_clock::now();

    RunReport report;
    report.dry_run = cfg.dry_run;

    if (auto valid = config::validate(cfg); !valid) {
        return fatal(std::move(report), valid.error);
    }

    // ------------------------------------------------------------------------
    // Фатальные проверки корней
    // ------------------------------------------------------------------------

    std::error_code ec;
    auto scan_status = std::filesystem::status(cfg.scan_root, ec);
    if (ec || !std::filesystem::exists(scan_status)) {
        return fatal(std::move(report), "scan root does not exist: " +
                                            platform::path_to_utf8(cfg.scan_root));
    }
    if (!std::filesystem::is_directory(scan_status)) {
        return fatal(std::move(report), "scan root is not a directory: " +
                                            platform::path_to_utf8(cfg.scan_root));
    }

    // Корень не может лежать внутри подкаталогов типов
    const std::filesystem::path scan_abs = absolute_normal(cfg.scan_root);
    for (const auto& dir : kind_dirs(cfg.output_root)) {
        const std::filesystem::path dir_abs = absolute_normal(dir);
        if (scan_abs == dir_abs || !recover::relative_under(scan_abs, dir_abs).empty()) {
            return fatal(std::move(report), "scan root is inside recovered output " +
                                                platform::path_to_utf8(dir));
        }
    }

    auto out_status = std::filesystem::status(cfg.output_root, ec);
    if (!ec && std::filesystem::exists(out_status) &&
        !std::filesystem::is_directory(out_status)) {
        return fatal(std::move(report), "output path exists but is not a directory: " +
                                            platform::path_to_utf8(cfg.output_root));
    }
    if (!cfg.dry_run && !recover::ensure_directory(cfg.output_root, ec)) {
        return fatal(std::move(report), "cannot create output directory " +
                                            platform::path_to_utf8(cfg.output_root) + " - " +
                                            ec.message());
    }

    ResultAggregator aggregator(sink);

    // Каталог вывода внутри корня не сканируется. Если вывод совпадает с
    // корнем, исключаются только подкаталоги типов.
    io::EnumeratorOptions enum_opt;
    enum_opt.excludes = cfg.excludes;
    enum_opt.excludes.push_back(cfg.output_root);
    for (auto& dir : kind_dirs(cfg.output_root)) {
        enum_opt.excludes.push_back(std::move(dir));
    }

    io::DirectoryEnumerator enumerator(cfg.scan_root, enum_opt);
    enumerator.on_error([&aggregator](const io::EnumerationError& e) {
        aggregator.record_error(ScanError{ErrorCategory::Enumeration, e.path, e.format()});
    });
    enumerator.on_project_folder(
        [&aggregator](const std::filesystem::path& dir) { aggregator.record_project_folder(dir); });

    if (auto err = enumerator.open()) {
        return fatal(std::move(report), err->format());
    }

    report.workers = resolve_worker_count(cfg.workers);

    // ------------------------------------------------------------------------
    // Фаза 1: обход и классификация
    // ------------------------------------------------------------------------

    aggregator.set_phase(Phase::Scanning);

    const classify::FileClassifier classifier(config::classifier_rules(cfg),
                                              classify::KeywordSet(cfg.keywords));

    std::vector<WorkerBatch> batches(report.workers);

    WorkScheduler<std::filesystem::path> scanner(report.workers, cancel);
    scanner.on_failure([&aggregator](const std::filesystem::path& path, const std::string& what) {
        aggregator.record_error(ScanError{ErrorCategory::Classification, path, what});
    });
    scanner.on_worker_done([&](size_t worker) { aggregator.merge(batches[worker]); });

    scanner.run([&enumerator](std::filesystem::path& out) { return enumerator.next(out); },
                [&](size_t worker, std::filesystem::path& path) {
                    WorkerBatch& batch = batches[worker];
                    ++batch.examined;

                    classify::Inspection ins = classifier.inspect(path);
                    if (ins.header_error.has_value()) {
                        batch.errors.push_back(
                            ScanError{ErrorCategory::HeaderRead, path,
                                      "could not read header '" + platform::path_to_utf8(path) +
                                          "' - " + ins.header_error->message()});
                    }
                    if (ins.result.matched()) {
                        batch.matches.push_back(std::move(ins.result));
                    }

                    if (batch.examined >= kBatchFlushThreshold || !batch.matches.empty() ||
                        !batch.errors.empty()) {
                        aggregator.merge(batch);
                    }
                });

    report.matches = aggregator.matches();

    // ------------------------------------------------------------------------
    // Планирование
    // ------------------------------------------------------------------------

    const recover::OutputPlanner planner(cfg.scan_root, cfg.output_root);
    for (const auto& match : report.matches) {
        recover::PlanResult planned = planner.plan(match);
        if (!planned) {
            aggregator.record_error(
                ScanError{ErrorCategory::Planning, match.path, planned.error.format()});
            continue;
        }
        report.plans.push_back(std::move(planned.plan));
    }

    // ------------------------------------------------------------------------
    // Фаза 2: копирование
    // ------------------------------------------------------------------------

    if (!cfg.dry_run && !is_cancelled(cancel) && !report.plans.empty()) {
        aggregator.set_phase(Phase::Copying);

        const recover::FileCopier copier(recover::CopyOptions{}, cancel);
        const auto& plans = report.plans;
        size_t next_index = 0;

        WorkScheduler<size_t> copiers(report.workers, cancel);
        copiers.on_failure([&aggregator, &plans](const size_t& index, const std::string& what) {
            recover::CopyOutcome failed;
            failed.plan = plans[index];
            failed.error_detail = what;
            aggregator.record_copy(std::move(failed));
        });

        copiers.run(
            [&next_index, &plans](size_t& out) {
                if (next_index >= plans.size()) {
                    return false;
                }
                out = next_index++;
                return true;
            },
            [&](size_t, size_t& index) {
                const recover::OutputPlan& plan = plans[index];

                std::error_code dir_ec;
                if (!planner.prepare(plan, dir_ec)) {
                    recover::CopyOutcome failed;
                    failed.plan = plan;
                    failed.error_detail = "cannot create directory '" +
                                          platform::path_to_utf8(plan.destination.parent_path()) +
                                          "' - " + dir_ec.message();
                    aggregator.record_copy(std::move(failed));
                    return;
                }
                aggregator.record_copy(copier.copy(plan));
            });

        report.copies = aggregator.copies();
    }

    aggregator.set_phase(Phase::Finished);

    report.cancelled = is_cancelled(cancel);
    report.progress = aggregator.snapshot();
    report.outcome = (report.progress.total_errors() > 0 || report.cancelled)
                         ? RunOutcome::PartialFailure
                         : RunOutcome::Success;
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return report;
}

}  // namespace salvage::scan
