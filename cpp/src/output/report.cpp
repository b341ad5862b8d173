// ==============================================================================
// report.cpp - Представление результатов запуска
// ==============================================================================

#include "salvage/report.hpp"

#include "salvage/platform.hpp"

#include <cstdint>

namespace salvage::output {

namespace {

rapidjson::Value string_value(const std::string& s, JsonAllocator& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

rapidjson::Value path_value(const std::filesystem::path& p, JsonAllocator& alloc) {
    return string_value(platform::path_to_utf8(p), alloc);
}

std::string plural_files(std::uint64_t n) {
    return std::to_string(n) + (n == 1 ? " file" : " files");
}

}  // namespace

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

void classification_to_json(const classify::ClassificationResult& result, rapidjson::Value& out,
                            JsonAllocator& alloc) {
    out.SetObject();
    out.AddMember("path", path_value(result.path, alloc), alloc);
    out.AddMember("kind", rapidjson::StringRef(classify::kind_to_string(result.kind)), alloc);
    out.AddMember("basis", rapidjson::StringRef(classify::basis_to_string(result.basis)), alloc);
}

void progress_to_json(const scan::ProgressState& state, rapidjson::Value& out,
                      JsonAllocator& alloc) {
    out.SetObject();
    out.AddMember("files_examined", static_cast<uint64_t>(state.files_examined), alloc);

    rapidjson::Value matches(rapidjson::kObjectType);
    for (auto kind : classify::kRecoverableKinds) {
        matches.AddMember(rapidjson::StringRef(classify::kind_to_string(kind)),
                          static_cast<uint64_t>(state.matches(kind)), alloc);
    }
    out.AddMember("matches", matches, alloc);

    rapidjson::Value errors(rapidjson::kObjectType);
    for (auto category : scan::kErrorCategories) {
        errors.AddMember(rapidjson::StringRef(scan::error_category_to_string(category)),
                         static_cast<uint64_t>(state.errors(category)), alloc);
    }
    out.AddMember("errors", errors, alloc);

    out.AddMember("copies_succeeded", static_cast<uint64_t>(state.copies_succeeded), alloc);
    out.AddMember("copies_failed", static_cast<uint64_t>(state.copies_failed), alloc);
    out.AddMember("project_folders", static_cast<uint64_t>(state.project_folders_seen), alloc);
}

void event_to_json(const scan::ScanEvent& event, rapidjson::Document& doc) {
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("event", rapidjson::StringRef(scan::event_type_to_string(event.type)), alloc);

    switch (event.type) {
    case scan::EventType::Match:
        doc.AddMember("path", path_value(event.path, alloc), alloc);
        doc.AddMember("kind", rapidjson::StringRef(classify::kind_to_string(event.kind)), alloc);
        doc.AddMember("basis", rapidjson::StringRef(classify::basis_to_string(event.basis)),
                      alloc);
        break;
    case scan::EventType::Error:
        doc.AddMember("path", path_value(event.path, alloc), alloc);
        doc.AddMember("category",
                      rapidjson::StringRef(scan::error_category_to_string(event.category)), alloc);
        doc.AddMember("detail", string_value(event.detail, alloc), alloc);
        break;
    case scan::EventType::ProjectFolder:
        doc.AddMember("path", path_value(event.path, alloc), alloc);
        break;
    case scan::EventType::Copied:
        doc.AddMember("path", path_value(event.path, alloc), alloc);
        doc.AddMember("kind", rapidjson::StringRef(classify::kind_to_string(event.kind)), alloc);
        doc.AddMember("destination", string_value(event.detail, alloc), alloc);
        break;
    case scan::EventType::PhaseChanged:
        doc.AddMember("phase", rapidjson::StringRef(scan::phase_to_string(event.phase)), alloc);
        break;
    }
}

void report_to_json(const scan::RunReport& report, rapidjson::Document& doc) {
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("outcome", rapidjson::StringRef(scan::run_outcome_to_string(report.outcome)),
                  alloc);
    if (report.outcome == scan::RunOutcome::Fatal) {
        doc.AddMember("error", string_value(report.fatal_error, alloc), alloc);
    }
    doc.AddMember("cancelled", report.cancelled, alloc);
    doc.AddMember("dry_run", report.dry_run, alloc);
    doc.AddMember("workers", static_cast<uint64_t>(report.workers), alloc);
    doc.AddMember("elapsed_ms", static_cast<int64_t>(report.elapsed.count()), alloc);

    rapidjson::Value progress;
    progress_to_json(report.progress, progress, alloc);
    doc.AddMember("progress", progress, alloc);

    rapidjson::Value matches(rapidjson::kArrayType);
    for (const auto& match : report.matches) {
        rapidjson::Value item;
        classification_to_json(match, item, alloc);
        matches.PushBack(item, alloc);
    }
    doc.AddMember("matches", matches, alloc);

    // В режиме dry-run планы показывают, куда файлы были бы скопированы
    rapidjson::Value plans(rapidjson::kArrayType);
    for (const auto& plan : report.plans) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("source", path_value(plan.source, alloc), alloc);
        item.AddMember("destination", path_value(plan.destination, alloc), alloc);
        item.AddMember("kind", rapidjson::StringRef(classify::kind_to_string(plan.kind)), alloc);
        plans.PushBack(item, alloc);
    }
    doc.AddMember("plans", plans, alloc);

    rapidjson::Value copies(rapidjson::kArrayType);
    for (const auto& copy : report.copies) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("source", path_value(copy.plan.source, alloc), alloc);
        item.AddMember("destination", path_value(copy.plan.destination, alloc), alloc);
        item.AddMember("ok", copy.succeeded, alloc);
        if (copy.error_detail.has_value()) {
            item.AddMember("error", string_value(*copy.error_detail, alloc), alloc);
        }
        copies.PushBack(item, alloc);
    }
    doc.AddMember("copies", copies, alloc);
}

// ----------------------------------------------------------------------------
// Текст
// ----------------------------------------------------------------------------

std::string describe_event(const scan::ScanEvent& event) {
    const std::string path = platform::path_to_utf8(event.path);

    switch (event.type) {
    case scan::EventType::Match:
        return std::string("Found ") + classify::kind_to_string(event.kind) + " (" +
               classify::basis_to_string(event.basis) + "): " + path;
    case scan::EventType::Error:
        return event.detail;
    case scan::EventType::ProjectFolder:
        return "Looks like a project folder: " + path;
    case scan::EventType::Copied:
        return "Saved " + path + " -> " + event.detail;
    case scan::EventType::PhaseChanged:
        return std::string("Phase: ") + scan::phase_to_string(event.phase);
    }
    return path;
}

Table summary_table(const scan::RunReport& report) {
    const auto& p = report.progress;

    Table table;
    table.set_headers({"Item", "Count"});
    table.add_row({"Files examined", std::to_string(p.files_examined)});
    for (auto kind : classify::kRecoverableKinds) {
        table.add_row({classify::kind_to_string(kind), std::to_string(p.matches(kind))});
    }
    table.add_row({"Project folders", std::to_string(p.project_folders_seen)});
    if (!report.dry_run) {
        table.add_row({"Copied", std::to_string(p.copies_succeeded)});
        table.add_row({"Copy failures", std::to_string(p.copies_failed)});
    }
    for (auto category : scan::kErrorCategories) {
        const auto n = p.errors(category);
        if (n > 0) {
            table.add_row({std::string("Errors: ") + scan::error_category_to_string(category),
                           std::to_string(n)});
        }
    }
    return table;
}

std::string summary_line(const scan::RunReport& report) {
    const auto& p = report.progress;

    std::string line;
    if (report.dry_run) {
        line = "Would save " + plural_files(report.plans.size());
    } else {
        line = "Saved " + plural_files(p.copies_succeeded);
        if (p.copies_failed > 0) {
            line += ", " + std::to_string(p.copies_failed) + " failed";
        }
    }
    line += ", " + std::to_string(p.files_examined) + " examined in " +
            format_duration(report.elapsed);
    if (report.cancelled) {
        line += " (cancelled)";
    }
    return line;
}

// ----------------------------------------------------------------------------
// ConsoleSink
// ----------------------------------------------------------------------------

ConsoleSink::ConsoleSink(Writer& writer) : writer_(writer) {}

void ConsoleSink::on_event(const scan::ScanEvent& event) {
    if (writer_.config().format == Format::Jsonl) {
        // Прогресс в JSONL не рисуется: stdout занят событиями
        rapidjson::Document doc;
        event_to_json(event, doc);
        writer_.write_json_line(doc);
        if (event.type == scan::EventType::Error) {
            writer_.warn(event.detail);
        }
        return;
    }

    switch (event.type) {
    case scan::EventType::Match:
        writer_.debug(describe_event(event));
        break;
    case scan::EventType::Error:
        writer_.warn(describe_event(event));
        break;
    case scan::EventType::ProjectFolder:
        writer_.trace(describe_event(event));
        break;
    case scan::EventType::Copied:
        writer_.debug(describe_event(event));
        break;
    case scan::EventType::PhaseChanged:
        phase_ = event.phase;
        writer_.progress_end();
        if (event.phase == scan::Phase::Scanning) {
            writer_.progress_begin("Scanning");
        } else if (event.phase == scan::Phase::Copying) {
            writer_.progress_begin("Copying");
        }
        writer_.trace(describe_event(event));
        break;
    }
}

void ConsoleSink::on_progress(const scan::ProgressState& state) {
    if (phase_ == scan::Phase::Copying) {
        writer_.progress_tick(static_cast<size_t>(state.copies_succeeded + state.copies_failed));
    } else {
        writer_.progress_tick(static_cast<size_t>(state.files_examined));
    }
}

}  // namespace salvage::output
