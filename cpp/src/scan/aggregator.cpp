// ==============================================================================
// aggregator.cpp - Сведение результатов рабочих потоков
// ==============================================================================

#include "salvage/aggregator.hpp"

#include "salvage/platform.hpp"

#include <algorithm>

namespace salvage::scan {

// ----------------------------------------------------------------------------
// Строковые представления
// ----------------------------------------------------------------------------

const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::Enumeration:
        return "enumeration";
    case ErrorCategory::HeaderRead:
        return "header_read";
    case ErrorCategory::Classification:
        return "classification";
    case ErrorCategory::Planning:
        return "planning";
    case ErrorCategory::Copy:
        return "copy";
    }
    return "unknown";
}

const char* phase_to_string(Phase phase) {
    switch (phase) {
    case Phase::Scanning:
        return "scanning";
    case Phase::Copying:
        return "copying";
    case Phase::Finished:
        return "finished";
    }
    return "unknown";
}

const char* event_type_to_string(EventType type) {
    switch (type) {
    case EventType::Match:
        return "match";
    case EventType::Error:
        return "error";
    case EventType::ProjectFolder:
        return "project_folder";
    case EventType::Copied:
        return "copied";
    case EventType::PhaseChanged:
        return "phase";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// ProgressState
// ----------------------------------------------------------------------------

std::uint64_t ProgressState::matches(classify::Kind kind) const {
    auto it = matches_by_kind.find(kind);
    return it == matches_by_kind.end() ? 0 : it->second;
}

std::uint64_t ProgressState::errors(ErrorCategory category) const {
    auto it = errors_by_category.find(category);
    return it == errors_by_category.end() ? 0 : it->second;
}

std::uint64_t ProgressState::total_matches() const {
    std::uint64_t total = 0;
    for (const auto& [kind, count] : matches_by_kind) {
        (void)kind;
        total += count;
    }
    return total;
}

std::uint64_t ProgressState::total_errors() const {
    std::uint64_t total = 0;
    for (const auto& [category, count] : errors_by_category) {
        (void)category;
        total += count;
    }
    return total;
}

bool operator==(const ProgressState& a, const ProgressState& b) {
    return a.files_examined == b.files_examined && a.matches_by_kind == b.matches_by_kind &&
           a.errors_by_category == b.errors_by_category &&
           a.copies_succeeded == b.copies_succeeded && a.copies_failed == b.copies_failed &&
           a.project_folders_seen == b.project_folders_seen;
}

bool operator!=(const ProgressState& a, const ProgressState& b) {
    return !(a == b);
}

void WorkerBatch::clear() {
    examined = 0;
    matches.clear();
    errors.clear();
}

// ----------------------------------------------------------------------------
// ResultAggregator
// ----------------------------------------------------------------------------

ResultAggregator::ResultAggregator(EventSink* sink) : sink_(sink) {}

void ResultAggregator::merge(WorkerBatch& batch) {
    if (batch.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    state_.files_examined += batch.examined;

    for (auto& match : batch.matches) {
        ++state_.matches_by_kind[match.kind];

        ScanEvent ev;
        ev.type = EventType::Match;
        ev.path = match.path;
        ev.kind = match.kind;
        ev.basis = match.basis;
        emit_locked(ev);

        matches_.push_back(std::move(match));
    }

    for (const auto& error : batch.errors) {
        apply_error_locked(error);
    }

    batch.clear();

    if (sink_ != nullptr) {
        sink_->on_progress(state_);
    }
}

void ResultAggregator::record_error(ScanError error) {
    std::lock_guard<std::mutex> lock(mutex_);
    apply_error_locked(error);
    if (sink_ != nullptr) {
        sink_->on_progress(state_);
    }
}

void ResultAggregator::record_project_folder(const std::filesystem::path& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++state_.project_folders_seen;

    ScanEvent ev;
    ev.type = EventType::ProjectFolder;
    ev.path = dir;
    emit_locked(ev);
}

void ResultAggregator::record_copy(recover::CopyOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (outcome.succeeded) {
        ++state_.copies_succeeded;

        ScanEvent ev;
        ev.type = EventType::Copied;
        ev.path = outcome.plan.source;
        ev.kind = outcome.plan.kind;
        ev.detail = platform::path_to_utf8(outcome.plan.destination);
        emit_locked(ev);
    } else {
        ++state_.copies_failed;
        apply_error_locked(ScanError{ErrorCategory::Copy, outcome.plan.source,
                                     outcome.error_detail.value_or("copy failed")});
    }

    copies_.push_back(std::move(outcome));

    if (sink_ != nullptr) {
        sink_->on_progress(state_);
    }
}

void ResultAggregator::set_phase(Phase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    ScanEvent ev;
    ev.type = EventType::PhaseChanged;
    ev.phase = phase;
    emit_locked(ev);
}

ProgressState ResultAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<classify::ClassificationResult> ResultAggregator::matches() const {
    std::vector<classify::ClassificationResult> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out = matches_;
    }
    std::sort(out.begin(), out.end(),
              [](const classify::ClassificationResult& a,
                 const classify::ClassificationResult& b) { return a.path < b.path; });
    return out;
}

std::vector<recover::CopyOutcome> ResultAggregator::copies() const {
    std::vector<recover::CopyOutcome> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out = copies_;
    }
    std::sort(out.begin(), out.end(),
              [](const recover::CopyOutcome& a, const recover::CopyOutcome& b) {
                  return a.plan.source < b.plan.source;
              });
    return out;
}

void ResultAggregator::apply_error_locked(const ScanError& error) {
    ++state_.errors_by_category[error.category];

    ScanEvent ev;
    ev.type = EventType::Error;
    ev.path = error.path;
    ev.category = error.category;
    ev.detail = error.detail;
    emit_locked(ev);
}

void ResultAggregator::emit_locked(const ScanEvent& event) {
    if (sink_ != nullptr) {
        sink_->on_event(event);
    }
}

}  // namespace salvage::scan
