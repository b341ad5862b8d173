// ==============================================================================
// planner.cpp - Планирование путей вывода
// ==============================================================================

#include "salvage/planner.hpp"

#include "salvage/platform.hpp"

namespace salvage::recover {

namespace {

std::filesystem::path strip_trailing_separator(std::filesystem::path p) {
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

}  // namespace

bool operator==(const OutputPlan& a, const OutputPlan& b) {
    return a.source == b.source && a.destination == b.destination && a.kind == b.kind;
}

std::string PlanError::format() const {
    return message + " '" + platform::path_to_utf8(path) + "'";
}

std::filesystem::path relative_under(const std::filesystem::path& source,
                                     const std::filesystem::path& root) {
    const std::filesystem::path src = strip_trailing_separator(source);
    const std::filesystem::path base = strip_trailing_separator(root);

    // Абсолютный и относительный пути не сравниваются
    if (src.is_absolute() != base.is_absolute()) {
        return {};
    }

    std::filesystem::path rel = src.lexically_relative(base);
    if (rel.empty() || rel == ".") {
        return {};
    }
    if (*rel.begin() == "..") {
        return {};
    }
    return rel;
}

bool ensure_directory(const std::filesystem::path& dir, std::error_code& ec) {
    ec.clear();
    std::filesystem::create_directories(dir, ec);
    if (!ec) {
        return true;
    }
    // Другой поток мог создать каталог между проверкой и mkdir
    std::error_code check_ec;
    if (std::filesystem::is_directory(dir, check_ec)) {
        ec.clear();
        return true;
    }
    return false;
}

// ----------------------------------------------------------------------------
// OutputPlanner
// ----------------------------------------------------------------------------

OutputPlanner::OutputPlanner(std::filesystem::path scan_root, std::filesystem::path output_root)
    : scan_root_(std::move(scan_root)), output_root_(std::move(output_root)) {}

PlanResult OutputPlanner::plan(const classify::ClassificationResult& result) const {
    return plan_output(result, scan_root_, output_root_);
}

bool OutputPlanner::prepare(const OutputPlan& plan, std::error_code& ec) const {
    return ensure_directory(plan.destination.parent_path(), ec);
}

PlanResult plan_output(const classify::ClassificationResult& result,
                       const std::filesystem::path& scan_root,
                       const std::filesystem::path& output_root) {
    PlanResult out;

    if (result.kind == classify::Kind::None) {
        out.error = PlanError{PlanErrorKind::UnclassifiedKind, result.path,
                              "unclassified file cannot be planned"};
        return out;
    }

    std::filesystem::path rel = relative_under(result.path, scan_root);
    if (rel.empty()) {
        out.error = PlanError{PlanErrorKind::PathOutsideScanRoot, result.path,
                              "path is outside of the scan root"};
        return out;
    }

    out.plan.source = result.path;
    out.plan.kind = result.kind;
    out.plan.destination = output_root / classify::kind_subdir(result.kind) / rel;
    out.ok = true;
    return out;
}

}  // namespace salvage::recover
