// ==============================================================================
// salvage/planner.hpp - Планирование путей вывода
// ==============================================================================
//
// Назначение:
// - OutputPlan: источник -> назначение для найденного файла
// - Назначение = <output_root>/<подкаталог типа>/<путь относительно scan_root>
// - Идемпотентное создание промежуточных каталогов
//
// Относительный путь уникален для каждого источника, подкаталог определяется
// типом, поэтому два разных источника никогда не получают одно назначение.
//
// ==============================================================================

#ifndef SALVAGE_PLANNER_HPP
#define SALVAGE_PLANNER_HPP

#include "salvage/classifier.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace salvage::recover {

// ----------------------------------------------------------------------------
// OutputPlan
// ----------------------------------------------------------------------------

struct OutputPlan {
    std::filesystem::path source;
    std::filesystem::path destination;
    classify::Kind kind = classify::Kind::None;
};

bool operator==(const OutputPlan& a, const OutputPlan& b);

// ----------------------------------------------------------------------------
// PlanError / PlanResult
// ----------------------------------------------------------------------------

enum class PlanErrorKind {
    PathOutsideScanRoot,  // Источник не лежит под scan_root
    UnclassifiedKind      // Kind::None не планируется
};

struct PlanError {
    PlanErrorKind kind = PlanErrorKind::PathOutsideScanRoot;
    std::filesystem::path path;
    std::string message;

    std::string format() const;
};

struct PlanResult {
    bool ok = false;
    OutputPlan plan;
    PlanError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// OutputPlanner
// ----------------------------------------------------------------------------

class OutputPlanner {
public:
    OutputPlanner(std::filesystem::path scan_root, std::filesystem::path output_root);

    /// Построить план для результата классификации
    PlanResult plan(const classify::ClassificationResult& result) const;

    /// Создать каталоги для назначения (уже существующие - не ошибка)
    bool prepare(const OutputPlan& plan, std::error_code& ec) const;

    const std::filesystem::path& scan_root() const { return scan_root_; }
    const std::filesystem::path& output_root() const { return output_root_; }

private:
    std::filesystem::path scan_root_;
    std::filesystem::path output_root_;
};

/// Свободная форма OutputPlanner::plan
PlanResult plan_output(const classify::ClassificationResult& result,
                       const std::filesystem::path& scan_root,
                       const std::filesystem::path& output_root);

/// Путь source относительно root; пустой путь если source не лежит строго под root
std::filesystem::path relative_under(const std::filesystem::path& source,
                                     const std::filesystem::path& root);

/// create_directories, устойчивый к гонке с другими потоками
bool ensure_directory(const std::filesystem::path& dir, std::error_code& ec);

}  // namespace salvage::recover

#endif  // SALVAGE_PLANNER_HPP
