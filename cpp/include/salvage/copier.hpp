// ==============================================================================
// salvage/copier.hpp - Копирование найденных файлов
// ==============================================================================
//
// Назначение:
// - Копирование содержимого во временный файл рядом с назначением
// - Перенос прав доступа и временных меток (atime/mtime)
// - Атомарное переименование поверх назначения (повторный запуск перезаписывает)
// - Ошибка изолирована одним файлом: CopyOutcome с описанием
//
// При отмене посреди копирования временный файл удаляется: назначение либо
// полностью записано, либо не тронуто.
//
// ==============================================================================

#ifndef SALVAGE_COPIER_HPP
#define SALVAGE_COPIER_HPP

#include "salvage/planner.hpp"
#include "salvage/scheduler.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace salvage::recover {

struct CopyOutcome {
    OutputPlan plan;
    bool succeeded = false;
    std::optional<std::string> error_detail;
};

struct CopyOptions {
    size_t buffer_size = 1024 * 1024;
    bool preserve_permissions = true;
    bool preserve_timestamps = true;
};

class FileCopier {
public:
    explicit FileCopier(CopyOptions opt = {}, const scan::CancellationToken* cancel = nullptr);

    /// Скопировать source -> destination
    ///
    /// Родительский каталог назначения должен существовать (OutputPlanner::prepare).
    CopyOutcome copy(const OutputPlan& plan) const;

    const CopyOptions& options() const { return options_; }

private:
    CopyOptions options_;
    const scan::CancellationToken* cancel_;
};

}  // namespace salvage::recover

#endif  // SALVAGE_COPIER_HPP
