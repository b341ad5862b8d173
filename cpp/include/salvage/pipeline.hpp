// ==============================================================================
// salvage/pipeline.hpp - Конвейер восстановления
// ==============================================================================
//
// Назначение:
// - run_recovery(): обход -> классификация -> сведение -> план -> копирование
// - RunReport: итог запуска (Success / PartialFailure / Fatal)
//
// Фатальные ошибки (корень сканирования недоступен, каталог вывода не создаётся)
// прерывают запуск до начала работы. Все остальные ошибки считаются по
// категориям и не прерывают запуск. Процесс никогда не завершается отсюда.
//
// ==============================================================================

#ifndef SALVAGE_PIPELINE_HPP
#define SALVAGE_PIPELINE_HPP

#include "salvage/aggregator.hpp"
#include "salvage/config.hpp"
#include "salvage/copier.hpp"
#include "salvage/planner.hpp"
#include "salvage/scheduler.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace salvage::scan {

enum class RunOutcome {
    Success,         // Ошибок нет
    PartialFailure,  // Были восстановимые ошибки или отмена; запуск всё равно успешен
    Fatal            // Запуск не состоялся
};

const char* run_outcome_to_string(RunOutcome outcome);

struct RunReport {
    RunOutcome outcome = RunOutcome::Fatal;
    std::string fatal_error;
    bool cancelled = false;
    bool dry_run = false;
    size_t workers = 0;

    ProgressState progress;
    std::vector<classify::ClassificationResult> matches;
    std::vector<recover::OutputPlan> plans;
    std::vector<recover::CopyOutcome> copies;

    std::chrono::milliseconds elapsed{0};

    bool succeeded() const { return outcome != RunOutcome::Fatal; }
};

/// Число файлов, после которого поток сливает локальную дельту
constexpr std::uint64_t kBatchFlushThreshold = 64;

/// Выполнить один запуск восстановления
///
/// @param cfg Конфигурация (проверяется через config::validate)
/// @param sink Приёмник событий, может быть nullptr
/// @param cancel Токен отмены, может быть nullptr
RunReport run_recovery(config::ScanConfig cfg, EventSink* sink = nullptr,
                       const CancellationToken* cancel = nullptr);

}  // namespace salvage::scan

#endif  // SALVAGE_PIPELINE_HPP
