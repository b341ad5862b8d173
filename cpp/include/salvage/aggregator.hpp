// ==============================================================================
// salvage/aggregator.hpp - Сведение результатов рабочих потоков
// ==============================================================================
//
// Назначение:
// - ProgressState: счётчики прогресса (файлы, совпадения по типам, ошибки)
// - ScanEvent / EventSink: структурированные события для внешнего вывода
// - WorkerBatch: локальная дельта потока, сливается одним вызовом merge()
// - ResultAggregator: единственная точка изменения общего состояния
//
// Все изменения выполняются под одним мьютексом: обновления не теряются,
// счётчики не убывают, snapshot() всегда согласован. События передаются
// в EventSink под тем же мьютексом, поэтому приёмник вызывается строго
// последовательно.
//
// ==============================================================================

#ifndef SALVAGE_AGGREGATOR_HPP
#define SALVAGE_AGGREGATOR_HPP

#include "salvage/classifier.hpp"
#include "salvage/copier.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace salvage::scan {

// ----------------------------------------------------------------------------
// Категории ошибок
// ----------------------------------------------------------------------------

enum class ErrorCategory {
    Enumeration,     // Каталог/элемент недоступен при обходе
    HeaderRead,      // Не удалось прочитать заголовок файла
    Classification,  // Неожиданная ошибка при классификации
    Planning,        // Не удалось построить путь назначения
    Copy             // Копирование не удалось
};

constexpr ErrorCategory kErrorCategories[] = {ErrorCategory::Enumeration,
                                              ErrorCategory::HeaderRead,
                                              ErrorCategory::Classification,
                                              ErrorCategory::Planning, ErrorCategory::Copy};

const char* error_category_to_string(ErrorCategory category);

struct ScanError {
    ErrorCategory category = ErrorCategory::Enumeration;
    std::filesystem::path path;
    std::string detail;
};

// ----------------------------------------------------------------------------
// ProgressState
// ----------------------------------------------------------------------------

struct ProgressState {
    std::uint64_t files_examined = 0;
    std::map<classify::Kind, std::uint64_t> matches_by_kind;
    std::map<ErrorCategory, std::uint64_t> errors_by_category;
    std::uint64_t copies_succeeded = 0;
    std::uint64_t copies_failed = 0;
    std::uint64_t project_folders_seen = 0;

    std::uint64_t matches(classify::Kind kind) const;
    std::uint64_t errors(ErrorCategory category) const;
    std::uint64_t total_matches() const;
    std::uint64_t total_errors() const;
};

bool operator==(const ProgressState& a, const ProgressState& b);
bool operator!=(const ProgressState& a, const ProgressState& b);

// ----------------------------------------------------------------------------
// События
// ----------------------------------------------------------------------------

enum class Phase { Scanning, Copying, Finished };

const char* phase_to_string(Phase phase);

enum class EventType {
    Match,          // Найден файл (kind, basis)
    Error,          // Восстановимая ошибка (category, detail)
    ProjectFolder,  // Каталог похож на проект
    Copied,         // Файл скопирован (detail = назначение)
    PhaseChanged    // Начало фазы
};

const char* event_type_to_string(EventType type);

struct ScanEvent {
    EventType type = EventType::Match;
    std::filesystem::path path;
    classify::Kind kind = classify::Kind::None;
    classify::Basis basis = classify::Basis::Extension;
    ErrorCategory category = ErrorCategory::Enumeration;
    Phase phase = Phase::Scanning;
    std::string detail;
};

/// Внешний приёмник событий (вывод, логирование)
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_event(const ScanEvent& event) = 0;

    /// Снимок после каждого слияния
    virtual void on_progress(const ProgressState& state) { (void)state; }
};

// ----------------------------------------------------------------------------
// WorkerBatch
// ----------------------------------------------------------------------------

/// Локальная дельта рабочего потока
struct WorkerBatch {
    std::uint64_t examined = 0;
    std::vector<classify::ClassificationResult> matches;
    std::vector<ScanError> errors;

    bool empty() const { return examined == 0 && matches.empty() && errors.empty(); }
    void clear();
};

// ----------------------------------------------------------------------------
// ResultAggregator
// ----------------------------------------------------------------------------

class ResultAggregator {
public:
    explicit ResultAggregator(EventSink* sink = nullptr);

    /// Слить дельту потока; batch очищается
    void merge(WorkerBatch& batch);

    /// Одиночная ошибка вне пакета (обход, планирование)
    void record_error(ScanError error);

    void record_project_folder(const std::filesystem::path& dir);

    void record_copy(recover::CopyOutcome outcome);

    void set_phase(Phase phase);

    ProgressState snapshot() const;

    /// Найденные файлы, отсортированные по пути
    std::vector<classify::ClassificationResult> matches() const;

    /// Результаты копирования, отсортированные по источнику
    std::vector<recover::CopyOutcome> copies() const;

private:
    void apply_error_locked(const ScanError& error);
    void emit_locked(const ScanEvent& event);

    mutable std::mutex mutex_;
    ProgressState state_;
    std::vector<classify::ClassificationResult> matches_;
    std::vector<recover::CopyOutcome> copies_;
    EventSink* sink_;
};

}  // namespace salvage::scan

#endif  // SALVAGE_AGGREGATOR_HPP
