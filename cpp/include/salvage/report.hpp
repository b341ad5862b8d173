// ==============================================================================
// salvage/report.hpp - Представление результатов запуска
// ==============================================================================
//
// Назначение:
// - JSON представление событий, прогресса и итогового отчёта (RapidJSON)
// - Таблица итоговой сводки для текстового режима
// - ConsoleSink: EventSink, который переводит события в вывод Writer
//
// ==============================================================================

#ifndef SALVAGE_REPORT_HPP
#define SALVAGE_REPORT_HPP

#include "salvage/aggregator.hpp"
#include "salvage/classifier.hpp"
#include "salvage/output.hpp"
#include "salvage/pipeline.hpp"

#include <rapidjson/document.h>

#include <string>

namespace salvage::output {

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

using JsonAllocator = rapidjson::Document::AllocatorType;

/// {"path", "kind", "basis"}
void classification_to_json(const classify::ClassificationResult& result, rapidjson::Value& out,
                            JsonAllocator& alloc);

/// {"files_examined", "matches": {...}, "errors": {...}, "copies_succeeded", ...}
void progress_to_json(const scan::ProgressState& state, rapidjson::Value& out,
                      JsonAllocator& alloc);

/// Одна строка JSONL: {"event": "match", ...}
void event_to_json(const scan::ScanEvent& event, rapidjson::Document& doc);

/// Итоговый документ для --json
void report_to_json(const scan::RunReport& report, rapidjson::Document& doc);

// ----------------------------------------------------------------------------
// Текст
// ----------------------------------------------------------------------------

/// Строка сообщения для события (без префикса)
std::string describe_event(const scan::ScanEvent& event);

/// Таблица: категория | количество
Table summary_table(const scan::RunReport& report);

/// Итоговая строка: "Saved 3 file(s), 1 failed, 12 examined in 1.2s"
std::string summary_line(const scan::RunReport& report);

// ----------------------------------------------------------------------------
// ConsoleSink
// ----------------------------------------------------------------------------

/// Приёмник событий конвейера для консоли
///
/// Вызывается агрегатором строго последовательно, поэтому Writer
/// используется без дополнительной синхронизации.
class ConsoleSink : public scan::EventSink {
public:
    explicit ConsoleSink(Writer& writer);

    void on_event(const scan::ScanEvent& event) override;
    void on_progress(const scan::ProgressState& state) override;

private:
    Writer& writer_;
    scan::Phase phase_ = scan::Phase::Scanning;
};

}  // namespace salvage::output

#endif  // SALVAGE_REPORT_HPP
