// ==============================================================================
// salvage/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Цветной вывод (ANSI escape codes) только на TTY
// - Строка прогресса со спиннером
// - JSON вывод через RapidJSON
// - Таблицы для итоговой сводки
//
// ==============================================================================

#ifndef SALVAGE_OUTPUT_HPP
#define SALVAGE_OUTPUT_HPP

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace salvage::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Формат вывода
// ----------------------------------------------------------------------------

enum class Format {
    Std,   // Текст + таблица сводки
    Json,  // Итоговый отчёт одним JSON документом
    Jsonl  // События JSON Lines по мере поступления
};

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;           // -q: подавить informational stderr
    int verbose = 0;              // -v: уровень подробности (0..2+)
    bool no_banner = false;       // --no-banner
    Format format = Format::Std;  // Формат вывода

    // scan --output: stdout (таблица, JSON) пишется в файл
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Платформозависимые константы
// ----------------------------------------------------------------------------

#ifdef _WIN32
// Windows: ASCII spinner
constexpr const char* TICK_CHARS[] = {"-", "\\", "|", "/"};
constexpr int TICK_MS = 200;
#else
// Unix: Braille spinner
constexpr const char* TICK_CHARS[] = {"\xe2\xa0\x8b", "\xe2\xa0\x99", "\xe2\xa0\xb9",
                                      "\xe2\xa0\xb8", "\xe2\xa0\xbc", "\xe2\xa0\xb4",
                                      "\xe2\xa0\xa6", "\xe2\xa0\xa7", "\xe2\xa0\x87",
                                      "\xe2\xa0\x8f"};
constexpr int TICK_MS = 80;
#endif

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    void write_json_line(const rapidjson::Value& value);
    void write_json_pretty(const rapidjson::Value& value);

    // Прогресс-индикатор
    // -------------------------------------------------------------------------

    /// Начать строку прогресса; total = 0 означает неизвестный объём
    void progress_begin(std::string_view label, size_t total = 0);

    /// Обновить прогресс (перерисовка не чаще TICK_MS)
    void progress_tick(size_t current);

    /// Завершить и стереть строку прогресса
    void progress_end();

    bool progress_active() const { return progress_active_; }

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыт ли файл из OutputConfig::output_path
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void open_output_file();
    void close_output_file();
    void write_impl(Stream s, std::string_view bytes);
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    void clear_progress_line();
    void draw_progress();
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;

    // Состояние прогресс-бара
    std::string progress_label_;
    size_t progress_total_ = 0;
    size_t progress_current_ = 0;
    size_t progress_frame_ = 0;
    bool progress_active_ = false;
    bool progress_drawn_ = false;
    std::chrono::steady_clock::time_point progress_last_draw_{};
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу в stdout через Writer
    void print(Writer& w);

    /// Unicode box-drawing представление
    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char position) const;
    std::string format_row(const std::vector<std::string>& cells) const;
    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Человекочитаемая длительность: "850ms", "12.4s", "3m 05s"
std::string format_duration(std::chrono::milliseconds elapsed);

std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

/// Ширина строки в символах терминала (UTF-8 continuation bytes не считаются)
size_t display_width(std::string_view s);

}  // namespace salvage::output

#endif  // SALVAGE_OUTPUT_HPP
