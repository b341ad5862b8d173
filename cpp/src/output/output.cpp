// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: std::endl не используется, перевод строки пишется явно.
// RapidJSON для JSON сериализации.
//
// ==============================================================================

#include "salvage/output.hpp"

#include "salvage/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace salvage::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Возврат каретки + очистка строки
constexpr const char* ANSI_CLEAR_LINE = "\r\x1b[2K";

// Unicode box-drawing characters для таблиц (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

constexpr size_t TICK_COUNT = sizeof(TICK_CHARS) / sizeof(TICK_CHARS[0]);

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    progress_end();
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    // stdout перенаправляется в файл, если он открыт
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    // Строка прогресса стирается перед любым сообщением
    clear_progress_line();

    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::write_json_line(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

// ----------------------------------------------------------------------------
// Прогресс
// ----------------------------------------------------------------------------

void Writer::progress_begin(std::string_view label, size_t total) {
    // Прогресс скрыт при verbose или quiet: он мешает построчному выводу
    if (config_.verbose > 0 || config_.quiet) {
        return;
    }
    progress_end();

    progress_label_ = std::string(label);
    progress_total_ = total;
    progress_current_ = 0;
    progress_frame_ = 0;
    progress_active_ = true;
    progress_drawn_ = false;
    progress_last_draw_ = std::chrono::steady_clock::time_point{};
}

void Writer::progress_tick(size_t current) {
    if (!progress_active_) {
        return;
    }

    progress_current_ = current;

    const auto now = std::chrono::steady_clock::now();
    if (progress_drawn_ && now - progress_last_draw_ < std::chrono::milliseconds(TICK_MS)) {
        return;
    }
    progress_last_draw_ = now;
    draw_progress();
}

void Writer::progress_end() {
    if (!progress_active_) {
        return;
    }

    clear_progress_line();
    progress_active_ = false;
    progress_label_.clear();
}

void Writer::draw_progress() {
    // Строку прогресса рисуем только на терминал
    if (!platform::is_tty_stderr()) {
        return;
    }

    std::string line = ANSI_CLEAR_LINE;
    line += TICK_CHARS[progress_frame_ % TICK_COUNT];
    line += ' ';
    line += progress_label_;
    line += ": ";
    line += std::to_string(progress_current_);
    if (progress_total_ > 0) {
        line += '/';
        line += std::to_string(progress_total_);
    }

    write(Stream::Stderr, line);
    std::fflush(stderr);

    ++progress_frame_;
    progress_drawn_ = true;
}

void Writer::clear_progress_line() {
    if (!progress_drawn_) {
        return;
    }
    write(Stream::Stderr, ANSI_CLEAR_LINE);
    std::fflush(stderr);
    progress_drawn_ = false;
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

void Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return;
    }

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(char position) const {
    const auto widths = column_widths();

    const char* left = BOX_LT;
    const char* middle = BOX_CROSS;
    const char* right = BOX_RT;
    if (position == 'T') {
        left = BOX_TL;
        middle = BOX_TT;
        right = BOX_TR;
    } else if (position == 'B') {
        left = BOX_BL;
        middle = BOX_BT;
        right = BOX_BR;
    }

    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        // 1 пробел с каждой стороны + содержимое
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells) const {
    const auto widths = column_widths();

    std::string line = BOX_V;
    for (size_t i = 0; i < widths.size(); ++i) {
        line += ' ';

        const std::string cell = (i < cells.size()) ? cells[i] : "";
        line += cell;

        const size_t w = display_width(cell);
        if (w < widths[i]) {
            line.append(widths[i] - w, ' ');
        }

        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    std::string result;

    // ┌───┬───┐
    result += format_line('T');
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_);
        result += '\n';

        // ├───┼───┤
        result += format_line('M');
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row);
        result += '\n';
    }

    // └───┴───┘
    result += format_line('B');
    result += '\n';

    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_duration(std::chrono::milliseconds elapsed) {
    const long long ms = elapsed.count();
    char buf[32];

    if (ms < 1000) {
        std::snprintf(buf, sizeof(buf), "%lldms", ms);
    } else if (ms < 60 * 1000) {
        std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(ms) / 1000.0);
    } else {
        const long long total_s = ms / 1000;
        std::snprintf(buf, sizeof(buf), "%lldm %02llds", total_s / 60, total_s % 60);
    }
    return buf;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

size_t display_width(std::string_view s) {
    size_t width = 0;
    for (unsigned char c : s) {
        // 10xxxxxx - продолжение многобайтовой последовательности
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

}  // namespace salvage::output
