// ==============================================================================
// salvage/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef SALVAGE_CLI_HPP
#define SALVAGE_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace salvage::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int num_threads = 0;     // --num-threads (0 = default = CPU count)
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// scan - поиск и копирование проектных файлов
struct ScanCommand {
    std::filesystem::path scan_root;    // <SCAN_ROOT>
    std::filesystem::path output_root;  // <OUTPUT_ROOT>

    std::vector<std::string> keywords;            // -k, --keyword (repeatable)
    std::optional<std::filesystem::path> config;  // -c, --config
    std::vector<std::filesystem::path> excludes;  // --exclude (repeatable)
    std::optional<std::filesystem::path> output;  // -o, --output

    bool no_parallel = false;     // --no-parallel
    bool verify_headers = false;  // --verify-headers
    bool dry_run = false;         // --dry-run

    bool json = false;   // -j, --json
    bool jsonl = false;  // --jsonl
};

/// classify - классифицировать отдельные файлы
struct ClassifyCommand {
    std::vector<std::filesystem::path> paths;
    std::vector<std::string> keywords;  // -k, --keyword
    bool json = false;                  // -j, --json
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

// ----------------------------------------------------------------------------
// Command - вариант команды
// ----------------------------------------------------------------------------

using Command = std::variant<ScanCommand, ClassifyCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Генерировать текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Генерировать текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Find and recover DAW project files from damaged or cluttered drives";

}  // namespace salvage::cli

#endif  // SALVAGE_CLI_HPP
