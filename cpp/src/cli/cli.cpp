// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Формат сообщений об ошибках следует clap:
//   error: <что не так>
//
//   Usage: ...
//
//   For more information, try '--help'.
//
// ==============================================================================

#include "salvage/cli.hpp"

#include "salvage/platform.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

namespace salvage::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE_MAIN = "Usage: salvage [OPTIONS] <COMMAND>";
constexpr const char* USAGE_SCAN = "Usage: salvage scan [OPTIONS] <SCAN_ROOT> <OUTPUT_ROOT>";
constexpr const char* USAGE_CLASSIFY = "Usage: salvage classify [OPTIONS] <PATH>...";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string render_usage_error(const std::string& error_msg, const char* usage) {
    return "error: " + error_msg + "\n\n" + usage + "\n\nFor more information, try '--help'.\n";
}

void fail(ParseResult& result, const std::string& error_msg, const char* usage) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(error_msg, usage);
}

/// Значение опции: следующий аргумент
///
/// @return false и заполненная диагностика, если значения нет
bool take_value(int argc, char** argv, int& i, const char* display, ParseResult& result,
                const char* usage, std::string& out) {
    if (i + 1 >= argc) {
        fail(result,
             std::string("a value is required for '") + display + "' but none was supplied",
             usage);
        return false;
    }
    ++i;
    out = argv[i];
    return true;
}

bool parse_thread_count(const char* text, int& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value < 0 || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

/// Глобальные опции допустимы и до, и после подкоманды
///
/// @return true если аргумент распознан (возможно с ошибкой в result)
bool parse_global(int argc, char** argv, int& i, ParseResult& result, const char* usage) {
    const char* arg = argv[i];

    if (str_eq(arg, "--no-banner")) {
        result.global.no_banner = true;
        return true;
    }
    if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        result.global.quiet = true;
        return true;
    }
    // -v, -vv, -vvv
    if (arg[0] == '-' && arg[1] == 'v' && arg[1 + std::strspn(arg + 1, "v")] == '\0') {
        result.global.verbose += static_cast<int>(std::strlen(arg) - 1);
        return true;
    }

    std::string value;
    if (str_eq(arg, "--num-threads")) {
        if (!take_value(argc, argv, i, "--num-threads <NUM_THREADS>", result, usage, value)) {
            return true;
        }
    } else if (starts_with(arg, "--num-threads=")) {
        value = arg + std::strlen("--num-threads=");
    } else {
        return false;
    }

    if (!parse_thread_count(value.c_str(), result.global.num_threads)) {
        fail(result,
             "invalid value '" + value +
                 "' for '--num-threads <NUM_THREADS>': expected a non-negative integer",
             usage);
    }
    return true;
}

bool has_diagnostic(const ParseResult& result) {
    return !result.diagnostic.stderr_message.empty();
}

// ----------------------------------------------------------------------------
// scan
// ----------------------------------------------------------------------------

void parse_scan(int argc, char** argv, int start, ParseResult& result) {
    ScanCommand scan_cmd;
    std::vector<std::filesystem::path> positional;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;

        if (parse_global(argc, argv, i, result, USAGE_SCAN)) {
            if (has_diagnostic(result)) {
                return;
            }
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"scan"};
            return;
        } else if (str_eq(arg, "-k") || str_eq(arg, "--keyword")) {
            if (!take_value(argc, argv, i, "--keyword <KEYWORD>", result, USAGE_SCAN, value)) {
                return;
            }
            scan_cmd.keywords.push_back(value);
        } else if (starts_with(arg, "--keyword=")) {
            scan_cmd.keywords.emplace_back(arg + std::strlen("--keyword="));
        } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
            if (!take_value(argc, argv, i, "--config <CONFIG>", result, USAGE_SCAN, value)) {
                return;
            }
            scan_cmd.config = platform::path_from_utf8(value);
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            if (!take_value(argc, argv, i, "--output <OUTPUT>", result, USAGE_SCAN, value)) {
                return;
            }
            scan_cmd.output = platform::path_from_utf8(value);
        } else if (str_eq(arg, "--exclude")) {
            if (!take_value(argc, argv, i, "--exclude <PATH>", result, USAGE_SCAN, value)) {
                return;
            }
            scan_cmd.excludes.push_back(platform::path_from_utf8(value));
        } else if (str_eq(arg, "--no-parallel")) {
            scan_cmd.no_parallel = true;
        } else if (str_eq(arg, "--verify-headers")) {
            scan_cmd.verify_headers = true;
        } else if (str_eq(arg, "--dry-run")) {
            scan_cmd.dry_run = true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            scan_cmd.json = true;
        } else if (str_eq(arg, "--jsonl")) {
            scan_cmd.jsonl = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            fail(result, std::string("unexpected argument '") + arg + "' found", USAGE_SCAN);
            return;
        } else {
            positional.push_back(platform::path_from_utf8(arg));
        }
    }

    if (positional.size() < 2) {
        std::string missing = positional.empty() ? "  <SCAN_ROOT>\n  <OUTPUT_ROOT>"
                                                 : "  <OUTPUT_ROOT>";
        fail(result, "the following required arguments were not provided:\n" + missing,
             USAGE_SCAN);
        return;
    }
    if (positional.size() > 2) {
        fail(result,
             "unexpected argument '" + platform::path_to_utf8(positional[2]) + "' found",
             USAGE_SCAN);
        return;
    }
    if (scan_cmd.json && scan_cmd.jsonl) {
        fail(result, "the argument '--json' cannot be used with '--jsonl'", USAGE_SCAN);
        return;
    }

    scan_cmd.scan_root = positional[0];
    scan_cmd.output_root = positional[1];

    result.ok = true;
    result.command = std::move(scan_cmd);
}

// ----------------------------------------------------------------------------
// classify
// ----------------------------------------------------------------------------

void parse_classify(int argc, char** argv, int start, ParseResult& result) {
    ClassifyCommand classify_cmd;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;

        if (parse_global(argc, argv, i, result, USAGE_CLASSIFY)) {
            if (has_diagnostic(result)) {
                return;
            }
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"classify"};
            return;
        } else if (str_eq(arg, "-k") || str_eq(arg, "--keyword")) {
            if (!take_value(argc, argv, i, "--keyword <KEYWORD>", result, USAGE_CLASSIFY,
                            value)) {
                return;
            }
            classify_cmd.keywords.push_back(value);
        } else if (starts_with(arg, "--keyword=")) {
            classify_cmd.keywords.emplace_back(arg + std::strlen("--keyword="));
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            classify_cmd.json = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            fail(result, std::string("unexpected argument '") + arg + "' found", USAGE_CLASSIFY);
            return;
        } else {
            classify_cmd.paths.push_back(platform::path_from_utf8(arg));
        }
    }

    if (classify_cmd.paths.empty()) {
        fail(result, "the following required arguments were not provided:\n  <PATH>...",
             USAGE_CLASSIFY);
        return;
    }

    result.ok = true;
    result.command = std::move(classify_cmd);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("salvage ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: salvage [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  scan      Scan a directory tree and copy recovered project files\n"
               "  classify  Classify individual files without copying\n"
               "  help      Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner                  Hide the banner\n"
               "      --num-threads <NUM_THREADS>  Limit the thread number (default: num of CPUs)\n"
               "  -v...                            Print verbose output\n"
               "  -q                               Suppress informational output\n"
               "  -h, --help                       Print help\n"
               "  -V, --version                    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Recover Live Sets and Packs from an old drive:\n"
               "        ./salvage scan /mnt/old_drive ~/Recovered\n"
               "\n"
               "    Also keep any file whose name mentions 'backup', without copying:\n"
               "        ./salvage scan /mnt/old_drive ~/Recovered -k backup --dry-run\n"
               "\n"
               "    Check what a single file looks like:\n"
               "        ./salvage classify ~/Downloads/mystery.dat\n";
    } else if (*command == "scan") {
        return "Scan a directory tree and copy recovered project files\n"
               "\n"
               "Usage: salvage scan [OPTIONS] <SCAN_ROOT> <OUTPUT_ROOT>\n"
               "\n"
               "Arguments:\n"
               "  <SCAN_ROOT>    Directory to scan\n"
               "  <OUTPUT_ROOT>  Directory to copy recovered files into\n"
               "\n"
               "Options:\n"
               "  -k, --keyword <KEYWORD>  Also recover files whose name contains this word\n"
               "  -c, --config <CONFIG>    Load settings from a YAML file\n"
               "      --exclude <PATH>     Skip this directory while scanning\n"
               "      --no-parallel        Scan and copy on a single thread\n"
               "      --verify-headers     Read the header of every file\n"
               "      --dry-run            Report what would be copied without copying\n"
               "  -j, --json               Print the final report as JSON\n"
               "      --jsonl              Stream events as JSON lines\n"
               "  -o, --output <OUTPUT>    Save the report to a file\n"
               "  -h, --help               Print help\n";
    } else if (*command == "classify") {
        return "Classify individual files without copying\n"
               "\n"
               "Usage: salvage classify [OPTIONS] <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Files to classify\n"
               "\n"
               "Options:\n"
               "  -k, --keyword <KEYWORD>  Treat names containing this word as matches\n"
               "  -j, --json               Output as JSON lines\n"
               "  -h, --help               Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (parse_global(argc, argv, i, result, USAGE_MAIN)) {
            if (has_diagnostic(result)) {
                return result;
            }
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            fail(result, std::string("unexpected argument '") + arg + "' found", USAGE_MAIN);
            return result;
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "scan")) {
        parse_scan(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "classify")) {
        parse_classify(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        fail(result, std::string("unrecognized subcommand '") + cmd + "'", USAGE_MAIN);
    }

    return result;
}

}  // namespace salvage::cli
