// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include "salvage/platform.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <thread>

#ifdef _WIN32
#include <io.h>
#include <process.h>
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace salvage::platform {

namespace {

std::atomic<unsigned long long> g_temp_counter{0};

}  // namespace

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: конвертируем UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    // Unix: native string обычно UTF-8
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Метаданные файлов
// ----------------------------------------------------------------------------

bool copy_timestamps(const std::filesystem::path& src, const std::filesystem::path& dst,
                     std::error_code& ec) {
    ec.clear();
#ifdef _WIN32
    auto mtime = std::filesystem::last_write_time(src, ec);
    if (ec) {
        return false;
    }
    std::filesystem::last_write_time(dst, mtime, ec);
    return !ec;
#else
    struct stat st {};
    if (::stat(src.c_str(), &st) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }

    struct timespec times[2];
#ifdef __APPLE__
    times[0] = st.st_atimespec;
    times[1] = st.st_mtimespec;
#else
    times[0] = st.st_atim;
    times[1] = st.st_mtim;
#endif
    if (::utimensat(AT_FDCWD, dst.c_str(), times, 0) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    return true;
#endif
}

std::filesystem::path temp_sibling(const std::filesystem::path& target) {
#ifdef _WIN32
    const auto pid = static_cast<unsigned long long>(_getpid());
#else
    const auto pid = static_cast<unsigned long long>(::getpid());
#endif
    const auto seq = g_temp_counter.fetch_add(1, std::memory_order_relaxed);

    // Длина имени не зависит от target: длинные имена не упираются в NAME_MAX
    const std::string name =
        ".salvage-" + std::to_string(pid) + "-" + std::to_string(seq) + ".partial";
    return target.parent_path() / name;
}

unsigned hardware_threads() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace salvage::platform
