// ==============================================================================
// copier.cpp - Копирование найденных файлов
// ==============================================================================

#include "salvage/copier.hpp"

#include "salvage/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <memory>
#include <system_error>
#include <vector>

namespace salvage::recover {

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const { std::fclose(f); }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

FilePtr open_file(const std::filesystem::path& path, bool write, std::error_code& ec) {
    errno = 0;
#ifdef _WIN32
    FilePtr f(_wfopen(path.c_str(), write ? L"wb" : L"rb"));
#else
    FilePtr f(std::fopen(path.c_str(), write ? "wb" : "rb"));
#endif
    if (!f) {
        ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
    }
    return f;
}

std::string describe(const std::string& what, const std::filesystem::path& path,
                     const std::error_code& ec) {
    return what + " '" + platform::path_to_utf8(path) + "' - " + ec.message();
}

}  // namespace

FileCopier::FileCopier(CopyOptions opt, const scan::CancellationToken* cancel)
    : options_(opt), cancel_(cancel) {
    if (options_.buffer_size == 0) {
        options_.buffer_size = 64 * 1024;
    }
}

CopyOutcome FileCopier::copy(const OutputPlan& plan) const {
    CopyOutcome outcome;
    outcome.plan = plan;

    const std::filesystem::path temp = platform::temp_sibling(plan.destination);

    // Временный файл удаляется при любой неудаче
    auto fail = [&](std::string detail) {
        std::error_code rm_ec;
        std::filesystem::remove(temp, rm_ec);
        if (rm_ec) {
            detail += " (temporary file left behind: " + platform::path_to_utf8(temp) + ")";
        }
        outcome.succeeded = false;
        outcome.error_detail = std::move(detail);
        return outcome;
    };

    std::error_code ec;
    FilePtr src = open_file(plan.source, false, ec);
    if (!src) {
        outcome.error_detail = describe("cannot open source", plan.source, ec);
        return outcome;
    }

    FilePtr dst = open_file(temp, true, ec);
    if (!dst) {
        outcome.error_detail = describe("cannot create destination", plan.destination, ec);
        return outcome;
    }

    std::vector<char> buffer(options_.buffer_size);
    while (true) {
        if (cancel_ != nullptr && cancel_->cancelled()) {
            dst.reset();
            return fail("copy cancelled '" + platform::path_to_utf8(plan.source) + "'");
        }

        size_t n = std::fread(buffer.data(), 1, buffer.size(), src.get());
        if (n > 0 && std::fwrite(buffer.data(), 1, n, dst.get()) != n) {
            ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
            dst.reset();
            return fail(describe("write failed", plan.destination, ec));
        }
        if (n < buffer.size()) {
            if (std::ferror(src.get()) != 0) {
                dst.reset();
                return fail(describe("read failed", plan.source,
                                     std::make_error_code(std::errc::io_error)));
            }
            break;
        }
    }
    src.reset();

    // fclose сбрасывает буферы: ENOSPC может проявиться только здесь
    errno = 0;
    std::FILE* raw = dst.release();
    if (std::fclose(raw) != 0) {
        ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
        return fail(describe("write failed", plan.destination, ec));
    }

    if (options_.preserve_permissions) {
        auto perms = std::filesystem::status(plan.source, ec).permissions();
        if (!ec) {
            std::filesystem::permissions(temp, perms, std::filesystem::perm_options::replace, ec);
        }
        if (ec) {
            return fail(describe("cannot preserve permissions", plan.destination, ec));
        }
    }

    if (options_.preserve_timestamps) {
        if (!platform::copy_timestamps(plan.source, temp, ec)) {
            return fail(describe("cannot preserve timestamps", plan.destination, ec));
        }
    }

    std::filesystem::rename(temp, plan.destination, ec);
    if (ec) {
        return fail(describe("cannot move copy into place", plan.destination, ec));
    }

    outcome.succeeded = true;
    return outcome;
}

}  // namespace salvage::recover
