// ==============================================================================
// discovery.cpp - Обход дерева каталогов
// ==============================================================================
//
// Обход в ширину: файлы верхних уровней выдаются раньше, поэтому совпадения
// у корня появляются в прогрессе до глубоких поддеревьев.
//
// ==============================================================================

#include "salvage/discovery.hpp"

#include "salvage/platform.hpp"

#include <algorithm>
#include <stdexcept>

namespace salvage::io {

namespace {

std::filesystem::path normalize(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(p, ec);
    if (ec) {
        abs = p;
    }
    abs = abs.lexically_normal();
    // "a/b/" -> "a/b": иначе сравнение с путями элементов не совпадёт
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

const char* kind_description(EnumerationErrorKind kind) {
    switch (kind) {
    case EnumerationErrorKind::RootInaccessible:
        return "scan root is inaccessible";
    case EnumerationErrorKind::DirectoryUnreadable:
        return "failed to read directory";
    case EnumerationErrorKind::EntryUnreadable:
        return "failed to get metadata for entry";
    }
    return "enumeration error";
}

}  // namespace

std::string EnumerationError::format() const {
    return std::string(kind_description(kind)) + " '" + platform::path_to_utf8(path) + "' - " +
           cause.message();
}

// ----------------------------------------------------------------------------
// DirectoryEnumerator
// ----------------------------------------------------------------------------

DirectoryEnumerator::DirectoryEnumerator(std::filesystem::path root, EnumeratorOptions opt)
    : root_(std::move(root)), options_(std::move(opt)) {
    for (const auto& ex : options_.excludes) {
        normalized_excludes_.push_back(normalize(ex));
    }
}

std::optional<EnumerationError> DirectoryEnumerator::open() {
    opened_ = false;
    single_file_.reset();
    pending_.clear();
    current_ = std::filesystem::directory_iterator();

    std::error_code ec;
    std::filesystem::file_status st = std::filesystem::status(root_, ec);
    if (ec || !std::filesystem::exists(st)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return EnumerationError{EnumerationErrorKind::RootInaccessible, root_, ec};
    }

    if (std::filesystem::is_regular_file(st)) {
        // Корень - одиночный файл
        single_file_ = root_;
        opened_ = true;
        return std::nullopt;
    }

    if (!std::filesystem::is_directory(st)) {
        return EnumerationError{EnumerationErrorKind::RootInaccessible, root_,
                                std::make_error_code(std::errc::not_a_directory)};
    }

    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        return EnumerationError{EnumerationErrorKind::RootInaccessible, root_, ec};
    }

    current_ = std::move(it);
    current_dir_ = root_;
    folder_reported_ = false;
    ++directories_visited_;
    opened_ = true;
    return std::nullopt;
}

bool DirectoryEnumerator::next(std::filesystem::path& out) {
    if (!opened_) {
        return false;
    }

    if (single_file_.has_value()) {
        out = std::move(*single_file_);
        single_file_.reset();
        return true;
    }

    const std::filesystem::directory_iterator end;
    while (true) {
        while (current_ != end) {
            const std::filesystem::directory_entry entry = *current_;

            std::error_code inc_ec;
            current_.increment(inc_ec);
            if (inc_ec) {
                // Каталог исчез или стал недоступен посреди чтения
                report(EnumerationErrorKind::DirectoryUnreadable, current_dir_, inc_ec);
                current_ = std::filesystem::directory_iterator();
            }

            std::error_code st_ec;
            std::filesystem::file_status st = entry.symlink_status(st_ec);
            if (st_ec) {
                report(EnumerationErrorKind::EntryUnreadable, entry.path(), st_ec);
                continue;
            }

            if (std::filesystem::is_symlink(st)) {
                continue;
            }

            if (is_excluded(entry.path())) {
                continue;
            }

            if (std::filesystem::is_directory(st)) {
                check_project_marker(entry.path());
                pending_.push_back(entry.path());
                continue;
            }

            if (std::filesystem::is_regular_file(st)) {
                out = entry.path();
                return true;
            }
            // FIFO, сокеты, устройства пропускаются
        }

        if (!enter_next_directory()) {
            return false;
        }
    }
}

bool DirectoryEnumerator::enter_next_directory() {
    while (!pending_.empty()) {
        std::filesystem::path dir = std::move(pending_.front());
        pending_.pop_front();

        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            report(EnumerationErrorKind::DirectoryUnreadable, dir, ec);
            continue;
        }

        current_ = std::move(it);
        current_dir_ = std::move(dir);
        folder_reported_ = false;
        ++directories_visited_;
        return true;
    }
    return false;
}

void DirectoryEnumerator::report(EnumerationErrorKind kind, const std::filesystem::path& path,
                                 std::error_code cause) {
    ++errors_reported_;
    if (on_error_) {
        on_error_(EnumerationError{kind, path, cause});
    }
}

bool DirectoryEnumerator::is_excluded(const std::filesystem::path& path) const {
    if (normalized_excludes_.empty()) {
        return false;
    }
    const std::filesystem::path norm = normalize(path);
    return std::find(normalized_excludes_.begin(), normalized_excludes_.end(), norm) !=
           normalized_excludes_.end();
}

void DirectoryEnumerator::check_project_marker(const std::filesystem::path& child) {
    if (folder_reported_ || !on_folder_) {
        return;
    }
    const std::string name = child.filename().string();
    const auto& markers = options_.project_folder_markers;
    if (std::find(markers.begin(), markers.end(), name) != markers.end()) {
        folder_reported_ = true;
        on_folder_(current_dir_);
    }
}

// ----------------------------------------------------------------------------
// collect_files
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> collect_files(const std::filesystem::path& root,
                                                 const EnumeratorOptions& opt,
                                                 std::vector<EnumerationError>* errors) {
    DirectoryEnumerator enumerator(root, opt);
    if (errors != nullptr) {
        enumerator.on_error([errors](const EnumerationError& e) { errors->push_back(e); });
    }

    if (auto err = enumerator.open()) {
        throw std::runtime_error(err->format());
    }

    std::vector<std::filesystem::path> result;
    std::filesystem::path p;
    while (enumerator.next(p)) {
        result.push_back(p);
    }

    // Детерминированный порядок независимо от порядка readdir
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace salvage::io
