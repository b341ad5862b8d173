// ==============================================================================
// test_tree.hpp - Временные деревья каталогов для тестов
// ==============================================================================
//
// Уникальная директория на тест: имя теста + PID, чтобы ctest -j не
// пересекался между процессами. Каталоги, у которых тест снял права,
// восстанавливаются в TearDown до удаления.
//
// ==============================================================================

#ifndef SALVAGE_TEST_TREE_HPP
#define SALVAGE_TEST_TREE_HPP

#include "salvage/classifier.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace salvage::test {

inline long current_pid() {
#ifdef _WIN32
    return static_cast<long>(GetCurrentProcessId());
#else
    return static_cast<long>(getpid());
#endif
}

/// Права каталогов не действуют для root: такие тесты пропускаются
inline bool running_as_root() {
#ifdef _WIN32
    return false;
#else
    return geteuid() == 0;
#endif
}

/// Заголовок ZIP-архива и немного мусора после него
inline std::string zip_bytes() {
    std::string s(classify::kZipSignature);
    s += std::string("\x14\x00\x00\x00\x08\x00", 6);
    s += "payload";
    return s;
}

/// Начало несжатого Live Set
inline std::string live_set_xml() {
    return std::string("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n") +
           std::string(classify::kLiveSetMarker) + " MajorVersion=\"5\">\n";
}

inline std::string read_all(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class TempTreeTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("salvage_") + test_info->test_case_name() + "_" +
                                  test_info->name() + "_" + std::to_string(current_pid());

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        for (const auto& dir : locked_) {
            std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace, ec);
        }
        std::filesystem::remove_all(test_dir_, ec);
    }

    /// Создать файл (с родительскими каталогами) относительно test_dir_
    std::filesystem::path write_file(const std::filesystem::path& rel,
                                     const std::string& content = "test content") {
        std::filesystem::path path = test_dir_ / rel;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    std::filesystem::path make_dir(const std::filesystem::path& rel) {
        std::filesystem::path path = test_dir_ / rel;
        std::filesystem::create_directories(path);
        return path;
    }

    /// Снять все права с каталога (восстанавливаются в TearDown)
    void lock_dir(const std::filesystem::path& dir) {
        std::filesystem::permissions(dir, std::filesystem::perms::none,
                                     std::filesystem::perm_options::replace);
        locked_.push_back(dir);
    }

    /// Все обычные файлы поддерева относительно base, отсортированные
    static std::vector<std::string> list_tree(const std::filesystem::path& base) {
        std::vector<std::string> out;
        std::error_code ec;
        if (!std::filesystem::exists(base, ec)) {
            return out;
        }
        for (auto it = std::filesystem::recursive_directory_iterator(base, ec);
             it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            if (it->is_regular_file(ec)) {
                out.push_back(it->path().lexically_relative(base).generic_string());
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    std::vector<std::filesystem::path> locked_;
};

}  // namespace salvage::test

#endif  // SALVAGE_TEST_TREE_HPP
