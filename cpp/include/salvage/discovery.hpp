// ==============================================================================
// salvage/discovery.hpp - Обход дерева каталогов
// ==============================================================================
//
// Назначение:
// - Ленивый обход поддерева в ширину (DirectoryEnumerator::next)
// - Ошибки отдельных каталогов не прерывают обход (EnumerationError)
// - Символические ссылки не разыменовываются и не выдаются
// - Исключённые пути пропускаются вместе с поддеревом
// - Подсказки о каталогах проектов ("Ableton Project Info", "Samples")
//
// Использование:
// @code
//   DirectoryEnumerator e(root);
//   if (auto err = e.open()) {
//       // фатально: корень недоступен
//   }
//   std::filesystem::path p;
//   while (e.next(p)) {
//       ...
//   }
// @endcode
//
// ==============================================================================

#ifndef SALVAGE_DISCOVERY_HPP
#define SALVAGE_DISCOVERY_HPP

#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace salvage::io {

// ----------------------------------------------------------------------------
// EnumerationError
// ----------------------------------------------------------------------------

enum class EnumerationErrorKind {
    RootInaccessible,     // Фатально: корень не существует или не открывается
    DirectoryUnreadable,  // Каталог не открылся или исчез во время чтения
    EntryUnreadable       // Не удалось получить статус элемента
};

struct EnumerationError {
    EnumerationErrorKind kind = EnumerationErrorKind::DirectoryUnreadable;
    std::filesystem::path path;
    std::error_code cause;

    /// "<описание> '<path>' - <cause>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// EnumeratorOptions
// ----------------------------------------------------------------------------

struct EnumeratorOptions {
    /// Пути, которые пропускаются вместе с поддеревом (например, каталог вывода)
    std::vector<std::filesystem::path> excludes;

    /// Имена подкаталогов, по которым каталог считается вероятным проектом
    std::vector<std::string> project_folder_markers = {"Ableton Project Info", "Samples"};
};

// ----------------------------------------------------------------------------
// DirectoryEnumerator
// ----------------------------------------------------------------------------

class DirectoryEnumerator {
public:
    using ErrorHandler = std::function<void(const EnumerationError&)>;
    using FolderHandler = std::function<void(const std::filesystem::path&)>;

    explicit DirectoryEnumerator(std::filesystem::path root, EnumeratorOptions opt = {});

    /// Обработчик восстановимых ошибок (по умолчанию ошибки только считаются)
    void on_error(ErrorHandler handler) { on_error_ = std::move(handler); }

    /// Обработчик подсказок о каталогах проектов
    void on_project_folder(FolderHandler handler) { on_folder_ = std::move(handler); }

    /// Открыть корень
    ///
    /// @return RootInaccessible при недоступном корне, иначе nullopt
    std::optional<EnumerationError> open();

    /// Получить следующий обычный файл
    ///
    /// @param out[out] Путь файла
    /// @return false когда поддерево исчерпано (или open() не вызывался/не удался)
    bool next(std::filesystem::path& out);

    const std::filesystem::path& root() const { return root_; }

    size_t directories_visited() const { return directories_visited_; }
    size_t errors_reported() const { return errors_reported_; }

private:
    bool enter_next_directory();
    void report(EnumerationErrorKind kind, const std::filesystem::path& path,
                std::error_code cause);
    bool is_excluded(const std::filesystem::path& path) const;
    void check_project_marker(const std::filesystem::path& child);

    std::filesystem::path root_;
    EnumeratorOptions options_;
    std::vector<std::filesystem::path> normalized_excludes_;

    ErrorHandler on_error_;
    FolderHandler on_folder_;

    bool opened_ = false;
    std::optional<std::filesystem::path> single_file_;
    std::deque<std::filesystem::path> pending_;
    std::filesystem::path current_dir_;
    std::filesystem::directory_iterator current_;
    bool folder_reported_ = false;

    size_t directories_visited_ = 0;
    size_t errors_reported_ = 0;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Собрать все файлы поддерева (для тестов и небольших деревьев)
///
/// @throws std::runtime_error если корень недоступен
std::vector<std::filesystem::path> collect_files(const std::filesystem::path& root,
                                                 const EnumeratorOptions& opt = {},
                                                 std::vector<EnumerationError>* errors = nullptr);

}  // namespace salvage::io

#endif  // SALVAGE_DISCOVERY_HPP
