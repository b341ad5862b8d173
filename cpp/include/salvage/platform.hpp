// ==============================================================================
// salvage/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для цветного вывода и прогресса
// - Перенос временных меток файла (atime/mtime) при копировании
// - Уникальные имена временных файлов рядом с целевым файлом
//
// Вся платформенная специфика изолирована в этом модуле.
//
// ==============================================================================

#ifndef SALVAGE_PLATFORM_HPP
#define SALVAGE_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace salvage::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить путь из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Преобразовать путь в UTF-8 строку
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Метаданные файлов
// ----------------------------------------------------------------------------

/// Скопировать время доступа и модификации с src на dst
///
/// POSIX: stat() + utimensat() с наносекундной точностью.
/// Windows: только last_write_time через std::filesystem.
///
/// @return false и ec при ошибке
bool copy_timestamps(const std::filesystem::path& src, const std::filesystem::path& dst,
                     std::error_code& ec);

/// Сформировать имя временного файла в каталоге target
///
/// Имя скрытое (начинается с '.'), короткое и состоит только из PID и
/// счётчика процесса, поэтому не пересекается с другими потоками и с
/// зеркалируемыми файлами.
/// Файл не создаётся.
std::filesystem::path temp_sibling(const std::filesystem::path& target);

/// Число аппаратных потоков (минимум 1)
unsigned hardware_threads();

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name();

}  // namespace salvage::platform

#endif  // SALVAGE_PLATFORM_HPP
