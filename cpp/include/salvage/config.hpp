// ==============================================================================
// salvage/config.hpp - Конфигурация сканирования
// ==============================================================================
//
// Назначение:
// - ScanConfig: разрешённая конфигурация, которую потребляет ядро
// - load_file(): YAML-файл конфигурации (yaml-cpp)
// - validate(): нормализация и проверка ограничений
//
// Формат YAML (все поля необязательны):
// @code
//   keywords: [backup, "homeless transfer"]
//   workers: 4
//   verify_headers: true
//   header_bytes: 256
//   project_extension: als
//   archive_extension: alp
//   excludes: [/proc, /sys]
// @endcode
//
// ==============================================================================

#ifndef SALVAGE_CONFIG_HPP
#define SALVAGE_CONFIG_HPP

#include "salvage/classifier.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace salvage::config {

constexpr size_t kMinHeaderBytes = 16;
constexpr size_t kMaxHeaderBytes = 4096;

struct ScanConfig {
    std::filesystem::path scan_root;
    std::filesystem::path output_root;
    std::vector<std::string> keywords;

    int workers = 0;  // 0 = аппаратный параллелизм, 1 = последовательно
    bool verify_headers = false;
    bool dry_run = false;
    size_t header_bytes = 128;

    std::string project_extension = "als";
    std::string archive_extension = "alp";

    std::vector<std::filesystem::path> excludes;
};

struct ConfigResult {
    bool ok = false;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Загрузить YAML-файл поверх текущих значений cfg
ConfigResult load_file(const std::filesystem::path& path, ScanConfig& cfg);

/// Загрузить YAML из строки (используется load_file и тестами)
ConfigResult load_string(const std::string& yaml, ScanConfig& cfg);

/// Проверить и нормализовать конфигурацию
///
/// - scan_root/output_root обязательны и приводятся к абсолютным путям
/// - расширения без точки, нижний регистр, непустые и различные
/// - header_bytes в [kMinHeaderBytes, kMaxHeaderBytes]
/// - workers >= 0
ConfigResult validate(ScanConfig& cfg);

/// Правила классификатора из конфигурации
classify::ClassifierRules classifier_rules(const ScanConfig& cfg);

}  // namespace salvage::config

#endif  // SALVAGE_CONFIG_HPP
