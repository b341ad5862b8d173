// ==============================================================================
// config.cpp - Конфигурация сканирования
// ==============================================================================

#include "salvage/config.hpp"

#include "salvage/platform.hpp"

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace salvage::config {

namespace {

std::string normalize_extension(std::string ext) {
    while (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    return classify::to_lower_ascii(ext);
}

std::vector<std::string> read_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            out.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
    return out;
}

}  // namespace

ConfigResult load_string(const std::string& yaml, ScanConfig& cfg) {
    ConfigResult result;

    try {
        YAML::Node root = YAML::Load(yaml);

        if (root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error = "config root must be a mapping";
            return result;
        }

        if (root["keywords"]) {
            for (auto& k : read_string_list(root["keywords"])) {
                cfg.keywords.push_back(std::move(k));
            }
        }
        if (root["workers"]) {
            cfg.workers = root["workers"].as<int>();
        }
        if (root["verify_headers"]) {
            cfg.verify_headers = root["verify_headers"].as<bool>();
        }
        if (root["header_bytes"]) {
            cfg.header_bytes = root["header_bytes"].as<size_t>();
        }
        if (root["project_extension"]) {
            cfg.project_extension = root["project_extension"].as<std::string>();
        }
        if (root["archive_extension"]) {
            cfg.archive_extension = root["archive_extension"].as<std::string>();
        }
        if (root["excludes"]) {
            for (const auto& ex : read_string_list(root["excludes"])) {
                cfg.excludes.push_back(platform::path_from_utf8(ex));
            }
        }

        result.ok = true;
        return result;

    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

ConfigResult load_file(const std::filesystem::path& path, ScanConfig& cfg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        ConfigResult result;
        result.error = "cannot open config file: " + platform::path_to_utf8(path);
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str(), cfg);
}

ConfigResult validate(ScanConfig& cfg) {
    ConfigResult result;

    if (cfg.scan_root.empty()) {
        result.error = "scan root is required";
        return result;
    }
    if (cfg.output_root.empty()) {
        result.error = "output root is required";
        return result;
    }
    if (cfg.workers < 0) {
        result.error = "worker count must not be negative";
        return result;
    }
    if (cfg.header_bytes < kMinHeaderBytes || cfg.header_bytes > kMaxHeaderBytes) {
        result.error = "header_bytes must be between " + std::to_string(kMinHeaderBytes) +
                       " and " + std::to_string(kMaxHeaderBytes);
        return result;
    }

    cfg.project_extension = normalize_extension(cfg.project_extension);
    cfg.archive_extension = normalize_extension(cfg.archive_extension);
    if (cfg.project_extension.empty() || cfg.archive_extension.empty()) {
        result.error = "project and archive extensions must not be empty";
        return result;
    }
    if (cfg.project_extension == cfg.archive_extension) {
        result.error = "project and archive extensions must differ";
        return result;
    }

    std::error_code ec;
    auto scan_abs = std::filesystem::absolute(cfg.scan_root, ec);
    if (ec) {
        result.error = "cannot resolve scan root: " + ec.message();
        return result;
    }
    auto out_abs = std::filesystem::absolute(cfg.output_root, ec);
    if (ec) {
        result.error = "cannot resolve output root: " + ec.message();
        return result;
    }
    cfg.scan_root = scan_abs.lexically_normal();
    cfg.output_root = out_abs.lexically_normal();

    result.ok = true;
    return result;
}

classify::ClassifierRules classifier_rules(const ScanConfig& cfg) {
    classify::ClassifierRules rules;
    rules.project_extension = cfg.project_extension;
    rules.archive_extension = cfg.archive_extension;
    rules.header_bytes = cfg.header_bytes;
    rules.verify_headers = cfg.verify_headers;
    return rules;
}

}  // namespace salvage::config
