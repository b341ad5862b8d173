// ==============================================================================
// classifier.cpp - Классификация файлов
// ==============================================================================

#include "salvage/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <memory>

namespace salvage::classify {

// ----------------------------------------------------------------------------
// Строковые представления
// ----------------------------------------------------------------------------

const char* kind_to_string(Kind kind) {
    switch (kind) {
    case Kind::ProjectFile:
        return "ProjectFile";
    case Kind::ProjectArchive:
        return "ProjectArchive";
    case Kind::KeywordMatch:
        return "KeywordMatch";
    case Kind::None:
        return "None";
    }
    return "None";
}

const char* basis_to_string(Basis basis) {
    switch (basis) {
    case Basis::Extension:
        return "Extension";
    case Basis::Header:
        return "Header";
    case Basis::Keyword:
        return "Keyword";
    case Basis::Combination:
        return "Combination";
    }
    return "Extension";
}

const char* kind_subdir(Kind kind) {
    switch (kind) {
    case Kind::ProjectFile:
        return "ProjectFiles";
    case Kind::ProjectArchive:
        return "ProjectArchives";
    case Kind::KeywordMatch:
        return "KeywordMatches";
    case Kind::None:
        break;
    }
    return "";
}

bool operator==(const ClassificationResult& a, const ClassificationResult& b) {
    return a.path == b.path && a.kind == b.kind && a.basis == b.basis;
}

bool operator!=(const ClassificationResult& a, const ClassificationResult& b) {
    return !(a == b);
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string lower_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    return to_lower_ascii(ext);
}

bool header_has_zip_signature(std::string_view header) {
    return header.size() >= kZipSignature.size() &&
           header.compare(0, kZipSignature.size(), kZipSignature) == 0;
}

bool header_has_xml_marker(std::string_view header, const ClassifierRules& rules) {
    for (const auto& marker : rules.xml_markers) {
        if (!marker.empty() && header.find(marker) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

HeaderProbe read_header(const std::filesystem::path& path, size_t max_bytes) {
    HeaderProbe probe;

    struct FileCloser {
        void operator()(std::FILE* f) const { std::fclose(f); }
    };

    errno = 0;
#ifdef _WIN32
    std::unique_ptr<std::FILE, FileCloser> file(_wfopen(path.c_str(), L"rb"));
#else
    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(path.c_str(), "rb"));
#endif
    if (!file) {
        int err = errno != 0 ? errno : EIO;
        probe.error = std::error_code(err, std::generic_category());
        return probe;
    }

    probe.bytes.resize(max_bytes);
    size_t n = std::fread(probe.bytes.data(), 1, max_bytes, file.get());
    if (n < max_bytes && std::ferror(file.get()) != 0) {
        probe.bytes.clear();
        probe.error = std::make_error_code(std::errc::io_error);
        return probe;
    }
    probe.bytes.resize(n);
    probe.ok = true;
    return probe;
}

// ----------------------------------------------------------------------------
// KeywordSet
// ----------------------------------------------------------------------------

KeywordSet::KeywordSet(const std::vector<std::string>& words) {
    for (const auto& w : words) {
        if (w.empty()) {
            continue;
        }
        std::string lowered = to_lower_ascii(w);
        if (std::find(words_.begin(), words_.end(), lowered) == words_.end()) {
            words_.push_back(std::move(lowered));
        }
    }
}

std::optional<std::string> KeywordSet::find_in(std::string_view name) const {
    if (words_.empty()) {
        return std::nullopt;
    }
    const std::string lowered = to_lower_ascii(name);
    for (const auto& w : words_) {
        if (lowered.find(w) != std::string::npos) {
            return w;
        }
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// FileClassifier
// ----------------------------------------------------------------------------

FileClassifier::FileClassifier(ClassifierRules rules, KeywordSet keywords)
    : rules_(std::move(rules)), keywords_(std::move(keywords)) {
    rules_.project_extension = to_lower_ascii(rules_.project_extension);
    rules_.archive_extension = to_lower_ascii(rules_.archive_extension);
}

bool FileClassifier::needs_header(const std::filesystem::path& path) const {
    if (rules_.verify_headers) {
        return true;
    }
    const std::string ext = lower_extension(path);
    return ext != rules_.project_extension && ext != rules_.archive_extension;
}

ClassificationResult FileClassifier::classify(const std::filesystem::path& path,
                                              std::optional<std::string_view> header) const {
    ClassificationResult result;
    result.path = path;

    const std::string ext = lower_extension(path);
    const bool ext_project = !ext.empty() && ext == rules_.project_extension;
    const bool ext_archive = !ext.empty() && ext == rules_.archive_extension;

    const bool xml = header.has_value() && header_has_xml_marker(*header, rules_);
    const bool zip = header.has_value() && header_has_zip_signature(*header);

    // 1. ProjectFile по расширению
    if (ext_project) {
        result.kind = Kind::ProjectFile;
        result.basis = (xml || zip) ? Basis::Combination : Basis::Extension;
        return result;
    }

    // 2. ProjectArchive по расширению: ZIP-заголовок только подтверждает
    if (ext_archive) {
        result.kind = Kind::ProjectArchive;
        result.basis = zip ? Basis::Combination : Basis::Extension;
        return result;
    }

    // 1b. ProjectFile по заголовку при любом другом расширении
    if (xml || zip) {
        result.kind = Kind::ProjectFile;
        result.basis = Basis::Header;
        return result;
    }

    // 3. Ключевые слова - только по имени файла
    if (keywords_.matches(path.filename().string())) {
        result.kind = Kind::KeywordMatch;
        result.basis = Basis::Keyword;
        return result;
    }

    result.kind = Kind::None;
    return result;
}

Inspection FileClassifier::inspect(const std::filesystem::path& path) const {
    Inspection out;

    if (!needs_header(path)) {
        out.result = classify(path, std::nullopt);
        return out;
    }

    HeaderProbe probe = read_header(path, rules_.header_bytes);
    if (!probe.ok) {
        // Деградация до классификации по имени
        out.header_error = probe.error;
        out.result = classify(path, std::nullopt);
        return out;
    }

    out.result = classify(path, std::string_view(probe.bytes));
    return out;
}

}  // namespace salvage::classify
