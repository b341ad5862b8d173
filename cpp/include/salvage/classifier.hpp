// ==============================================================================
// salvage/classifier.hpp - Классификация файлов
// ==============================================================================
//
// Назначение:
// - Kind / Basis: тип совпадения и сигнал, который его дал
// - KeywordSet: регистронезависимые подстроки для имён файлов
// - ClassifierRules: расширения и сигнатуры заголовков
// - FileClassifier: чистая классификация + ленивое чтение заголовка
//
// Приоритет (первое совпадение выигрывает):
//   1. ProjectFile     - расширение проекта ИЛИ сигнатура заголовка (XML/ZIP)
//   2. ProjectArchive  - расширение архива
//   3. KeywordMatch    - имя файла содержит ключевое слово
//   4. None
//
// ==============================================================================

#ifndef SALVAGE_CLASSIFIER_HPP
#define SALVAGE_CLASSIFIER_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace salvage::classify {

// ----------------------------------------------------------------------------
// Kind / Basis
// ----------------------------------------------------------------------------

enum class Kind {
    ProjectFile,     // Live Set (.als) - XML, возможно в ZIP-контейнере
    ProjectArchive,  // Live Pack (.alp)
    KeywordMatch,    // Совпадение по ключевому слову в имени
    None
};

enum class Basis {
    Extension,   // Только расширение
    Header,      // Только сигнатура заголовка
    Keyword,     // Ключевое слово в имени
    Combination  // Расширение и заголовок согласны
};

const char* kind_to_string(Kind kind);
const char* basis_to_string(Basis basis);

/// Имя подкаталога вывода для типа: ProjectFiles / ProjectArchives / KeywordMatches
/// Для Kind::None возвращает пустую строку
const char* kind_subdir(Kind kind);

/// Все типы, которые доходят до копирования (без None)
constexpr Kind kRecoverableKinds[] = {Kind::ProjectFile, Kind::ProjectArchive,
                                      Kind::KeywordMatch};

// ----------------------------------------------------------------------------
// ClassificationResult
// ----------------------------------------------------------------------------

struct ClassificationResult {
    std::filesystem::path path;
    Kind kind = Kind::None;
    Basis basis = Basis::Extension;

    bool matched() const { return kind != Kind::None; }
};

bool operator==(const ClassificationResult& a, const ClassificationResult& b);
bool operator!=(const ClassificationResult& a, const ClassificationResult& b);

// ----------------------------------------------------------------------------
// KeywordSet
// ----------------------------------------------------------------------------

/// Упорядоченный набор ключевых слов
///
/// Слова хранятся в нижнем регистре (ASCII), пустые отбрасываются,
/// повторы (без учёта регистра) схлопываются в первое вхождение.
class KeywordSet {
public:
    KeywordSet() = default;
    explicit KeywordSet(const std::vector<std::string>& words);

    /// Первое ключевое слово, входящее в name, или nullopt
    std::optional<std::string> find_in(std::string_view name) const;

    bool matches(std::string_view name) const { return find_in(name).has_value(); }

    bool empty() const { return words_.empty(); }
    size_t size() const { return words_.size(); }
    const std::vector<std::string>& words() const { return words_; }

private:
    std::vector<std::string> words_;
};

// ----------------------------------------------------------------------------
// ClassifierRules
// ----------------------------------------------------------------------------

/// Сигнатура локального заголовка ZIP: "PK\x03\x04"
constexpr std::string_view kZipSignature{"PK\x03\x04", 4};

/// Маркер корневого элемента несжатого Live Set
constexpr std::string_view kLiveSetMarker = "<Ableton Live Set";

/// Правила классификации
struct ClassifierRules {
    std::string project_extension = "als";  // без точки, нижний регистр
    std::string archive_extension = "alp";

    /// Маркеры XML-проекта, которые ищутся в пределах заголовка
    std::vector<std::string> xml_markers = {std::string(kLiveSetMarker)};

    /// Размер читаемого префикса файла
    size_t header_bytes = 128;

    /// true: читать заголовок у каждого файла (даёт Basis::Combination)
    /// false: только если расширение не даёт ответа
    bool verify_headers = false;
};

// ----------------------------------------------------------------------------
// Чтение заголовка
// ----------------------------------------------------------------------------

struct HeaderProbe {
    bool ok = false;
    std::string bytes;  // может быть короче запрошенного для малых файлов
    std::error_code error;
};

/// Прочитать до max_bytes байт с начала файла
HeaderProbe read_header(const std::filesystem::path& path, size_t max_bytes);

/// Совпадает ли заголовок с XML-маркером проекта
bool header_has_xml_marker(std::string_view header, const ClassifierRules& rules);

/// Начинается ли заголовок с сигнатуры ZIP
bool header_has_zip_signature(std::string_view header);

/// Расширение файла без точки в нижнем регистре
std::string lower_extension(const std::filesystem::path& path);

/// ASCII-нижний регистр
std::string to_lower_ascii(std::string_view s);

// ----------------------------------------------------------------------------
// FileClassifier
// ----------------------------------------------------------------------------

/// Результат полной инспекции файла (с чтением заголовка при необходимости)
struct Inspection {
    ClassificationResult result;

    /// Ошибка чтения заголовка, если чтение было и не удалось
    std::optional<std::error_code> header_error;
};

class FileClassifier {
public:
    FileClassifier(ClassifierRules rules, KeywordSet keywords);

    /// Чистая классификация
    ///
    /// @param path Путь файла (используется имя и расширение)
    /// @param header Префикс содержимого; nullopt если не читался или не удалось
    ClassificationResult classify(const std::filesystem::path& path,
                                  std::optional<std::string_view> header) const;

    /// Нужно ли читать заголовок для этого пути
    bool needs_header(const std::filesystem::path& path) const;

    /// Классифицировать файл на диске, читая заголовок лениво
    Inspection inspect(const std::filesystem::path& path) const;

    const ClassifierRules& rules() const { return rules_; }
    const KeywordSet& keywords() const { return keywords_; }

private:
    ClassifierRules rules_;
    KeywordSet keywords_;
};

}  // namespace salvage::classify

#endif  // SALVAGE_CLASSIFIER_HPP
