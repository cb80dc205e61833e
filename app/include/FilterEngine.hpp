// FilterEngine.hpp
// Decides whether a file satisfies a rule's filters and extracts regex captures

#ifndef FILTER_ENGINE_HPP
#define FILTER_ENGINE_HPP

#include "RuleTypes.hpp"
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <optional>
#include <variant>

struct FilterMatch {
    bool matched = false;
    std::optional<CaptureSet> captures;     // Only for a matching Regex filename filter
};

// Glob patterns are whole-name and case-sensitive: "Shot_*" does not match "shot_1.png".
struct GlobMatcher {
    QString pattern;
    QRegularExpression expression;
};

// Regex patterns are searched (not implicitly anchored); use ^ and $ to pin them.
struct RegexMatcher {
    QRegularExpression expression;
    QStringList group_names;
};

using NameMatcher = std::variant<GlobMatcher, RegexMatcher>;

class FilterEngine {
public:
    // Compiles the patterns once; use is_valid() before evaluating.
    explicit FilterEngine(const Filters& filters);
    
    bool is_valid() const { return error_.isEmpty(); }
    QString error_message() const { return error_; }
    
    FilterMatch evaluate(const FileEntry& entry) const;
    
    // Trims, lower-cases and dot-prefixes each entry, dropping blanks and duplicates.
    static QStringList normalize_extensions(const QStringList& extensions);
    // ".jpg" for "a.JPG"; empty for "README" and ".bashrc"
    static QString extension_of(const QString& filename);
    static bool in_range(const QDateTime& value, const DateTimeRange& range);
    static std::optional<NameMatcher> compile(const FilenameFilter& filter, QString& error);
    
private:
    bool match_extension(const QString& filename) const;
    bool match_name(const QString& filename, std::optional<CaptureSet>& captures) const;
    
    std::optional<QStringList> extensions_;
    std::optional<NameMatcher> name_matcher_;
    std::optional<DateTimeRange> created_range_;
    std::optional<DateTimeRange> modified_range_;
    QString error_;
};

#endif // FILTER_ENGINE_HPP
