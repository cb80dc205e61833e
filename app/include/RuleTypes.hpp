// RuleTypes.hpp
// Value types shared by the rule engine, the store and the command line front end

#ifndef RULE_TYPES_HPP
#define RULE_TYPES_HPP

#include <QDateTime>
#include <QMap>
#include <QString>
#include <QStringList>
#include <optional>
#include <variant>
#include <vector>

enum class TransferAction {
    Move = 0,
    Copy
};

enum class MatchType {
    Glob = 0,
    Regex
};

struct FilenameFilter {
    MatchType match_type = MatchType::Glob;
    QString pattern;
};

// Inclusive on both sides; a missing bound leaves that side open.
struct DateTimeRange {
    std::optional<QDateTime> start;
    std::optional<QDateTime> end;
};

// Present categories are AND-combined. An absent category imposes no constraint.
struct Filters {
    std::optional<QStringList> extensions;
    std::optional<FilenameFilter> filename;
    std::optional<DateTimeRange> created_at;
    std::optional<DateTimeRange> modified_at;
    
    // An empty extension list does not count as a category.
    bool has_any() const;
    bool uses_regex() const;
};

struct Rule {
    QString id;
    QString name;
    bool enabled = true;
    QString source_dir;
    QString destination_dir;        // May contain {identifier} placeholders
    TransferAction action = TransferAction::Move;
    bool overwrite = false;
    Filters filters;
};

// Named regex group -> matched text
using CaptureSet = QMap<QString, QString>;

// Metadata of one directory entry as seen by the filter engine.
struct FileEntry {
    QString name;
    QString path;
    qint64 size = 0;
    QDateTime created;              // Invalid when the filesystem does not record it
    QDateTime modified;
};

struct TransferSucceeded {
    QString destination;
};

struct TransferSkipped {
    QString reason;
    QString destination;
};

struct TransferErrored {
    QString reason;
    QString destination;            // Empty when no destination file was produced
};

using TransferOutcome = std::variant<TransferSucceeded, TransferSkipped, TransferErrored>;

struct FileRecord {
    QString filename;
    QString source_path;
    std::optional<QString> destination_path;
    std::optional<QString> reason;
};

enum class ExecutionStatus {
    Completed = 0,
    PartialFailure,
    Failed
};

struct ExecutionResult {
    QString rule_id;
    QString rule_name;
    TransferAction action = TransferAction::Move;
    ExecutionStatus status = ExecutionStatus::Completed;
    std::vector<FileRecord> succeeded;
    std::vector<FileRecord> skipped;
    std::vector<FileRecord> errors;
    QString failure_reason;         // Set only when the whole run was refused or aborted
};

struct UndoPair {
    QString source_path;            // Original location
    QString destination_path;       // Where the file lives now
};

struct ExecutionProgress {
    QString rule_name;
    QString filename;
};

QString action_name(TransferAction action);
bool action_from_name(const QString& name, TransferAction& action);
QString match_type_name(MatchType type);
bool match_type_from_name(const QString& name, MatchType& type);
QString status_name(ExecutionStatus status);

#endif // RULE_TYPES_HPP
