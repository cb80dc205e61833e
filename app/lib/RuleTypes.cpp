#include "RuleTypes.hpp"

bool Filters::has_any() const {
    return (extensions.has_value() && !extensions->isEmpty())
        || filename.has_value()
        || created_at.has_value()
        || modified_at.has_value();
}

bool Filters::uses_regex() const {
    return filename.has_value() && filename->match_type == MatchType::Regex;
}

QString action_name(TransferAction action) {
    switch (action) {
        case TransferAction::Move: return "move";
        case TransferAction::Copy: return "copy";
    }
    return "move";
}

bool action_from_name(const QString& name, TransferAction& action) {
    const QString key = name.trimmed().toLower();
    if (key == "move") {
        action = TransferAction::Move;
        return true;
    }
    if (key == "copy") {
        action = TransferAction::Copy;
        return true;
    }
    return false;
}

QString match_type_name(MatchType type) {
    switch (type) {
        case MatchType::Glob:  return "glob";
        case MatchType::Regex: return "regex";
    }
    return "glob";
}

bool match_type_from_name(const QString& name, MatchType& type) {
    const QString key = name.trimmed().toLower();
    if (key == "glob") {
        type = MatchType::Glob;
        return true;
    }
    if (key == "regex") {
        type = MatchType::Regex;
        return true;
    }
    return false;
}

QString status_name(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Completed:      return "Completed";
        case ExecutionStatus::PartialFailure: return "PartialFailure";
        case ExecutionStatus::Failed:         return "Failed";
    }
    return "Failed";
}
