#include "RuleValidator.hpp"
#include "FilterEngine.hpp"
#include "PathResolver.hpp"

ValidationReport RuleValidator::validate(const Rule& rule) {
    ValidationReport report;
    
    if (rule.name.trimmed().isEmpty()) {
        report.errors << "name is required";
    }
    if (rule.source_dir.trimmed().isEmpty()) {
        report.errors << "source folder is required";
    }
    if (rule.destination_dir.trimmed().isEmpty()) {
        report.errors << "destination folder is required";
    }
    if (!rule.filters.has_any()) {
        report.errors << "at least one filter is required";
    }
    
    if (PathResolver::has_placeholders(rule.destination_dir) && !rule.filters.uses_regex()) {
        report.errors << "destination contains template variables but the filename filter is not a regex";
    }
    
    if (rule.filters.filename) {
        QString error;
        if (!FilterEngine::compile(*rule.filters.filename, error)) {
            report.errors << error;
        }
    }
    
    if (rule.filters.created_at) {
        check_range("created", *rule.filters.created_at, report.errors);
    }
    if (rule.filters.modified_at) {
        check_range("modified", *rule.filters.modified_at, report.errors);
    }
    
    return report;
}

void RuleValidator::check_range(const char* label, const DateTimeRange& range, QStringList& errors) {
    if (range.start && !range.start->isValid()) {
        errors << QString("%1 range start is not a valid date/time").arg(QLatin1String(label));
    }
    if (range.end && !range.end->isValid()) {
        errors << QString("%1 range end is not a valid date/time").arg(QLatin1String(label));
    }
    if (range.start && range.end && range.start->isValid() && range.end->isValid()
        && *range.start > *range.end) {
        errors << QString("%1 range starts after it ends").arg(QLatin1String(label));
    }
}
