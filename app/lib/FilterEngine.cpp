#include "FilterEngine.hpp"
#include "AppLogger.hpp"
#include "Overloaded.hpp"
#include <QRegularExpressionMatch>

FilterEngine::FilterEngine(const Filters& filters)
    : created_range_(filters.created_at)
    , modified_range_(filters.modified_at) {
    if (filters.extensions) {
        extensions_ = normalize_extensions(*filters.extensions);
    }
    
    if (filters.filename) {
        name_matcher_ = compile(*filters.filename, error_);
        if (!name_matcher_) {
            LOG_WARN("Filter", QString("Filename pattern rejected: %1").arg(error_));
        }
    }
}

QStringList FilterEngine::normalize_extensions(const QStringList& extensions) {
    QStringList normalized;
    for (const QString& raw : extensions) {
        QString ext = raw.trimmed().toLower();
        if (ext.isEmpty() || ext == ".") {
            continue;
        }
        if (!ext.startsWith('.')) {
            ext.prepend('.');
        }
        if (!normalized.contains(ext)) {
            normalized.append(ext);
        }
    }
    return normalized;
}

QString FilterEngine::extension_of(const QString& filename) {
    const int dot = filename.lastIndexOf('.');
    if (dot <= 0 || dot == filename.size() - 1) {
        return QString();
    }
    return filename.mid(dot).toLower();
}

bool FilterEngine::in_range(const QDateTime& value, const DateTimeRange& range) {
    if (!value.isValid()) {
        return false;
    }
    if (range.start && (!range.start->isValid() || value < *range.start)) {
        return false;
    }
    if (range.end && (!range.end->isValid() || value > *range.end)) {
        return false;
    }
    return true;
}

std::optional<NameMatcher> FilterEngine::compile(const FilenameFilter& filter, QString& error) {
    if (filter.pattern.isEmpty()) {
        error = "Filename pattern is empty";
        return std::nullopt;
    }
    
    switch (filter.match_type) {
        case MatchType::Glob: {
            GlobMatcher glob;
            glob.pattern = filter.pattern;
            glob.expression.setPattern(QRegularExpression::wildcardToRegularExpression(filter.pattern));
            if (!glob.expression.isValid()) {
                error = QString("Invalid glob '%1': %2")
                    .arg(filter.pattern, glob.expression.errorString());
                return std::nullopt;
            }
            return NameMatcher(std::move(glob));
        }
        case MatchType::Regex: {
            RegexMatcher regex;
            regex.expression.setPattern(filter.pattern);
            if (!regex.expression.isValid()) {
                error = QString("Invalid regex '%1' at offset %2: %3")
                    .arg(filter.pattern)
                    .arg(regex.expression.patternErrorOffset())
                    .arg(regex.expression.errorString());
                return std::nullopt;
            }
            regex.expression.optimize();
            for (const QString& name : regex.expression.namedCaptureGroups()) {
                if (!name.isEmpty()) {
                    regex.group_names.append(name);
                }
            }
            return NameMatcher(std::move(regex));
        }
    }
    
    error = "Unknown match type";
    return std::nullopt;
}

FilterMatch FilterEngine::evaluate(const FileEntry& entry) const {
    FilterMatch result;
    
    // A filter that failed to compile never matches.
    if (!is_valid()) {
        return result;
    }
    
    if (extensions_ && !extensions_->isEmpty() && !match_extension(entry.name)) {
        return result;
    }
    
    std::optional<CaptureSet> captures;
    if (name_matcher_ && !match_name(entry.name, captures)) {
        return result;
    }
    
    if (created_range_ && !in_range(entry.created, *created_range_)) {
        return result;
    }
    
    if (modified_range_ && !in_range(entry.modified, *modified_range_)) {
        return result;
    }
    
    result.matched = true;
    result.captures = std::move(captures);
    return result;
}

bool FilterEngine::match_extension(const QString& filename) const {
    const QString ext = extension_of(filename);
    return !ext.isEmpty() && extensions_->contains(ext);
}

bool FilterEngine::match_name(const QString& filename, std::optional<CaptureSet>& captures) const {
    return std::visit(overloaded {
        [&](const GlobMatcher& glob) {
            return glob.expression.match(filename).hasMatch();
        },
        [&](const RegexMatcher& regex) {
            const QRegularExpressionMatch match = regex.expression.match(filename);
            if (!match.hasMatch()) {
                return false;
            }
            CaptureSet found;
            for (const QString& name : regex.group_names) {
                // Optional groups that did not participate are left out.
                if (match.capturedStart(name) >= 0) {
                    found.insert(name, match.captured(name));
                }
            }
            captures = std::move(found);
            return true;
        }
    }, *name_matcher_);
}
