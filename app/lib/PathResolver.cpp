#include "PathResolver.hpp"
#include "AppLogger.hpp"
#include <QRegularExpression>
#include <QRegularExpressionMatchIterator>

namespace {

const QRegularExpression& placeholder_pattern() {
    static const QRegularExpression pattern(QStringLiteral("\\{([A-Za-z_][A-Za-z0-9_]*)\\}"));
    return pattern;
}

bool is_reserved(QChar c) {
    switch (c.unicode()) {
        case '/': case '\\': case ':': case '*': case '?':
        case '"': case '<': case '>': case '|':
            return true;
        default:
            return c.unicode() < 0x20;
    }
}

} // namespace

PathResolver::PathResolver(FileSystem& fs)
    : fs_(fs) {
}

bool PathResolver::has_placeholders(const QString& destination_template) {
    return placeholder_pattern().match(destination_template).hasMatch();
}

QStringList PathResolver::placeholder_names(const QString& destination_template) {
    QStringList names;
    QRegularExpressionMatchIterator it = placeholder_pattern().globalMatch(destination_template);
    while (it.hasNext()) {
        const QString name = it.next().captured(1);
        if (!names.contains(name)) {
            names.append(name);
        }
    }
    return names;
}

QString PathResolver::sanitize_component(const QString& value) {
    QString clean = value;
    for (QChar& c : clean) {
        if (is_reserved(c)) {
            c = '_';
        }
    }
    
    bool only_dots = !clean.isEmpty();
    for (const QChar c : clean) {
        if (c != '.') {
            only_dots = false;
            break;
        }
    }
    if (only_dots) {
        clean.fill('_');
    }
    return clean;
}

ResolvedDestination PathResolver::resolve(const QString& destination_template, const CaptureSet* captures) {
    ResolvedDestination result;
    
    if (!has_placeholders(destination_template)) {
        result.resolved = true;
        result.folder = destination_template;
        return result;
    }
    
    if (!captures) {
        result.reason = "Template variables need a regex filename filter";
        return result;
    }
    
    QString folder;
    int copied_up_to = 0;
    QRegularExpressionMatchIterator it = placeholder_pattern().globalMatch(destination_template);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const QString name = match.captured(1);
        
        auto capture = captures->constFind(name);
        if (capture == captures->constEnd()) {
            result.reason = QString("No capture named '%1' for template variable {%1}").arg(name);
            return result;
        }
        if (capture->isEmpty()) {
            result.reason = QString("Capture '%1' is empty").arg(name);
            return result;
        }
        
        folder += destination_template.mid(copied_up_to, match.capturedStart(0) - copied_up_to);
        folder += sanitize_component(*capture);
        copied_up_to = static_cast<int>(match.capturedEnd(0));
    }
    folder += destination_template.mid(copied_up_to);
    
    result.resolved = true;
    result.folder = folder;
    return result;
}

FsStatus PathResolver::ensure_folder(const QString& folder) {
    if (fs_.is_directory(folder)) {
        return FsStatus::success();
    }
    
    FsStatus status = fs_.make_path(folder);
    if (status.ok()) {
        LOG_DEBUG("Resolver", QString("Created destination folder %1").arg(folder));
    }
    return status;
}
