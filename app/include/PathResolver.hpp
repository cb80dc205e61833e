#ifndef PATH_RESOLVER_HPP
#define PATH_RESOLVER_HPP

#include "FileSystem.hpp"
#include "RuleTypes.hpp"
#include <QString>
#include <QStringList>

struct ResolvedDestination {
    bool resolved = false;
    QString folder;
    QString reason;         // Why resolution failed; reported as a skip
};

// Expands {identifier} placeholders in a destination template from regex captures.
class PathResolver {
public:
    explicit PathResolver(FileSystem& fs);
    
    // captures is null when the rule's filename filter is not a regex.
    static ResolvedDestination resolve(const QString& destination_template, const CaptureSet* captures);
    
    static bool has_placeholders(const QString& destination_template);
    static QStringList placeholder_names(const QString& destination_template);
    
    // Replaces / \ : * ? " < > | and control characters with '_'; a value made
    // only of dots ("..") is replaced entirely so it cannot climb out of the template.
    static QString sanitize_component(const QString& value);
    
    // Creates the resolved folder (recursively) when missing.
    FsStatus ensure_folder(const QString& folder);
    
private:
    FileSystem& fs_;
};

#endif // PATH_RESOLVER_HPP
