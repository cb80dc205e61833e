#ifndef FILE_SYSTEM_HPP
#define FILE_SYSTEM_HPP

#include "RuleTypes.hpp"
#include <QString>
#include <optional>
#include <vector>

enum class FsErrorKind {
    None = 0,
    PermissionDenied,
    DiskFull,
    NotFound,
    CrossDevice,        // Internal signal for the move fallback, never shown to users
    IoOther
};

struct FsStatus {
    FsErrorKind kind = FsErrorKind::None;
    QString detail;
    // Set by copy() when it failed after opening (and truncating) the target,
    // so whatever is left at the target is its own partial output.
    bool target_written = false;
    
    bool ok() const { return kind == FsErrorKind::None; }
    
    static FsStatus success() { return FsStatus(); }
    static FsStatus failure(FsErrorKind kind, const QString& detail) {
        FsStatus status;
        status.kind = kind;
        status.detail = detail;
        return status;
    }
};

// Filesystem primitives used by the engine. Implementations must not retry or
// fall back internally: rename() is a single OS rename and copy() a plain byte copy.
class FileSystem {
public:
    virtual ~FileSystem() = default;
    
    virtual std::optional<FileEntry> stat(const QString& path) const = 0;
    virtual bool exists(const QString& path) const = 0;
    virtual bool is_directory(const QString& path) const = 0;
    // Both paths exist and name the same file (links and ".." resolved).
    virtual bool same_file(const QString& a, const QString& b) const = 0;
    
    // Regular files directly inside folder, unsorted, hidden files included.
    virtual FsStatus list_files(const QString& folder, std::vector<FileEntry>& entries) const = 0;
    virtual FsStatus make_path(const QString& folder) = 0;
    
    // Both replace an existing destination file.
    virtual FsStatus rename(const QString& from, const QString& to) = 0;
    virtual FsStatus copy(const QString& from, const QString& to) = 0;
    virtual FsStatus remove(const QString& path) = 0;
};

#endif // FILE_SYSTEM_HPP
