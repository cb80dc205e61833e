#ifndef FAKE_FILE_SYSTEM_HPP
#define FAKE_FILE_SYSTEM_HPP

#include "FileSystem.hpp"
#include <QByteArray>
#include <QDateTime>
#include <QMap>
#include <QSet>
#include <QString>

// In-memory filesystem with scripted failures for the paths the real disk
// cannot produce on demand (other volume, full disk, undeletable source).
class FakeFileSystem : public FileSystem {
public:
    struct File {
        QByteArray data;
        QDateTime created;
        QDateTime modified;
    };
    
    FakeFileSystem();
    
    void add_folder(const QString& path);
    void add_file(const QString& path, const QByteArray& data,
                  const QDateTime& created = QDateTime(), const QDateTime& modified = QDateTime());
    QByteArray contents(const QString& path) const;
    
    std::optional<FileEntry> stat(const QString& path) const override;
    bool exists(const QString& path) const override;
    bool is_directory(const QString& path) const override;
    bool same_file(const QString& a, const QString& b) const override;
    FsStatus list_files(const QString& folder, std::vector<FileEntry>& entries) const override;
    FsStatus make_path(const QString& folder) override;
    FsStatus rename(const QString& from, const QString& to) override;
    FsStatus copy(const QString& from, const QString& to) override;
    FsStatus remove(const QString& path) override;
    
    // Scripted failures, keyed by the path passed to the primitive.
    QMap<QString, FsErrorKind> rename_errors;
    QMap<QString, FsErrorKind> copy_errors;
    QMap<QString, FsErrorKind> remove_errors;
    QMap<QString, FsErrorKind> make_path_errors;
    // Every rename fails with CrossDevice, as between two volumes.
    bool all_renames_cross_device = false;
    // Copies write this many bytes fewer than the source has.
    int copy_shortfall = 0;
    // A failed copy still leaves the bytes written so far behind. Otherwise a
    // scripted copy failure happens before the target is opened.
    bool failed_copy_leaves_partial = false;
    
    int rename_calls = 0;
    int copy_calls = 0;
    int remove_calls = 0;
    
private:
    static QString clean(const QString& path);
    static QString parent_of(const QString& path);
    
    QMap<QString, File> files_;
    QSet<QString> folders_;
    QDateTime clock_;
};

#endif // FAKE_FILE_SYSTEM_HPP
