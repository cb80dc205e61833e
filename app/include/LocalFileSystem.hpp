#ifndef LOCAL_FILE_SYSTEM_HPP
#define LOCAL_FILE_SYSTEM_HPP

#include "FileSystem.hpp"

class QFileInfo;

class LocalFileSystem : public FileSystem {
public:
    LocalFileSystem() = default;
    ~LocalFileSystem() override = default;
    
    std::optional<FileEntry> stat(const QString& path) const override;
    bool exists(const QString& path) const override;
    bool is_directory(const QString& path) const override;
    bool same_file(const QString& a, const QString& b) const override;
    
    FsStatus list_files(const QString& folder, std::vector<FileEntry>& entries) const override;
    FsStatus make_path(const QString& folder) override;
    
    FsStatus rename(const QString& from, const QString& to) override;
    FsStatus copy(const QString& from, const QString& to) override;
    FsStatus remove(const QString& path) override;
    
    // errno on POSIX, GetLastError() on Windows
    static FsErrorKind classify_os_error(int code);
    
private:
    // code must be read right after the failing call, before anything else can reset it
    static FsStatus os_error(int code, const QString& context);
    static FileEntry entry_from_info(const QFileInfo& info);
    
    static constexpr qint64 kCopyChunkSize = 1024 * 1024;
};

#endif // LOCAL_FILE_SYSTEM_HPP
