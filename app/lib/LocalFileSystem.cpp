#include "LocalFileSystem.hpp"
#include "AppLogger.hpp"
#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <cerrno>
#include <cstdio>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace {

int current_os_error() {
#ifdef Q_OS_WIN
    return static_cast<int>(GetLastError());
#else
    return errno;
#endif
}

FsStatus opened_target(FsStatus status) {
    status.target_written = true;
    return status;
}

void reset_os_error() {
#ifdef Q_OS_WIN
    SetLastError(ERROR_SUCCESS);
#else
    errno = 0;
#endif
}

} // namespace

FsErrorKind LocalFileSystem::classify_os_error(int code) {
#ifdef Q_OS_WIN
    switch (code) {
        case ERROR_ACCESS_DENIED:
        case ERROR_SHARING_VIOLATION:
        case ERROR_LOCK_VIOLATION:
        case ERROR_WRITE_PROTECT:
            return FsErrorKind::PermissionDenied;
        case ERROR_DISK_FULL:
        case ERROR_HANDLE_DISK_FULL:
            return FsErrorKind::DiskFull;
        case ERROR_FILE_NOT_FOUND:
        case ERROR_PATH_NOT_FOUND:
            return FsErrorKind::NotFound;
        case ERROR_NOT_SAME_DEVICE:
            return FsErrorKind::CrossDevice;
        default:
            return FsErrorKind::IoOther;
    }
#else
    switch (code) {
        case EACCES:
        case EPERM:
        case EROFS:
            return FsErrorKind::PermissionDenied;
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return FsErrorKind::DiskFull;
        case ENOENT:
            return FsErrorKind::NotFound;
        case EXDEV:
            return FsErrorKind::CrossDevice;
        default:
            return FsErrorKind::IoOther;
    }
#endif
}

FsStatus LocalFileSystem::os_error(int code, const QString& context) {
    if (code == 0) {
        return FsStatus::failure(FsErrorKind::IoOther, context);
    }
    return FsStatus::failure(classify_os_error(code),
                             QString("%1: %2").arg(context, qt_error_string(code)));
}

FileEntry LocalFileSystem::entry_from_info(const QFileInfo& info) {
    FileEntry entry;
    entry.name = info.fileName();
    entry.path = info.filePath();
    entry.size = info.size();
    entry.created = info.birthTime();
    entry.modified = info.lastModified();
    return entry;
}

std::optional<FileEntry> LocalFileSystem::stat(const QString& path) const {
    QFileInfo info(path);
    if (!info.exists()) {
        return std::nullopt;
    }
    return entry_from_info(info);
}

bool LocalFileSystem::exists(const QString& path) const {
    return QFileInfo::exists(path);
}

bool LocalFileSystem::is_directory(const QString& path) const {
    return QFileInfo(path).isDir();
}

bool LocalFileSystem::same_file(const QString& a, const QString& b) const {
    const QString canonical_a = QFileInfo(a).canonicalFilePath();
    if (canonical_a.isEmpty()) {
        return false;
    }
    return canonical_a == QFileInfo(b).canonicalFilePath();
}

FsStatus LocalFileSystem::list_files(const QString& folder, std::vector<FileEntry>& entries) const {
    QFileInfo folder_info(folder);
    if (!folder_info.exists()) {
        return FsStatus::failure(FsErrorKind::NotFound, QString("Folder does not exist: %1").arg(folder));
    }
    if (!folder_info.isDir()) {
        return FsStatus::failure(FsErrorKind::IoOther, QString("Not a folder: %1").arg(folder));
    }
    if (!folder_info.isReadable()) {
        return FsStatus::failure(FsErrorKind::PermissionDenied, QString("Folder is not readable: %1").arg(folder));
    }
    
    QDir dir(folder);
    const QFileInfoList infos = dir.entryInfoList(
        QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDir::NoSort);
    entries.reserve(entries.size() + static_cast<size_t>(infos.size()));
    for (const QFileInfo& info : infos) {
        entries.push_back(entry_from_info(info));
    }
    return FsStatus::success();
}

FsStatus LocalFileSystem::make_path(const QString& folder) {
    if (QFileInfo(folder).isDir()) {
        return FsStatus::success();
    }
    reset_os_error();
    if (!QDir().mkpath(folder)) {
        const int code = current_os_error();
        return os_error(code, QString("Cannot create folder %1").arg(folder));
    }
    return FsStatus::success();
}

FsStatus LocalFileSystem::rename(const QString& from, const QString& to) {
    // QFile::rename() silently copies across volumes, so go to the OS directly.
#ifdef Q_OS_WIN
    const QString native_from = QDir::toNativeSeparators(from);
    const QString native_to = QDir::toNativeSeparators(to);
    if (!MoveFileExW(reinterpret_cast<LPCWSTR>(native_from.utf16()),
                     reinterpret_cast<LPCWSTR>(native_to.utf16()),
                     MOVEFILE_REPLACE_EXISTING)) {
        const int code = current_os_error();
        return os_error(code, QString("Cannot rename %1 to %2").arg(from, to));
    }
#else
    const QByteArray encoded_from = QFile::encodeName(from);
    const QByteArray encoded_to = QFile::encodeName(to);
    if (::rename(encoded_from.constData(), encoded_to.constData()) != 0) {
        const int code = current_os_error();
        return os_error(code, QString("Cannot rename %1 to %2").arg(from, to));
    }
#endif
    return FsStatus::success();
}

FsStatus LocalFileSystem::copy(const QString& from, const QString& to) {
    reset_os_error();
    QFile source(from);
    if (!source.open(QIODevice::ReadOnly)) {
        const int code = current_os_error();
        return os_error(code, QString("Cannot open %1").arg(from));
    }
    
    // Unbuffered so a failed write reports its own errno (ENOSPC etc.)
    QFile target(to);
    if (!target.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Unbuffered)) {
        const int code = current_os_error();
        return os_error(code, QString("Cannot create %1").arg(to));
    }
    // From here on the previous content of the target is gone.
    
    while (true) {
        reset_os_error();
        const QByteArray chunk = source.read(kCopyChunkSize);
        const int read_code = current_os_error();
        if (source.error() != QFileDevice::NoError) {
            return opened_target(os_error(read_code, QString("Read failed on %1").arg(from)));
        }
        if (chunk.isEmpty()) {
            break;
        }
        const qint64 written = target.write(chunk);
        const int write_code = current_os_error();
        if (written != chunk.size()) {
            return opened_target(os_error(write_code, QString("Write failed on %1").arg(to)));
        }
    }
    
    reset_os_error();
    target.close();
    const int close_code = current_os_error();
    if (target.error() != QFileDevice::NoError) {
        return opened_target(os_error(close_code, QString("Cannot finish writing %1").arg(to)));
    }
    
    // Keep the permission bits, as QFile::copy() does. Some target volumes
    // (FAT, network shares) cannot store them; the data itself is complete.
    if (!target.setPermissions(source.permissions())) {
        LOG_WARN("FileSystem", QString("Cannot apply permissions to %1").arg(to));
    }
    return FsStatus::success();
}

FsStatus LocalFileSystem::remove(const QString& path) {
    reset_os_error();
    if (!QFile::remove(path)) {
        const int code = current_os_error();
        return os_error(code, QString("Cannot remove %1").arg(path));
    }
    return FsStatus::success();
}
