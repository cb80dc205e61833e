#include "TransferExecutor.hpp"
#include "AppLogger.hpp"
#include <QDir>

const QString TransferExecutor::kDestinationExistsReason = QStringLiteral("destination exists");
const QString TransferExecutor::kSameFileReason = QStringLiteral("source and destination are the same file");

TransferExecutor::TransferExecutor(FileSystem& fs)
    : fs_(fs) {
}

QString TransferExecutor::destination_file_path(const QString& folder, const QString& filename) {
    return QDir::cleanPath(folder + QLatin1Char('/') + filename);
}

QString TransferExecutor::describe_error(const FsStatus& status) {
    switch (status.kind) {
        case FsErrorKind::None:
            return QString();
        case FsErrorKind::PermissionDenied:
            return QString("Permission denied: %1").arg(status.detail);
        case FsErrorKind::DiskFull:
            return QString("Disk full: %1").arg(status.detail);
        case FsErrorKind::NotFound:
            return QString("File not found: %1").arg(status.detail);
        case FsErrorKind::CrossDevice:
        case FsErrorKind::IoOther:
            break;
    }
    return QString("Operation failed: %1").arg(status.detail);
}

void TransferExecutor::discard_partial(const QString& path) {
    if (!fs_.exists(path) || fs_.is_directory(path)) {
        return;
    }
    FsStatus removed = fs_.remove(path);
    if (!removed.ok()) {
        LOG_WARN("Transfer", QString("Could not remove partial copy %1: %2")
                 .arg(path, removed.detail));
    }
}

FsStatus TransferExecutor::copy_and_verify(const QString& from, const QString& to) {
    const std::optional<FileEntry> source = fs_.stat(from);
    if (!source) {
        return FsStatus::failure(FsErrorKind::NotFound, QString("Source is gone: %1").arg(from));
    }
    if (fs_.same_file(from, to)) {
        return FsStatus::failure(FsErrorKind::IoOther, QString("Cannot copy %1 onto itself").arg(from));
    }
    
    FsStatus copied = fs_.copy(from, to);
    if (!copied.ok()) {
        // A target that was never opened still holds what was there before.
        if (copied.target_written) {
            discard_partial(to);
        }
        return copied;
    }
    
    const std::optional<FileEntry> target = fs_.stat(to);
    const qint64 written = target ? target->size : -1;
    if (written != source->size) {
        discard_partial(to);
        return FsStatus::failure(FsErrorKind::IoOther,
            QString("Copy incomplete: expected %1 bytes, got %2 bytes").arg(source->size).arg(written));
    }
    
    return FsStatus::success();
}

MoveStatus TransferExecutor::move_file(const QString& from, const QString& to) {
    MoveStatus result;
    
    FsStatus renamed = fs_.rename(from, to);
    if (renamed.ok()) {
        return result;
    }
    if (renamed.kind != FsErrorKind::CrossDevice) {
        result.status = renamed;
        return result;
    }
    
    LOG_INFO("Transfer", QString("%1 and %2 are on different volumes, copying instead").arg(from, to));
    result.used_copy_fallback = true;
    
    FsStatus copied = copy_and_verify(from, to);
    if (!copied.ok()) {
        result.status = copied;
        return result;
    }
    
    FsStatus removed = fs_.remove(from);
    if (!removed.ok()) {
        LOG_CRITICAL("Transfer", QString("Copied %1 to %2 but could not delete the source: %3")
                     .arg(from, to, removed.detail));
        result.status = removed;
        result.source_left_behind = true;
    }
    return result;
}

TransferOutcome TransferExecutor::transfer(const TransferRequest& request) {
    const QString destination = destination_file_path(request.destination_folder, request.filename);
    
    if (fs_.same_file(request.source_path, destination)) {
        return TransferSkipped{kSameFileReason, destination};
    }
    if (!request.overwrite && fs_.exists(destination)) {
        return TransferSkipped{kDestinationExistsReason, destination};
    }
    
    switch (request.action) {
        case TransferAction::Move: {
            MoveStatus moved = move_file(request.source_path, destination);
            if (moved.status.ok()) {
                return TransferSucceeded{destination};
            }
            if (moved.source_left_behind) {
                return TransferErrored{
                    QString("Copied to destination but the source could not be deleted; "
                            "the file now exists in both places. %1").arg(describe_error(moved.status)),
                    destination};
            }
            return TransferErrored{describe_error(moved.status), QString()};
        }
        case TransferAction::Copy: {
            FsStatus copied = copy_and_verify(request.source_path, destination);
            if (copied.ok()) {
                return TransferSucceeded{destination};
            }
            return TransferErrored{describe_error(copied), QString()};
        }
    }
    
    return TransferErrored{"Unknown action", QString()};
}
