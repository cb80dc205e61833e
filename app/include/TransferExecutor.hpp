#ifndef TRANSFER_EXECUTOR_HPP
#define TRANSFER_EXECUTOR_HPP

#include "FileSystem.hpp"
#include "RuleTypes.hpp"
#include <QString>

struct TransferRequest {
    QString source_path;
    QString destination_folder;
    QString filename;
    TransferAction action = TransferAction::Move;
    bool overwrite = false;
};

struct MoveStatus {
    FsStatus status;
    bool used_copy_fallback = false;
    // The cross-device copy landed but the source could not be deleted, so the
    // file now exists in both places.
    bool source_left_behind = false;
};

class TransferExecutor {
public:
    static const QString kDestinationExistsReason;
    static const QString kSameFileReason;
    
    explicit TransferExecutor(FileSystem& fs);
    
    TransferOutcome transfer(const TransferRequest& request);
    
    // Rename first; only an EXDEV-style failure falls back to copy + verify + delete.
    // Any other rename failure is returned as is, without trying a copy.
    MoveStatus move_file(const QString& from, const QString& to);
    
    // Copies and compares the final size with the source. Refuses to copy a file
    // onto itself. A partial destination written by this call is removed on
    // failure; the source is never touched.
    FsStatus copy_and_verify(const QString& from, const QString& to);
    
    // User-facing text: "Permission denied: ...", "Disk full: ...", ...
    static QString describe_error(const FsStatus& status);
    
    static QString destination_file_path(const QString& folder, const QString& filename);
    
private:
    void discard_partial(const QString& path);
    
    FileSystem& fs_;
};

#endif // TRANSFER_EXECUTOR_HPP
