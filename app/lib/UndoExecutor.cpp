#include "UndoExecutor.hpp"
#include "AppLogger.hpp"
#include "TransferExecutor.hpp"
#include <QFileInfo>

UndoExecutor::UndoExecutor(FileSystem& fs)
    : fs_(fs) {
}

UndoOutcome UndoExecutor::undo_file(const QString& source_path, const QString& destination_path) {
    UndoOutcome outcome;
    
    if (!fs_.exists(destination_path)) {
        outcome.reason = QString("File no longer exists at destination: %1").arg(destination_path);
        return outcome;
    }
    if (fs_.exists(source_path)) {
        outcome.reason = QString("File already exists at original location: %1").arg(source_path);
        return outcome;
    }
    
    // Ensure the original directory exists
    FsStatus parent = fs_.make_path(QFileInfo(source_path).absolutePath());
    if (!parent.ok()) {
        outcome.reason = TransferExecutor::describe_error(parent);
        return outcome;
    }
    
    TransferExecutor executor(fs_);
    MoveStatus moved = executor.move_file(destination_path, source_path);
    if (!moved.status.ok()) {
        outcome.reason = TransferExecutor::describe_error(moved.status);
        if (moved.source_left_behind) {
            outcome.reason.prepend("Restored a copy but the moved file could not be deleted. ");
        }
        LOG_WARN("Undo", QString("Cannot restore %1: %2").arg(source_path, outcome.reason));
        return outcome;
    }
    
    LOG_INFO("Undo", QString("Restored %1").arg(source_path));
    outcome.ok = true;
    return outcome;
}

std::vector<UndoOutcome> UndoExecutor::undo_all(const std::vector<UndoPair>& pairs) {
    std::vector<UndoOutcome> outcomes;
    outcomes.reserve(pairs.size());
    for (const UndoPair& pair : pairs) {
        outcomes.push_back(undo_file(pair.source_path, pair.destination_path));
    }
    return outcomes;
}
