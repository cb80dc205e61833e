#ifndef UNDO_EXECUTOR_HPP
#define UNDO_EXECUTOR_HPP

#include "FileSystem.hpp"
#include "RuleTypes.hpp"
#include <QString>
#include <vector>

struct UndoOutcome {
    bool ok = false;
    QString reason;
};

// Puts moved files back. Only meaningful for Move results; the caller must not
// offer it for Copy results.
class UndoExecutor {
public:
    explicit UndoExecutor(FileSystem& fs);
    
    // Refuses when something already occupies source_path.
    UndoOutcome undo_file(const QString& source_path, const QString& destination_path);
    // Every pair is attempted, in order, whatever happened to the previous ones.
    std::vector<UndoOutcome> undo_all(const std::vector<UndoPair>& pairs);
    
private:
    FileSystem& fs_;
};

#endif // UNDO_EXECUTOR_HPP
