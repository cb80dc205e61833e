#ifndef EXECUTION_COORDINATOR_HPP
#define EXECUTION_COORDINATOR_HPP

#include "FileSystem.hpp"
#include "RuleTypes.hpp"
#include <QString>
#include <QStringList>
#include <atomic>
#include <functional>
#include <vector>

// Runs rules one file at a time: filter -> resolve destination -> transfer.
// Single-threaded; the cancel flag is read between files only, so a transfer
// already in flight always completes and is recorded.
class ExecutionCoordinator {
public:
    using ProgressCallback = std::function<void(const ExecutionProgress& progress)>;
    
    explicit ExecutionCoordinator(FileSystem& fs);
    
    ExecutionResult execute_rule(const Rule& rule,
                                 ProgressCallback progress_callback = nullptr,
                                 const std::atomic_bool* cancel_requested = nullptr);
    
    // Enabled rules only, strictly in order. Once cancelled, no further rule is started.
    std::vector<ExecutionResult> execute_all(const std::vector<Rule>& rules,
                                             ProgressCallback progress_callback = nullptr,
                                             const std::atomic_bool* cancel_requested = nullptr);
    
    // Non-recursive, sorted by name.
    bool list_source_files(const QString& folder, QStringList& filenames, QString& error) const;
    
    static ExecutionStatus derive_status(const ExecutionResult& result);
    
private:
    ExecutionResult fail_run(ExecutionResult result, const QString& reason) const;
    bool enumerate(const QString& folder, std::vector<FileEntry>& entries, QString& error) const;
    
    FileSystem& fs_;
};

#endif // EXECUTION_COORDINATOR_HPP
