#include "ExecutionCoordinator.hpp"
#include "AppLogger.hpp"
#include "FilterEngine.hpp"
#include "Overloaded.hpp"
#include "PathResolver.hpp"
#include "RuleValidator.hpp"
#include "TransferExecutor.hpp"
#include <algorithm>
#include <variant>

namespace {

bool is_cancelled(const std::atomic_bool* flag) {
    return flag && flag->load();
}

} // namespace

ExecutionCoordinator::ExecutionCoordinator(FileSystem& fs)
    : fs_(fs) {
}

ExecutionStatus ExecutionCoordinator::derive_status(const ExecutionResult& result) {
    if (result.errors.empty()) {
        return ExecutionStatus::Completed;
    }
    return result.succeeded.empty() ? ExecutionStatus::Failed : ExecutionStatus::PartialFailure;
}

ExecutionResult ExecutionCoordinator::fail_run(ExecutionResult result, const QString& reason) const {
    LOG_ERROR("Executor", QString("Rule '%1' not run: %2").arg(result.rule_name, reason));
    result.status = ExecutionStatus::Failed;
    result.succeeded.clear();
    result.skipped.clear();
    result.errors.clear();
    result.failure_reason = reason;
    return result;
}

bool ExecutionCoordinator::enumerate(const QString& folder, std::vector<FileEntry>& entries,
                                     QString& error) const {
    FsStatus listed = fs_.list_files(folder, entries);
    if (!listed.ok()) {
        error = TransferExecutor::describe_error(listed);
        return false;
    }
    std::sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.name < b.name;
    });
    return true;
}

bool ExecutionCoordinator::list_source_files(const QString& folder, QStringList& filenames,
                                             QString& error) const {
    std::vector<FileEntry> entries;
    if (!enumerate(folder, entries, error)) {
        return false;
    }
    filenames.clear();
    for (const FileEntry& entry : entries) {
        filenames.append(entry.name);
    }
    return true;
}

ExecutionResult ExecutionCoordinator::execute_rule(const Rule& rule,
                                                   ProgressCallback progress_callback,
                                                   const std::atomic_bool* cancel_requested) {
    ExecutionResult result;
    result.rule_id = rule.id;
    result.rule_name = rule.name;
    result.action = rule.action;
    
    ValidationReport report = RuleValidator::validate(rule);
    if (!report.ok()) {
        return fail_run(result, QString("Invalid rule: %1").arg(report.message()));
    }
    
    if (!fs_.exists(rule.source_dir)) {
        return fail_run(result, QString("Source folder does not exist: %1").arg(rule.source_dir));
    }
    if (!fs_.is_directory(rule.source_dir)) {
        return fail_run(result, QString("Source is not a folder: %1").arg(rule.source_dir));
    }
    
    // Static destinations are prepared once; templated ones per file.
    const bool templated = PathResolver::has_placeholders(rule.destination_dir);
    PathResolver resolver(fs_);
    if (!templated) {
        FsStatus prepared = resolver.ensure_folder(rule.destination_dir);
        if (!prepared.ok()) {
            return fail_run(result, QString("Cannot prepare destination folder: %1")
                            .arg(TransferExecutor::describe_error(prepared)));
        }
    }
    
    std::vector<FileEntry> entries;
    QString list_error;
    if (!enumerate(rule.source_dir, entries, list_error)) {
        return fail_run(result, QString("Cannot read source folder: %1").arg(list_error));
    }
    
    LOG_INFO("Executor", QString("Running rule '%1' (%2) over %3 file(s) in %4")
             .arg(rule.name, action_name(rule.action))
             .arg(entries.size())
             .arg(rule.source_dir));
    
    FilterEngine filter(rule.filters);
    TransferExecutor executor(fs_);
    
    for (const FileEntry& entry : entries) {
        if (is_cancelled(cancel_requested)) {
            LOG_INFO("Executor", QString("Rule '%1' cancelled").arg(rule.name));
            break;
        }
        
        FilterMatch match = filter.evaluate(entry);
        if (!match.matched) {
            continue;
        }
        
        if (progress_callback) {
            progress_callback(ExecutionProgress{rule.name, entry.name});
        }
        
        FileRecord record;
        record.filename = entry.name;
        record.source_path = entry.path;
        
        QString folder = rule.destination_dir;
        if (templated) {
            ResolvedDestination resolved = PathResolver::resolve(
                rule.destination_dir, match.captures ? &*match.captures : nullptr);
            if (!resolved.resolved) {
                LOG_DEBUG("Executor", QString("Skipping %1: %2").arg(entry.name, resolved.reason));
                record.reason = resolved.reason;
                result.skipped.push_back(record);
                continue;
            }
            
            FsStatus prepared = resolver.ensure_folder(resolved.folder);
            if (!prepared.ok()) {
                const QString reason = TransferExecutor::describe_error(prepared);
                LOG_WARN("Executor", QString("%1: %2").arg(entry.name, reason));
                record.reason = reason;
                result.errors.push_back(record);
                continue;
            }
            folder = resolved.folder;
        }
        
        TransferRequest request;
        request.source_path = entry.path;
        request.destination_folder = folder;
        request.filename = entry.name;
        request.action = rule.action;
        request.overwrite = rule.overwrite;
        
        std::visit(overloaded {
            [&](const TransferSucceeded& done) {
                record.destination_path = done.destination;
                result.succeeded.push_back(record);
            },
            [&](const TransferSkipped& skipped) {
                LOG_DEBUG("Executor", QString("Skipping %1: %2").arg(entry.name, skipped.reason));
                record.destination_path = skipped.destination;
                record.reason = skipped.reason;
                result.skipped.push_back(record);
            },
            [&](const TransferErrored& failed) {
                LOG_WARN("Executor", QString("%1: %2").arg(entry.name, failed.reason));
                if (!failed.destination.isEmpty()) {
                    record.destination_path = failed.destination;
                }
                record.reason = failed.reason;
                result.errors.push_back(record);
            }
        }, executor.transfer(request));
    }
    
    result.status = derive_status(result);
    LOG_INFO("Executor", QString("Rule '%1' finished: %2 (%3 succeeded, %4 skipped, %5 errors)")
             .arg(rule.name, status_name(result.status))
             .arg(result.succeeded.size())
             .arg(result.skipped.size())
             .arg(result.errors.size()));
    return result;
}

std::vector<ExecutionResult> ExecutionCoordinator::execute_all(const std::vector<Rule>& rules,
                                                               ProgressCallback progress_callback,
                                                               const std::atomic_bool* cancel_requested) {
    std::vector<ExecutionResult> results;
    
    for (const Rule& rule : rules) {
        if (!rule.enabled) {
            continue;
        }
        if (is_cancelled(cancel_requested)) {
            LOG_INFO("Executor", "Batch cancelled, remaining rules not started");
            break;
        }
        results.push_back(execute_rule(rule, progress_callback, cancel_requested));
    }
    
    return results;
}
