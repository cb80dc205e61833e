#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <atomic>
#include <csignal>

#include "AppLogger.hpp"
#include "AppSettings.hpp"
#include "ExecutionCoordinator.hpp"
#include "LocalFileSystem.hpp"
#include "RulesetCodec.hpp"
#include "RulesetStore.hpp"
#include "UndoExecutor.hpp"

namespace {

std::atomic_bool g_cancel_requested{false};

void handle_interrupt(int) {
    g_cancel_requested = true;
}

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

} // namespace

class CommandDispatcher {
public:
    CommandDispatcher(RulesetStore& store, FileSystem& fs)
        : store_(store)
        , fs_(fs)
        , out_(stdout)
        , err_(stderr) {
    }
    
    int dispatch(const QString& command, const QStringList& args) {
        LOG_DEBUG("CLI", QString("Command '%1' with %2 argument(s)").arg(command).arg(args.size()));
        
        if (command == "list") return list_rules();
        if (command == "import" && args.size() == 1) return import_rules(args[0]);
        if (command == "export" && args.size() == 1) return export_rules(args[0]);
        if (command == "remove" && args.size() == 1) return remove_rule(args[0]);
        if (command == "reorder" && !args.isEmpty()) return reorder_rules(args);
        if (command == "enable" && args.size() == 1) return set_enabled(args[0], true);
        if (command == "disable" && args.size() == 1) return set_enabled(args[0], false);
        if (command == "run" && args.size() == 1) return run_rule(args[0]);
        if (command == "run-all" && args.isEmpty()) return run_all();
        if (command == "files" && args.size() == 1) return list_files(args[0]);
        if (command == "undo" && !args.isEmpty() && args.size() % 2 == 0) return undo(args);
        
        err_ << "Unknown command or wrong number of arguments: " << command << Qt::endl;
        return kExitUsage;
    }
    
private:
    RulesetStore& store_;
    FileSystem& fs_;
    QTextStream out_;
    QTextStream err_;
    
    int list_rules() {
        const std::vector<Rule> rules = store_.get_rulesets();
        if (rules.empty()) {
            out_ << "No rule sets defined." << Qt::endl;
            return kExitOk;
        }
        for (const Rule& rule : rules) {
            out_ << (rule.enabled ? "[x] " : "[ ] ") << rule.id << "  " << rule.name
                 << "  (" << action_name(rule.action) << (rule.overwrite ? ", overwrite" : "") << ")\n"
                 << "      " << rule.source_dir << " -> " << rule.destination_dir << Qt::endl;
        }
        return kExitOk;
    }
    
    int import_rules(const QString& path) {
        RulesetFile file;
        QString error;
        if (!RulesetCodec::load(path, file, error)) {
            err_ << error << Qt::endl;
            return kExitFailure;
        }
        
        int failures = 0;
        for (Rule& rule : file.rulesets) {
            if (!store_.save_ruleset(rule, error)) {
                err_ << "Skipped '" << rule.name << "': " << error << Qt::endl;
                ++failures;
                continue;
            }
            out_ << "Imported " << rule.id << "  " << rule.name << Qt::endl;
        }
        return failures == 0 ? kExitOk : kExitFailure;
    }
    
    int export_rules(const QString& path) {
        RulesetFile file;
        file.rulesets = store_.get_rulesets();
        QString error;
        if (!RulesetCodec::save(path, file, error)) {
            err_ << error << Qt::endl;
            return kExitFailure;
        }
        out_ << "Exported " << file.rulesets.size() << " rule set(s) to " << path << Qt::endl;
        return kExitOk;
    }
    
    int remove_rule(const QString& id) {
        if (!store_.delete_ruleset(id)) {
            err_ << "No rule set with id " << id << Qt::endl;
            return kExitFailure;
        }
        return kExitOk;
    }
    
    int reorder_rules(const QStringList& ids) {
        return store_.reorder_rulesets(ids) ? kExitOk : kExitFailure;
    }
    
    int set_enabled(const QString& id, bool enabled) {
        if (!store_.set_enabled(id, enabled)) {
            err_ << "No rule set with id " << id << Qt::endl;
            return kExitFailure;
        }
        return kExitOk;
    }
    
    void print_progress(const ExecutionProgress& progress) {
        out_ << "[" << progress.rule_name << "] " << progress.filename << Qt::endl;
    }
    
    void print_result(const ExecutionResult& result) {
        out_ << "\n== " << result.rule_name << ": " << status_name(result.status)
             << " (" << result.succeeded.size() << " succeeded, " << result.skipped.size()
             << " skipped, " << result.errors.size() << " errors)" << Qt::endl;
        if (!result.failure_reason.isEmpty()) {
            out_ << "   " << result.failure_reason << Qt::endl;
        }
        for (const FileRecord& record : result.skipped) {
            out_ << "   skipped  " << record.filename << ": " << record.reason.value_or(QString()) << Qt::endl;
        }
        for (const FileRecord& record : result.errors) {
            out_ << "   error    " << record.filename << ": " << record.reason.value_or(QString()) << Qt::endl;
        }
        
        // Copies leave the source in place, so only moves can be undone.
        if (result.action == TransferAction::Move && !result.succeeded.empty()) {
            out_ << "   To undo:\n   undo";
            for (const FileRecord& record : result.succeeded) {
                out_ << " \"" << record.source_path << "\" \"" << record.destination_path.value_or(QString()) << "\"";
            }
            out_ << Qt::endl;
        }
    }
    
    int run_rule(const QString& id) {
        const std::optional<Rule> rule = store_.find_ruleset(id);
        if (!rule) {
            err_ << "Rule set not found: " << id << Qt::endl;
            return kExitFailure;
        }
        
        ExecutionCoordinator coordinator(fs_);
        ExecutionResult result = coordinator.execute_rule(
            *rule, [this](const ExecutionProgress& progress) { print_progress(progress); },
            &g_cancel_requested);
        print_result(result);
        return result.status == ExecutionStatus::Completed ? kExitOk : kExitFailure;
    }
    
    int run_all() {
        ExecutionCoordinator coordinator(fs_);
        const std::vector<ExecutionResult> results = coordinator.execute_all(
            store_.get_rulesets(),
            [this](const ExecutionProgress& progress) { print_progress(progress); },
            &g_cancel_requested);
        
        bool all_completed = true;
        for (const ExecutionResult& result : results) {
            print_result(result);
            all_completed = all_completed && result.status == ExecutionStatus::Completed;
        }
        return all_completed ? kExitOk : kExitFailure;
    }
    
    int list_files(const QString& folder) {
        ExecutionCoordinator coordinator(fs_);
        QStringList names;
        QString error;
        if (!coordinator.list_source_files(folder, names, error)) {
            err_ << error << Qt::endl;
            return kExitFailure;
        }
        for (const QString& name : names) {
            out_ << name << "\n";
        }
        out_.flush();
        return kExitOk;
    }
    
    int undo(const QStringList& args) {
        std::vector<UndoPair> pairs;
        for (int i = 0; i + 1 < args.size(); i += 2) {
            pairs.push_back(UndoPair{args[i], args[i + 1]});
        }
        
        UndoExecutor executor(fs_);
        const std::vector<UndoOutcome> outcomes = executor.undo_all(pairs);
        
        int failures = 0;
        for (size_t i = 0; i < outcomes.size(); ++i) {
            if (outcomes[i].ok) {
                out_ << "restored " << pairs[i].source_path << Qt::endl;
            } else {
                err_ << "failed   " << pairs[i].source_path << ": " << outcomes[i].reason << Qt::endl;
                ++failures;
            }
        }
        return failures == 0 ? kExitOk : kExitFailure;
    }
};

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("RuleSorter");
    QCoreApplication::setApplicationName("RuleSorter");
    QCoreApplication::setApplicationVersion("1.0.0");
    
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Moves or copies files that match rule sets.\n\n"
        "Commands:\n"
        "  list                         Show stored rule sets\n"
        "  import <file.json>           Add or replace rule sets from a JSON file\n"
        "  export <file.json>           Write all rule sets to a JSON file\n"
        "  remove <id>                  Delete a rule set\n"
        "  reorder <id>...              Set the execution order (unlisted ids are dropped)\n"
        "  enable <id> | disable <id>   Toggle a rule set for run-all\n"
        "  run <id>                     Execute one rule set\n"
        "  run-all                      Execute every enabled rule set in order\n"
        "  files <folder>               List the files a rule would look at\n"
        "  undo <source> <dest>...      Move files back to where they came from");
    parser.addHelpOption();
    parser.addVersionOption();
    
    QCommandLineOption database_option("database", "SQLite file holding the rule sets.", "path");
    QCommandLineOption level_option("log-level", "trace, debug, info, warning, error or critical.", "level");
    QCommandLineOption quiet_option("quiet", "Do not echo log entries to the console.");
    parser.addOption(database_option);
    parser.addOption(level_option);
    parser.addOption(quiet_option);
    parser.addPositionalArgument("command", "Command to run.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);
    
    AppSettings settings;
    if (!settings.apply_to_logger()) {
        QTextStream(stderr) << "Continuing without a log file." << Qt::endl;
    }
    if (parser.isSet(level_option)) {
        LogSeverity sev = LogSeverity::Info;
        if (!AppLogger::severity_from_name(parser.value(level_option), sev)) {
            QTextStream(stderr) << "Unknown log level: " << parser.value(level_option) << Qt::endl;
            return kExitUsage;
        }
        AppLogger::instance().set_minimum_severity(sev);
    }
    if (parser.isSet(quiet_option)) {
        AppLogger::instance().set_console_output(false);
    }
    
    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(kExitUsage);
    }
    const QString command = positional.takeFirst();
    
    RulesetStore store(parser.isSet(database_option) ? parser.value(database_option) : settings.database_path());
    if (!store.initialize()) {
        LOG_ERROR("CLI", "Database initialization failed");
        QTextStream(stderr) << "Could not open the rule set database " << store.database_path() << Qt::endl;
        return kExitFailure;
    }
    
    std::signal(SIGINT, handle_interrupt);
    
    LocalFileSystem fs;
    CommandDispatcher dispatcher(store, fs);
    return dispatcher.dispatch(command, positional);
}
