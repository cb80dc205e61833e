#include "AppSettings.hpp"
#include <QStandardPaths>

namespace {
const char* kDatabasePathKey = "storage/databasePath";
const char* kLogFileKey = "logging/filePath";
const char* kLogSeverityKey = "logging/minimumSeverity";
const char* kLogConsoleKey = "logging/console";
}

AppSettings::AppSettings()
    : settings_(std::make_unique<QSettings>("RuleSorter", "RuleSorter")) {
}

AppSettings::AppSettings(const QString& ini_path)
    : settings_(std::make_unique<QSettings>(ini_path, QSettings::IniFormat)) {
}

QString AppSettings::default_data_dir() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dir.isEmpty()) {
        dir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation) + "/RuleSorter";
    }
    return dir;
}

QString AppSettings::database_path() const {
    return settings_->value(kDatabasePathKey, default_data_dir() + "/rule_sorter.db").toString();
}

void AppSettings::set_database_path(const QString& path) {
    settings_->setValue(kDatabasePathKey, path);
}

QString AppSettings::log_file_path() const {
    return settings_->value(kLogFileKey, default_data_dir() + "/rule_sorter.log").toString();
}

void AppSettings::set_log_file_path(const QString& path) {
    settings_->setValue(kLogFileKey, path);
}

LogSeverity AppSettings::minimum_severity() const {
    LogSeverity sev = LogSeverity::Info;
    const QString stored = settings_->value(kLogSeverityKey, "info").toString();
    if (!AppLogger::severity_from_name(stored, sev)) {
        return LogSeverity::Info;
    }
    return sev;
}

void AppSettings::set_minimum_severity(LogSeverity sev) {
    settings_->setValue(kLogSeverityKey, AppLogger::severity_label(sev).toLower());
}

bool AppSettings::console_logging() const {
    return settings_->value(kLogConsoleKey, true).toBool();
}

void AppSettings::set_console_logging(bool enabled) {
    settings_->setValue(kLogConsoleKey, enabled);
}

bool AppSettings::apply_to_logger() const {
    AppLogger& logger = AppLogger::instance();
    logger.set_minimum_severity(minimum_severity());
    logger.set_console_output(console_logging());
    return logger.set_log_file(log_file_path());
}
