#ifndef APP_SETTINGS_HPP
#define APP_SETTINGS_HPP

#include "AppLogger.hpp"
#include <QString>
#include <QSettings>
#include <memory>

// Persistent preferences. Keys:
//   storage/databasePath, logging/filePath, logging/minimumSeverity, logging/console
class AppSettings {
public:
    AppSettings();
    // INI file at an explicit location (used by tests and portable installs)
    explicit AppSettings(const QString& ini_path);
    
    QString database_path() const;
    void set_database_path(const QString& path);
    
    QString log_file_path() const;
    void set_log_file_path(const QString& path);
    
    LogSeverity minimum_severity() const;
    void set_minimum_severity(LogSeverity sev);
    
    bool console_logging() const;
    void set_console_logging(bool enabled);
    
    // Pushes the logging preferences into AppLogger; false when the log file cannot be opened.
    bool apply_to_logger() const;
    
    static QString default_data_dir();
    
private:
    std::unique_ptr<QSettings> settings_;
};

#endif // APP_SETTINGS_HPP
