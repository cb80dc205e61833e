#include <gtest/gtest.h>

#include "AppLogger.hpp"
#include "AppSettings.hpp"
#include <QFile>
#include <QTemporaryDir>

TEST(AppSettingsTest, DefaultsLiveInDataDir) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    AppSettings settings(dir.filePath("settings.ini"));
    
    EXPECT_TRUE(settings.database_path().endsWith("rule_sorter.db"));
    EXPECT_TRUE(settings.log_file_path().endsWith("rule_sorter.log"));
    EXPECT_EQ(settings.minimum_severity(), LogSeverity::Info);
    EXPECT_TRUE(settings.console_logging());
}

TEST(AppSettingsTest, StoredValuesAreReadBack) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString ini = dir.filePath("settings.ini");
    {
        AppSettings settings(ini);
        settings.set_database_path("/tmp/custom.db");
        settings.set_minimum_severity(LogSeverity::Warning);
        settings.set_console_logging(false);
    }
    
    AppSettings reread(ini);
    EXPECT_EQ(reread.database_path(), "/tmp/custom.db");
    EXPECT_EQ(reread.minimum_severity(), LogSeverity::Warning);
    EXPECT_FALSE(reread.console_logging());
}

TEST(AppLoggerTest, SeverityNames) {
    LogSeverity sev = LogSeverity::Info;
    EXPECT_TRUE(AppLogger::severity_from_name("WARNING", sev));
    EXPECT_EQ(sev, LogSeverity::Warning);
    EXPECT_TRUE(AppLogger::severity_from_name("debug", sev));
    EXPECT_EQ(sev, LogSeverity::Debug);
    EXPECT_FALSE(AppLogger::severity_from_name("loud", sev));
    EXPECT_EQ(sev, LogSeverity::Debug);
}

TEST(AppLoggerTest, WritesToConfiguredFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("logs/test.log");
    
    AppLogger& logger = AppLogger::instance();
    ASSERT_TRUE(logger.set_log_file(path));
    LOG_WARN("Test", "written to file");
    EXPECT_TRUE(logger.set_log_file(QString()));
    
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    const QString text = QString::fromUtf8(file.readAll());
    EXPECT_TRUE(text.contains("[Test] written to file"));
    EXPECT_TRUE(logger.recent_entries(1).first().contains("written to file"));
}
