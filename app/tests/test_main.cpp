#include <QCoreApplication>
#include <gtest/gtest.h>

#include "AppLogger.hpp"

// The SQL driver needs an application object; log output stays in memory.
int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    AppLogger::instance().set_console_output(false);
    AppLogger::instance().set_minimum_severity(LogSeverity::Debug);
    
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
