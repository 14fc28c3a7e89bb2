#include <QCoreApplication>

#include <gtest/gtest.h>

#include "logger.h"

int main(int argc, char** argv)
{
    // QSettings and the SQL driver need an application object
    QCoreApplication app(argc, argv);

    ::testing::InitGoogleTest(&argc, argv);
    Logger::instance().setMinimumLevel(LogLevel::Error);
    return RUN_ALL_TESTS();
}
