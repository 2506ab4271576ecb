// LoggerTests.cpp

// Tests the file loggers: prefixing, rollover and pruning of old log files.

#include <gtest/gtest.h>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include "MultiLogger.hpp"
#include "TestHelpers.hpp"





/** Returns the whole contents of the file as a string. */
static QString readAll(const QString & aFileName)
{
	QFile f(aFileName);
	if (!f.open(QIODevice::ReadOnly))
	{
		return QString();
	}
	return QString::fromUtf8(f.readAll());
}





TEST(Logger, WritesPrefixedLines)
{
	TestEnvironment env;
	auto & logger = env.logger("Prefixed");
	PrefixLogger prefixed(logger, "Device 10.0.0.1: ");
	logger.log("Plain %1", 1);
	prefixed.log("Connected via %1", "DIAL");
	logger.flush();

	auto contents = readAll(logger.fileName());
	EXPECT_TRUE(contents.contains("\tPlain 1\n")) << contents.toStdString();
	EXPECT_TRUE(contents.contains("\tDevice 10.0.0.1: Connected via DIAL\n")) << contents.toStdString();
	EXPECT_EQ(&prefixed.logger(), &logger);
}





TEST(Logger, SameNameGivesSameLogger)
{
	TestEnvironment env;
	EXPECT_EQ(&env.logger("DeviceStore"), &env.logger("DeviceStore"));
	EXPECT_NE(&env.logger("DeviceStore"), &env.logger("DeviceMgr"));
	EXPECT_EQ(QFileInfo(env.logger("a/b:c").fileName()).fileName(), "a_b_c.log");
}





TEST(Logger, RollsOverWhenTooLarge)
{
	TestEnvironment env;
	auto fileName = env.path("rolling.log");
	{
		Logger logger(fileName, 1000);
		for (int i = 0; i < 100; ++i)
		{
			logger.log("Message number %1 with some padding to fill the file", i);
		}
		logger.flush();
		EXPECT_TRUE(QFile::exists(logger.oldFileName()));
		EXPECT_LT(QFileInfo(fileName).size(), 1000);
		EXPECT_LT(QFileInfo(logger.oldFileName()).size(), 1200);
	}
	auto recent = readAll(fileName + ".old") + readAll(fileName);
	EXPECT_TRUE(recent.contains("Message number 99 "));
	EXPECT_FALSE(recent.contains("Message number 0 "));
}





TEST(Logger, PrunesOnlyOldUnusedLogs)
{
	TestEnvironment env;
	auto & active = env.logger("active");
	active.log("Still in use");
	active.flush();
	auto logsFolder = env.mMultiLogger->logsFolder();
	auto oldLog = logsFolder + "/stale.log";
	auto freshLog = logsFolder + "/fresh.log";
	auto other = logsFolder + "/notes.txt";
	ASSERT_TRUE(env.writeFile(oldLog, "old"));
	ASSERT_TRUE(env.writeFile(freshLog, "fresh"));
	ASSERT_TRUE(env.writeFile(other, "notes"));

	auto longAgo = QDateTime::currentDateTimeUtc().addDays(-30);
	for (const auto & fileName: {oldLog, other, active.fileName()})
	{
		QFile f(fileName);
		ASSERT_TRUE(f.open(QIODevice::ReadWrite));
		ASSERT_TRUE(f.setFileTime(longAgo, QFileDevice::FileModificationTime));
	}

	EXPECT_EQ(env.mMultiLogger->pruneOldLogs(7 * 24 * 60 * 60), 1);
	EXPECT_FALSE(QFile::exists(oldLog));
	EXPECT_TRUE(QFile::exists(freshLog));
	EXPECT_TRUE(QFile::exists(other));
	EXPECT_TRUE(QFile::exists(active.fileName()));
}
