#include "MultiLogger.hpp"
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSet>





MultiLogger::MultiLogger(
	ComponentCollection & aComponents,
	const QString & aLogsFolder,
	qint64 aMaxLogSize
):
	Super(aComponents),
	mLogsFolder(aLogsFolder),
	mMaxLogSize(aMaxLogSize)
{
	if (!QDir().mkpath(aLogsFolder))
	{
		throw RuntimeError("Cannot create the logs folder %1", aLogsFolder);
	}
	QObject::connect(&mTimer, &QTimer::timeout, &mTimer,
		[this]()
		{
			flushAllLogs();
		}
	);
}





void MultiLogger::start()
{
	mTimer.start(1000);
}





Logger & MultiLogger::logger(const QString & aLoggerName)
{
	QMutexLocker locker(&mMtxLoggers);
	auto itr = mLoggers.find(aLoggerName);
	if (itr == mLoggers.end())
	{
		itr = mLoggers.emplace(
			aLoggerName,
			std::make_unique<Logger>(loggerFileName(aLoggerName), mMaxLogSize)
		).first;
	}
	return *itr->second;
}





void MultiLogger::flushAllLogs()
{
	QMutexLocker locker(&mMtxLoggers);
	for (auto & logger: mLoggers)
	{
		logger.second->flush();
	}
}





int MultiLogger::pruneOldLogs(qint64 aMaxAgeSeconds)
{
	QSet<QString> inUse;
	{
		QMutexLocker locker(&mMtxLoggers);
		for (const auto & logger: mLoggers)
		{
			inUse.insert(QFileInfo(logger.second->fileName()).absoluteFilePath());
			inUse.insert(QFileInfo(logger.second->oldFileName()).absoluteFilePath());
		}
	}

	auto limit = QDateTime::currentDateTimeUtc().addSecs(-aMaxAgeSeconds);
	int numRemoved = 0;
	QDir dir(mLogsFolder);
	const auto files = dir.entryInfoList({"*.log", "*.log.old"}, QDir::Files);
	for (const auto & fi: files)
	{
		if (inUse.contains(fi.absoluteFilePath()))
		{
			continue;
		}
		if (fi.lastModified().toUTC() >= limit)
		{
			continue;
		}
		if (QFile::remove(fi.absoluteFilePath()))
		{
			numRemoved += 1;
		}
	}
	return numRemoved;
}





QString MultiLogger::loggerFileName(QString aLoggerName)
{
	static const QString illegal("/\\\"\':;&%*?|<>");
	for (auto & ch: aLoggerName)
	{
		if ((ch.unicode() < 32) || illegal.contains(ch))
		{
			ch = '_';
		}
	}
	return mLogsFolder + "/" + aLoggerName + ".log";
}
