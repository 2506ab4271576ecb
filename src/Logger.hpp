#pragma once

#include <QString>
#include <QByteArray>
#include <QMutex>
#include <QFile>
#include "StringFormatter.hpp"





/** Writes timestamped log lines into a single file; safe to call from multiple threads.
The file is flushed after every few messages and on demand (MultiLogger flushes all its loggers periodically).
Once the file grows over the size limit, it is renamed to "<name>.old" (replacing any previous one)
and a fresh file is started, so that a long-running process keeps at most twice the limit per subsystem. */
class Logger
{
	friend class PrefixLogger;  // Writes its prefixed lines through logInternal()

public:

	/** The default size limit of a single log file, in bytes. */
	static const qint64 DEFAULT_MAX_SIZE = 4 * 1024 * 1024;


	/** Creates an instance that appends to the specified file.
	aMaxSize is the size at which the file is rolled over; zero or negative disables the rollover.
	Throws a std::runtime_error if the file cannot be opened for appending. */
	explicit Logger(const QString & aFileName, qint64 aMaxSize = DEFAULT_MAX_SIZE);

	/** Writes a formatted line into the log.
	The format string uses the %1 .. %99 placeholders, the args can be anything QDebug can output. */
	template <typename... T>
	void log(const QString & aFormatString, const T &... aArgs)
	{
		logInternal(StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Flushes the log file. */
	void flush();

	/** Returns the name of the file this logger writes into. */
	QString fileName() const { return mLogFile.fileName(); }

	/** Returns the name of the file that receives the previous contents upon rollover. */
	QString oldFileName() const { return mLogFile.fileName() + ".old"; }


protected:

	/** Number of messages after which the file is flushed. */
	static const int FLUSH_AFTER_N_MESSAGES = 4;


	/** The file where the log data is written. */
	QFile mLogFile;

	/** The size at which the file is rolled over, or <= 0 for no limit. */
	const qint64 mMaxSize;

	/** The size of mLogFile, tracked so that the rollover check doesn't need to flush. */
	qint64 mCurrentSize;

	/** Protects mLogFile and mNumMessagesUntilFlush. */
	QMutex mMtxLogFile;

	/** Number of messages yet to be written before the next forced flush. */
	int mNumMessagesUntilFlush;


	/** Returns the current UTC timestamp, as prepended to each log line. */
	static QString currentTimestamp();

	/** Writes a single timestamped line. */
	void logInternal(const QByteArray & aLogData);

	/** Opens mLogFile for appending and writes the header line.
	Returns false if the file cannot be opened.
	Expects mMtxLogFile to be locked by the caller (or the object not to be shared yet). */
	bool openFile();

	/** Moves the current file to oldFileName() and starts a new one, if the size limit has been reached.
	Expects mMtxLogFile to be locked by the caller. */
	void rollOverIfNeeded();
};





/** Relays log messages to a Logger, prefixing each one with a constant string.
Used by objects sharing a subsystem Logger, such as the individual Devices sharing the DeviceMgr's log. */
class PrefixLogger
{
	Logger & mLogger;

	const QByteArray mPrefix;


public:

	PrefixLogger(Logger & aLogger, const QString & aPrefix):
		mLogger(aLogger),
		mPrefix(aPrefix.toUtf8())
	{
	}

	/** Writes a formatted line into the underlying log, prefixed. */
	template <typename... T>
	void log(const QString & aFormatString, const T &... aArgs)
	{
		mLogger.logInternal(mPrefix + StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	Logger & logger() { return mLogger; }
};
