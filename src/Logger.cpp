#include "Logger.hpp"
#include <stdexcept>
#include <QDateTime>
#include <QMutexLocker>





Logger::Logger(const QString & aFileName, qint64 aMaxSize):
	mLogFile(aFileName),
	mMaxSize(aMaxSize),
	mCurrentSize(0),
	mNumMessagesUntilFlush(FLUSH_AFTER_N_MESSAGES)
{
	if (!openFile())
	{
		throw std::runtime_error("Cannot open log file for appending: " + aFileName.toStdString());
	}
}





QString Logger::currentTimestamp()
{
	return QDateTime::currentDateTimeUtc().toString("yyyy-MM-dd hh:mm:ss.zzz");
}





void Logger::logInternal(const QByteArray & aLogData)
{
	QMutexLocker lock(&mMtxLogFile);
	if (!mLogFile.isOpen())
	{
		// A previous rollover failed to reopen the file, try again:
		if (!openFile())
		{
			return;
		}
	}
	mCurrentSize += mLogFile.write(currentTimestamp().toUtf8() + '\t' + aLogData + '\n');
	mNumMessagesUntilFlush -= 1;
	if (mNumMessagesUntilFlush <= 0)
	{
		mLogFile.flush();
		mNumMessagesUntilFlush = FLUSH_AFTER_N_MESSAGES;
	}
	rollOverIfNeeded();
}





bool Logger::openFile()
{
	if (!mLogFile.open(QFile::WriteOnly | QFile::Append))
	{
		return false;
	}
	mCurrentSize = mLogFile.size();
	mCurrentSize += mLogFile.write(QString("\n\n%1\tLogfile opened\n").arg(currentTimestamp()).toUtf8());
	return true;
}





void Logger::rollOverIfNeeded()
{
	if ((mMaxSize <= 0) || (mCurrentSize < mMaxSize))
	{
		return;
	}
	mLogFile.close();
	QFile::remove(oldFileName());
	if (!QFile::rename(mLogFile.fileName(), oldFileName()))
	{
		// Keep appending to the oversized file rather than losing messages:
		openFile();
		return;
	}
	if (openFile())
	{
		mCurrentSize += mLogFile.write(QString("%1\tPrevious contents moved to %2\n").arg(currentTimestamp(), oldFileName()).toUtf8());
	}
	mNumMessagesUntilFlush = FLUSH_AFTER_N_MESSAGES;
}





void Logger::flush()
{
	QMutexLocker lock(&mMtxLogFile);
	mLogFile.flush();
	mNumMessagesUntilFlush = FLUSH_AFTER_N_MESSAGES;
}
