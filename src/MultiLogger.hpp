#pragma once

#include <map>
#include <memory>
#include <QtGlobal>
#include <QMutex>
#include <QTimer>
#include "ComponentCollection.hpp"
#include "Logger.hpp"





/** The component owning one Logger per subsystem, each writing into "<logsFolder>/<name>.log".
Once started, the logs are flushed every second. Log files that haven't been written to for longer
than the retention period are removed by pruneOldLogs(). */
class MultiLogger:
	public ComponentCollection::Component<ComponentCollection::ckMultiLogger>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckMultiLogger>;


public:

	/** Creates the MultiLogger that stores its log files in the specified folder.
	aMaxLogSize is the rollover size passed to each Logger.
	The folder is created if it doesn't exist; throws a RuntimeError if that fails. */
	MultiLogger(
		ComponentCollection & aComponents,
		const QString & aLogsFolder,
		qint64 aMaxLogSize = Logger::DEFAULT_MAX_SIZE
	);

	// ComponentCollection::ComponentBase overrides:
	virtual void start() override;

	/** Returns the main logger. */
	Logger & mainLogger() { return logger("main"); }

	/** Returns the logger for the specified name (subsystem).
	If there's no such logger yet, creates one and starts its logfile. */
	Logger & logger(const QString & aLoggerName);

	/** Flushes all the loggers. */
	void flushAllLogs();

	/** Removes the log files (including the rolled-over ".old" ones) in the logs folder that were last
	modified more than aMaxAgeSeconds ago. Files of the currently open loggers are kept.
	Returns the number of removed files. */
	int pruneOldLogs(qint64 aMaxAgeSeconds);

	/** Returns the folder where the log files are stored. */
	const QString & logsFolder() const { return mLogsFolder; }


protected:

	/** The folder where to store the log files. */
	QString mLogsFolder;

	/** The rollover size for the individual loggers. */
	qint64 mMaxLogSize;

	/** All the loggers currently known.
	Protected against multithreaded access by mMtxLoggers. */
	std::map<QString, std::unique_ptr<Logger>> mLoggers;

	/** Protects mLoggers against multithreaded access. */
	QMutex mMtxLoggers;

	/** The timer that periodically flushes all logs. */
	QTimer mTimer;


	/** Returns the name of the file to which the specified logger should write. */
	QString loggerFileName(QString aLoggerName);
};
