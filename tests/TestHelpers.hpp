#pragma once

#include <memory>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include "ComponentCollection.hpp"
#include "MultiLogger.hpp"





/** Delivers all the queued signals (Connection -> Device), including those queued while delivering. */
inline void processQueuedSignals()
{
	for (int i = 0; i < 10; ++i)
	{
		QCoreApplication::sendPostedEvents();
		QCoreApplication::processEvents();
	}
}





/** A temporary folder with a ComponentCollection that has a MultiLogger writing into the folder.
Each test creates its own environment, so that the tests don't share any files. */
class TestEnvironment
{
public:

	TestEnvironment():
		mMultiLogger(mComponents.addNew<MultiLogger>(mDir.path() + "/logs"))
	{
	}

	/** Returns the full path to the specified file in the temporary folder. */
	QString path(const QString & aFileName) const
	{
		return mDir.path() + "/" + aFileName;
	}

	/** Returns a logger for the specified subsystem. */
	Logger & logger(const QString & aName = "Test")
	{
		return mMultiLogger->logger(aName);
	}

	/** Writes the specified JSON into the file, returns true on success. */
	bool writeJson(const QString & aFileName, const QJsonObject & aJson)
	{
		return writeFile(aFileName, QJsonDocument(aJson).toJson());
	}

	/** Writes the raw data into the file, returns true on success. */
	bool writeFile(const QString & aFileName, const QByteArray & aData)
	{
		QFile f(aFileName);
		if (!f.open(QIODevice::WriteOnly))
		{
			return false;
		}
		return (f.write(aData) == aData.size());
	}

	/** Reads the JSON object from the file; returns an empty object on failure. */
	QJsonObject readJson(const QString & aFileName)
	{
		QFile f(aFileName);
		if (!f.open(QIODevice::ReadOnly))
		{
			return QJsonObject();
		}
		return QJsonDocument::fromJson(f.readAll()).object();
	}

	QTemporaryDir mDir;
	ComponentCollection mComponents;
	std::shared_ptr<MultiLogger> mMultiLogger;
};
