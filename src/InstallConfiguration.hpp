#pragma once

#include <QString>
#include "ComponentCollection.hpp"





/** Provides the locations of the files that Castlink uses (data, logs, store, backups).
The data folder defaults to the platform's app data location and can be overridden (tools, tests). */
class InstallConfiguration:
	public ComponentCollection::Component<ComponentCollection::ckInstallConfiguration>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckInstallConfiguration>;


public:

	/** Creates a configuration rooted at the specified data folder.
	If the folder is empty, the platform's app data location is used.
	Throws a RuntimeError if the data folder cannot be created. */
	InstallConfiguration(ComponentCollection & aComponents, const QString & aDataFolder = QString());

	// ComponentCollection::ComponentBase overrides:
	virtual void start() override {}

	/** Reads the overridable values from Settings (store file name, max store duration, max log size).
	Must be called after Settings::init(). */
	void loadFromSettings();

	/** Returns the full path to the specified file in the data folder. */
	QString dataLocation(const QString & aFileName) const;

	/** Returns the folder where the log files are to be stored. */
	QString logsFolder() const;

	/** Returns the folder where the store backups are to be stored (with a trailing slash). */
	QString backupsFolder() const;

	/** Returns the full path to the device store file. */
	QString deviceStoreFileName() const { return dataLocation(mDeviceStoreFileName); }

	/** Returns the configured max store duration, in seconds. */
	double maxStoreDuration() const { return mMaxStoreDuration; }

	/** Returns the size at which the log files are rolled over, in bytes. */
	qint64 maxLogSize() const { return mMaxLogSize; }


protected:

	/** The folder where all data is stored, without the trailing slash. */
	QString mDataFolder;

	/** The device store file name, relative to mDataFolder. */
	QString mDeviceStoreFileName;

	/** The max store duration read from the settings. */
	double mMaxStoreDuration;

	/** The log rollover size read from the settings. */
	qint64 mMaxLogSize;
};
