#pragma once

#include <QObject>
#include <QString>
#include "../Logger.hpp"





/** A namespace-class for the functions backing up the device store file. */
class DeviceStoreBackup:
	public QObject
{
	Q_OBJECT

public:

	/** Makes a backup of the store file before upgrading it.
	aCurrentVersion is the version of the file (before upgrade).
	The backup is named "<basename>-<date>-ver<N>.json" in the backup folder; if such a backup already exists
	(the same version was upgraded earlier today), it is kept and no new backup is made.
	Returns the name of the backup file.
	Throws a RuntimeError if the backup fails. */
	static QString backupBeforeUpgrade(
		const QString & aStoreFileName,
		int aCurrentVersion,
		const QString & aBackupFolder,
		Logger & aLogger
	);
};
