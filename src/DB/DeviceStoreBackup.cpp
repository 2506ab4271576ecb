#include "DeviceStoreBackup.hpp"
#include <QDate>
#include <QDir>
#include <QFileInfo>
#include "../Exception.hpp"





QString DeviceStoreBackup::backupBeforeUpgrade(
	const QString & aStoreFileName,
	int aCurrentVersion,
	const QString & aBackupFolder,
	Logger & aLogger
)
{
	aLogger.log("Backing up the store before an upgrade...");
	auto now = QDate::currentDate();
	auto dstFileName = aBackupFolder + QString("%1-%2-%3-%4-ver%5.json")
		.arg(QFileInfo(aStoreFileName).completeBaseName())
		.arg(now.year())
		.arg(QString::number(now.month()), 2, '0')
		.arg(QString::number(now.day()), 2, '0')
		.arg(aCurrentVersion);

	QFileInfo fi(dstFileName);
	if (fi.exists())
	{
		aLogger.log("Pre-upgrade backup %1 already exists, keeping it.", dstFileName);
		return dstFileName;
	}
	if (!fi.absoluteDir().mkpath(fi.absolutePath()))
	{
		throw RuntimeError(aLogger, tr("Cannot create the folder for the pre-upgrade backup: %1"), fi.absolutePath());
	}
	if (!QFile::copy(aStoreFileName, dstFileName))
	{
		throw RuntimeError(aLogger, tr("Cannot create the pre-upgrade store backup %1"), dstFileName);
	}
	aLogger.log("Pre-upgrade store backup %1 created.", dstFileName);
	return dstFileName;
}
