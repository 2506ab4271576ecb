#include "InstallConfiguration.hpp"
#include <QDir>
#include <QStandardPaths>
#include "Settings.hpp"
#include "DB/DeviceStore.hpp"





InstallConfiguration::InstallConfiguration(ComponentCollection & aComponents, const QString & aDataFolder):
	Super(aComponents),
	mDataFolder(aDataFolder),
	mDeviceStoreFileName("StoredDevices.json"),
	mMaxStoreDuration(DeviceStore::DEFAULT_MAX_STORE_DURATION),
	mMaxLogSize(Logger::DEFAULT_MAX_SIZE)
{
	if (mDataFolder.isEmpty())
	{
		mDataFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
	}
	while (mDataFolder.endsWith('/'))
	{
		mDataFolder.chop(1);
	}
	if (!QDir().mkpath(mDataFolder))
	{
		throw RuntimeError("Cannot create the data folder %1", mDataFolder);
	}
}





void InstallConfiguration::loadFromSettings()
{
	mDeviceStoreFileName = Settings::loadValue("DeviceStore", "FileName", mDeviceStoreFileName).toString();
	bool isOK = false;
	auto maxDuration = Settings::loadValue("DeviceStore", "MaxStoreDuration", mMaxStoreDuration).toDouble(&isOK);
	if (isOK && (maxDuration > 0))
	{
		mMaxStoreDuration = maxDuration;
	}
	else
	{
		qWarning() << "Invalid DeviceStore/MaxStoreDuration setting, using " << mMaxStoreDuration;
	}
	auto maxLogSize = Settings::loadValue("Logging", "MaxFileSize", mMaxLogSize).toLongLong(&isOK);
	if (isOK)
	{
		mMaxLogSize = maxLogSize;
	}
}





QString InstallConfiguration::dataLocation(const QString & aFileName) const
{
	return mDataFolder + "/" + aFileName;
}





QString InstallConfiguration::logsFolder() const
{
	return mDataFolder + "/logs";
}





QString InstallConfiguration::backupsFolder() const
{
	return mDataFolder + "/backups/";
}
