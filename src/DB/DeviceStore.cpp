#include "DeviceStore.hpp"
#include <algorithm>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QMutexLocker>
#include <QSaveFile>
#include "../Utils.hpp"
#include "DeviceStoreBackup.hpp"
#include "DeviceStoreUpgrade.hpp"





const double DeviceStore::DEFAULT_MAX_STORE_DURATION = 3 * 24 * 60 * 60;





////////////////////////////////////////////////////////////////////////////////
// DeviceStore::StoredService:

QJsonObject DeviceStore::StoredService::toJson() const
{
	QJsonObject res;
	res["class"] = mClassName;
	res["config"] = mConfig.toJson();
	res["description"] = mDescription.toJson();
	return res;
}





DeviceStore::StoredService DeviceStore::StoredService::fromJson(const QJsonObject & aJson)
{
	StoredService res;
	res.mClassName = aJson["class"].toString();
	res.mConfig = ServiceConfig::fromJson(aJson["config"].toObject());
	res.mDescription = ServiceDescription::fromJson(aJson["description"].toObject());
	return res;
}





////////////////////////////////////////////////////////////////////////////////
// DeviceStore::Record:

DeviceStore::Record DeviceStore::Record::fromDevice(const Device & aDevice)
{
	Record res;
	res.mFriendlyName = aDevice.friendlyName();
	res.mLastKnownIPAddress = aDevice.lastKnownIPAddress();
	res.mLastSeenOnWifi = aDevice.lastSeenOnWifi();
	res.mLastConnected = aDevice.lastConnected();
	res.mLastDetection = aDevice.lastDetection();
	for (const auto & svc: aDevice.services())
	{
		auto config = svc->config();
		if (!config.mWasConnected)
		{
			continue;
		}
		StoredService stored;
		stored.mClassName = svc->className();
		stored.mConfig = config;
		stored.mDescription = svc->description();
		auto uuid = stored.mDescription.mUuid.isEmpty() ? config.mUuid : stored.mDescription.mUuid;
		res.mServices[uuid] = stored;
		res.mLastDetection = std::max(res.mLastDetection, stored.mDescription.mLastDetection);
	}
	return res;
}





DeviceStore::Record DeviceStore::Record::fromJson(const QJsonObject & aJson)
{
	Record res;
	res.mFriendlyName = aJson["friendlyName"].toString();
	res.mLastKnownIPAddress = aJson["lastKnownIPAddress"].toString();
	res.mLastSeenOnWifi = aJson["lastSeenOnWifi"].toString();
	res.mLastConnected = aJson["lastConnected"].toDouble();
	res.mLastDetection = aJson["lastDetection"].toDouble();
	auto services = aJson["services"].toObject();
	for (auto itr = services.constBegin(); itr != services.constEnd(); ++itr)
	{
		res.mServices[itr.key()] = StoredService::fromJson(itr.value().toObject());
	}
	return res;
}





QJsonObject DeviceStore::Record::toJson() const
{
	QJsonObject services;
	for (const auto & svc: mServices)
	{
		services[svc.first] = svc.second.toJson();
	}
	QJsonObject res;
	res["friendlyName"] = mFriendlyName;
	res["lastKnownIPAddress"] = mLastKnownIPAddress;
	res["lastSeenOnWifi"] = mLastSeenOnWifi;
	res["lastConnected"] = mLastConnected;
	res["lastDetection"] = mLastDetection;
	res["services"] = services;
	return res;
}





bool DeviceStore::Record::isSameDevice(const DeviceStore::Record & aOther) const
{
	for (const auto & svc: mServices)
	{
		if (aOther.mServices.find(svc.first) != aOther.mServices.end())
		{
			return true;
		}
	}
	return (!mLastKnownIPAddress.isEmpty() && (mLastKnownIPAddress == aOther.mLastKnownIPAddress));
}





bool DeviceStore::Record::isStale(double aNow, double aMaxStoreDuration) const
{
	return (aNow - mLastDetection > aMaxStoreDuration);
}





////////////////////////////////////////////////////////////////////////////////
// DeviceStore:

DeviceStore::DeviceStore(
	ComponentCollection & aComponents,
	const QString & aFileName,
	const QString & aBackupFolder,
	double aMaxStoreDuration
):
	ComponentSuper(aComponents),
	mLogger(aComponents.logger("DeviceStore")),
	mFileName(aFileName),
	mBackupFolder(aBackupFolder),
	mMaxStoreDuration(aMaxStoreDuration),
	mCreated(0),
	mUpdated(0),
	mVersion(DeviceStoreUpgrade::currentVersion())
{
	requireForStart(ComponentCollection::ckMultiLogger);
}





void DeviceStore::start()
{
	mLogger.log("Starting, store file %1, max store duration %2 s.", mFileName, mMaxStoreDuration);
	auto records = load();
	mLogger.log("Started, %1 devices stored.", records.size());
}





std::vector<DeviceStore::Record> DeviceStore::load()
{
	QMutexLocker lock(&mMtx);
	auto contents = readLocked();
	auto numPruned = pruneStale(contents.mRecords);
	if (numPruned > 0)
	{
		mLogger.log("Load: skipped %1 devices not detected for too long.", numPruned);
	}
	return contents.mRecords;
}





void DeviceStore::save(const std::vector<DevicePtr> & aDevices)
{
	QMutexLocker lock(&mMtx);
	auto contents = readLocked();
	contents.mRecords.clear();
	for (const auto & dev: aDevices)
	{
		auto rec = Record::fromDevice(*dev);
		if (rec.mServices.empty())
		{
			mLogger.log("Save: skipping device %1, it has never been connected.", dev->address());
			continue;
		}
		contents.mRecords.push_back(std::move(rec));
	}
	writeLocked(contents);
}





bool DeviceStore::addDevice(const Device & aDevice)
{
	auto rec = Record::fromDevice(aDevice);
	if (rec.mServices.empty())
	{
		mLogger.log("Not storing device %1, it has never been connected.", aDevice.address());
		return false;
	}

	QMutexLocker lock(&mMtx);
	auto contents = readLocked();
	auto idx = findRecord(contents.mRecords, rec);
	if (idx < 0)
	{
		mLogger.log("Adding device %1 (%2).", rec.mLastKnownIPAddress, rec.mFriendlyName);
		contents.mRecords.push_back(std::move(rec));
	}
	else
	{
		mLogger.log("Replacing device %1 (%2).", rec.mLastKnownIPAddress, rec.mFriendlyName);
		contents.mRecords[static_cast<size_t>(idx)] = std::move(rec);
	}
	writeLocked(contents);
	return true;
}





bool DeviceStore::updateDevice(const Device & aDevice)
{
	auto rec = Record::fromDevice(aDevice);
	if (rec.mServices.empty())
	{
		mLogger.log("Not storing device %1, it has never been connected.", aDevice.address());
		return false;
	}

	QMutexLocker lock(&mMtx);
	auto contents = readLocked();
	auto idx = findRecord(contents.mRecords, rec);
	if (idx < 0)
	{
		mLogger.log("Updating device %1 (%2), not stored yet, adding.", rec.mLastKnownIPAddress, rec.mFriendlyName);
		contents.mRecords.push_back(std::move(rec));
	}
	else
	{
		mLogger.log("Updating device %1 (%2).", rec.mLastKnownIPAddress, rec.mFriendlyName);
		auto & stored = contents.mRecords[static_cast<size_t>(idx)];
		if (!rec.mFriendlyName.isEmpty())
		{
			stored.mFriendlyName = rec.mFriendlyName;
		}
		if (!rec.mLastKnownIPAddress.isEmpty())
		{
			stored.mLastKnownIPAddress = rec.mLastKnownIPAddress;
		}
		if (!rec.mLastSeenOnWifi.isEmpty())
		{
			stored.mLastSeenOnWifi = rec.mLastSeenOnWifi;
		}
		stored.mLastConnected = std::max(stored.mLastConnected, rec.mLastConnected);
		stored.mLastDetection = std::max(stored.mLastDetection, rec.mLastDetection);
		for (auto & svc: rec.mServices)
		{
			stored.mServices[svc.first] = std::move(svc.second);
		}
	}
	writeLocked(contents);
	return true;
}





bool DeviceStore::removeDevice(const Device & aDevice)
{
	// Match also by the services that have never been connected, they may share the UUID with the stored ones:
	auto rec = Record::fromDevice(aDevice);
	for (const auto & svc: aDevice.services())
	{
		auto uuid = svc->uuid();
		if (!uuid.isEmpty() && (rec.mServices.find(uuid) == rec.mServices.end()))
		{
			rec.mServices[uuid] = StoredService();
		}
	}

	QMutexLocker lock(&mMtx);
	auto contents = readLocked();
	auto idx = findRecord(contents.mRecords, rec);
	if (idx < 0)
	{
		mLogger.log("Cannot remove device %1, not stored.", aDevice.address());
		return false;
	}
	mLogger.log("Removing device %1.", aDevice.address());
	contents.mRecords.erase(contents.mRecords.begin() + idx);
	writeLocked(contents);
	return true;
}





bool DeviceStore::removeDeviceWithUuid(const QString & aUuid)
{
	QMutexLocker lock(&mMtx);
	auto contents = readLocked();
	auto itr = std::find_if(contents.mRecords.begin(), contents.mRecords.end(),
		[&aUuid](const Record & aRecord)
		{
			return (aRecord.mServices.find(aUuid) != aRecord.mServices.end());
		}
	);
	if (itr == contents.mRecords.end())
	{
		mLogger.log("Cannot remove device with service %1, not stored.", aUuid);
		return false;
	}
	mLogger.log("Removing device with service %1 (%2).", aUuid, itr->mFriendlyName);
	contents.mRecords.erase(itr);
	writeLocked(contents);
	return true;
}





void DeviceStore::removeAll()
{
	QMutexLocker lock(&mMtx);
	auto contents = readLocked();
	mLogger.log("Removing all %1 devices.", contents.mRecords.size());
	contents.mRecords.clear();
	writeLocked(contents);
}





ServiceConfig DeviceStore::lookupServiceConfig(const QString & aUuid)
{
	for (const auto & rec: load())
	{
		auto itr = rec.mServices.find(aUuid);
		if (itr != rec.mServices.end())
		{
			return itr->second.mConfig;
		}
	}
	return ServiceConfig();
}





void DeviceStore::setMaxStoreDuration(double aMaxStoreDuration)
{
	if (aMaxStoreDuration <= 0)
	{
		throw LogicError(mLogger, "Invalid max store duration: %1", aMaxStoreDuration);
	}

	QMutexLocker lock(&mMtx);
	mLogger.log("Changing the max store duration from %1 to %2 s.", mMaxStoreDuration, aMaxStoreDuration);
	auto oldMaxStoreDuration = mMaxStoreDuration;
	mMaxStoreDuration = aMaxStoreDuration;
	try
	{
		auto contents = readLocked();
		writeLocked(contents);
	}
	catch (const RuntimeError &)
	{
		// The pruning with the new duration didn't happen, keep using the old one:
		mMaxStoreDuration = oldMaxStoreDuration;
		throw;
	}
}





double DeviceStore::maxStoreDuration() const
{
	QMutexLocker lock(&mMtx);
	return mMaxStoreDuration;
}





double DeviceStore::created() const
{
	QMutexLocker lock(&mMtx);
	return mCreated;
}





double DeviceStore::updated() const
{
	QMutexLocker lock(&mMtx);
	return mUpdated;
}





int DeviceStore::version() const
{
	QMutexLocker lock(&mMtx);
	return mVersion;
}





DeviceStore::Contents DeviceStore::readLocked()
{
	auto now = Utils::nowEpochSeconds();
	Contents res{DeviceStoreUpgrade::currentVersion(), now, now, {}};

	QFile f(mFileName);
	if (!f.exists())
	{
		mLogger.log("The store file %1 doesn't exist yet, starting with an empty store.", mFileName);
		return res;
	}
	if (!f.open(QIODevice::ReadOnly))
	{
		mLogger.log("Cannot open the store file %1 (%2), starting with an empty store.", mFileName, f.errorString());
		return res;
	}
	QJsonParseError err;
	auto doc = QJsonDocument::fromJson(f.readAll(), &err);
	f.close();
	if (err.error != QJsonParseError::NoError)
	{
		mLogger.log("The store file %1 is corrupt (%2 at offset %3), starting with an empty store.",
			mFileName, err.errorString(), err.offset
		);
		return res;
	}
	if (!doc.isObject())
	{
		mLogger.log("The store file %1 doesn't contain a JSON object, starting with an empty store.", mFileName);
		return res;
	}

	auto store = doc.object();
	auto version = DeviceStoreUpgrade::getVersion(store);
	if (version > DeviceStoreUpgrade::currentVersion())
	{
		throw VersionError(mLogger, "The store file %1 has version %2, only versions up to %3 are supported.",
			mFileName, version, DeviceStoreUpgrade::currentVersion()
		);
	}
	if (version < DeviceStoreUpgrade::currentVersion())
	{
		if (!mBackupFolder.isEmpty())
		{
			DeviceStoreBackup::backupBeforeUpgrade(mFileName, version, mBackupFolder, mLogger);
		}
		DeviceStoreUpgrade::upgrade(store, mLogger);
	}

	res.mVersion = DeviceStoreUpgrade::getVersion(store);
	res.mCreated = store["created"].toDouble(now);
	res.mUpdated = store["updated"].toDouble(res.mCreated);
	for (const auto & dev: store["devices"].toArray())
	{
		if (!dev.isObject())
		{
			mLogger.log("Skipping an invalid device entry in the store file %1.", mFileName);
			continue;
		}
		res.mRecords.push_back(Record::fromJson(dev.toObject()));
	}
	mCreated = res.mCreated;
	mUpdated = res.mUpdated;
	mVersion = res.mVersion;
	return res;
}





void DeviceStore::writeLocked(DeviceStore::Contents & aContents)
{
	auto numPruned = pruneStale(aContents.mRecords);
	if (numPruned > 0)
	{
		mLogger.log("Save: removed %1 devices not detected for too long.", numPruned);
	}
	aContents.mVersion = DeviceStoreUpgrade::currentVersion();
	aContents.mUpdated = Utils::nowEpochSeconds();

	QJsonArray devices;
	for (const auto & rec: aContents.mRecords)
	{
		devices.append(rec.toJson());
	}
	QJsonObject store;
	store["version"] = aContents.mVersion;
	store["created"] = aContents.mCreated;
	store["updated"] = aContents.mUpdated;
	store["devices"] = devices;

	QFileInfo fi(mFileName);
	if (!fi.absoluteDir().mkpath(fi.absolutePath()))
	{
		throw IoError(mLogger, "Cannot create the folder for the store file: %1", fi.absolutePath());
	}
	QSaveFile f(mFileName);
	if (!f.open(QIODevice::WriteOnly))
	{
		throw IoError(mLogger, "Cannot open the store file %1 for writing: %2", mFileName, f.errorString());
	}
	f.write(QJsonDocument(store).toJson(QJsonDocument::Indented));
	if (!f.commit())
	{
		throw IoError(mLogger, "Cannot write the store file %1: %2", mFileName, f.errorString());
	}
	mCreated = aContents.mCreated;
	mUpdated = aContents.mUpdated;
	mVersion = aContents.mVersion;
	mLogger.log("Saved %1 devices into %2.", aContents.mRecords.size(), mFileName);
}





size_t DeviceStore::pruneStale(std::vector<DeviceStore::Record> & aRecords) const
{
	auto now = Utils::nowEpochSeconds();
	auto maxDuration = mMaxStoreDuration;
	auto origSize = aRecords.size();
	aRecords.erase(std::remove_if(aRecords.begin(), aRecords.end(),
		[now, maxDuration](const Record & aRecord)
		{
			return aRecord.isStale(now, maxDuration);
		}),
		aRecords.end()
	);
	return origSize - aRecords.size();
}





int DeviceStore::findRecord(const std::vector<DeviceStore::Record> & aRecords, const DeviceStore::Record & aRecord)
{
	for (size_t i = 0; i < aRecords.size(); ++i)
	{
		if (aRecords[i].isSameDevice(aRecord))
		{
			return static_cast<int>(i);
		}
	}
	return -1;
}
