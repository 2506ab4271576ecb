#pragma once

#include <map>
#include <vector>
#include <QObject>
#include <QMutex>
#include <QJsonObject>
#include "../ComponentCollection.hpp"
#include "../Device.hpp"





/** Persists the devices that have been connected to, so that they (and their pairing credentials) survive restarts.
The store is a single JSON file; each operation reads the file, modifies the data and writes it back
atomically, all under a single mutex, so that concurrent writers cannot interleave.

Privacy rules:
- Only devices with at least one service that has been connected to (config.wasConnected) are ever written.
- Devices not detected within the max store duration are dropped, both when reading and when writing.

The file carries a schema version. Older files are backed up and upgraded when read; files written by a newer
version are refused with a VersionError. An unreadable or corrupt file is treated as an empty store. */
class DeviceStore:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckDeviceStore>
{
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckDeviceStore>;
	Q_OBJECT


public:

	/** The default time for which a device stays stored without being detected, in seconds (3 days). */
	static const double DEFAULT_MAX_STORE_DURATION;


	/** Thrown when the store file has been written by a newer, unsupported version. */
	class VersionError: public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** Thrown when the store file cannot be written. */
	class IoError: public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** A single stored service (Connection) of a device. */
	struct StoredService
	{
		/** The Connection class name, used by the ConnectionFactory to re-create the connection. */
		QString mClassName;

		ServiceConfig mConfig;
		ServiceDescription mDescription;

		QJsonObject toJson() const;
		static StoredService fromJson(const QJsonObject & aJson);
	};


	/** A single stored device. */
	struct Record
	{
		QString mFriendlyName;
		QString mLastKnownIPAddress;
		QString mLastSeenOnWifi;
		double mLastConnected = 0;
		double mLastDetection = 0;

		/** The stored services, keyed by the endpoint UUID. */
		std::map<QString, StoredService> mServices;


		/** Creates a record from the live device.
		Only the services that have been connected to are included. */
		static Record fromDevice(const Device & aDevice);

		static Record fromJson(const QJsonObject & aJson);
		QJsonObject toJson() const;

		/** Returns true if both records represent the same physical device:
		they share a service UUID, or they have the same (non-empty) last known address. */
		bool isSameDevice(const Record & aOther) const;

		/** Returns true if the device hasn't been detected within the specified duration before aNow. */
		bool isStale(double aNow, double aMaxStoreDuration) const;
	};


	/** Creates a store that uses the specified file.
	Backups before upgrades are placed into aBackupFolder (with a trailing slash); if empty, no backups are made. */
	DeviceStore(
		ComponentCollection & aComponents,
		const QString & aFileName,
		const QString & aBackupFolder = QString(),
		double aMaxStoreDuration = DEFAULT_MAX_STORE_DURATION
	);

	// ComponentCollection::ComponentBase overrides:

	/** Checks that the store file is readable (upgrading it, if needed).
	Throws a VersionError if the file is of an unsupported version. */
	virtual void start() override;

	/** Reads the stored devices, without the ones not detected within the max store duration.
	The file itself is not modified (except for the backup before an upgrade).
	Throws a VersionError if the file is of an unsupported version. */
	std::vector<Record> load();

	/** Replaces the stored devices with the specified ones.
	Devices that have never been connected, and those not detected within the max store duration, are left out.
	Throws a VersionError if the existing file is of an unsupported version, IoError if it cannot be written. */
	void save(const std::vector<DevicePtr> & aDevices);

	/** Same as load(). */
	std::vector<Record> storedDevices() { return load(); }

	/** Stores the device, replacing its previous record, if any.
	Returns false, without touching the file, if the device has never been connected. */
	bool addDevice(const Device & aDevice);

	/** Merges the device into its stored record (keeping the stored services that the device doesn't have),
	or adds it if not stored yet.
	Returns false, without touching the file, if the device has never been connected. */
	bool updateDevice(const Device & aDevice);

	/** Removes the record of the device. Returns true if a record was removed. */
	bool removeDevice(const Device & aDevice);

	/** Removes the record that has a service with the specified UUID. Returns true if a record was removed. */
	bool removeDeviceWithUuid(const QString & aUuid);

	/** Removes all the stored devices. */
	void removeAll();

	/** Returns the stored config of the service with the specified UUID.
	Returns an empty config (with an empty mUuid) if there's no such service stored. */
	ServiceConfig lookupServiceConfig(const QString & aUuid);

	/** Sets a new max store duration (in seconds) and immediately removes the devices that are now too old.
	Throws a LogicError if the duration is not positive. */
	void setMaxStoreDuration(double aMaxStoreDuration);

	double maxStoreDuration() const;

	const QString & fileName() const { return mFileName; }

	// Values read from the file during the last operation:
	double created() const;
	double updated() const;
	int version() const;


protected:

	/** The whole contents of the store file. */
	struct Contents
	{
		int mVersion;
		double mCreated;
		double mUpdated;
		std::vector<Record> mRecords;
	};


	/** The logger used for all messages produced by this class. */
	Logger & mLogger;

	/** The file where the data is stored. */
	const QString mFileName;

	/** The folder where the backups are made before upgrading; empty for no backups. */
	const QString mBackupFolder;

	/** Protects the store file and the members below against multithreaded access. */
	mutable QMutex mMtx;

	/** The max store duration, in seconds. */
	double mMaxStoreDuration;

	// Values read from the file during the last operation:
	double mCreated;
	double mUpdated;
	int mVersion;


	/** Reads the store file, upgrading older versions.
	Returns an empty store if the file doesn't exist or is corrupt.
	Throws a VersionError if the file is of an unsupported version.
	Expects mMtx to be locked by the caller. */
	Contents readLocked();

	/** Prunes the stale records and writes the contents into the store file, atomically.
	Throws an IoError if the file cannot be written.
	Expects mMtx to be locked by the caller. */
	void writeLocked(Contents & aContents);

	/** Removes the records not detected within the max store duration.
	Returns the number of removed records. */
	size_t pruneStale(std::vector<Record> & aRecords) const;

	/** Returns the index of the record representing the same device as aRecord, or -1 if not present. */
	static int findRecord(const std::vector<Record> & aRecords, const Record & aRecord);
};
