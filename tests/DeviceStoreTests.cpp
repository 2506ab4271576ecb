// DeviceStoreTests.cpp

// Tests the persistence of the connected devices: privacy filtering, pruning and schema upgrades.

#include <gtest/gtest.h>
#include <QDir>
#include <QJsonArray>
#include "DB/DeviceStore.hpp"
#include "DB/DeviceStoreUpgrade.hpp"
#include "Utils.hpp"
#include "TestConnection.hpp"
#include "TestHelpers.hpp"





class DeviceStoreTests: public ::testing::Test
{
protected:
	TestEnvironment mEnv;

	QString storeFile() const { return mEnv.path("devices.json"); }

	QString backupFolder() const { return mEnv.path("backups/"); }

	/** Creates a device with a single connection, detected at the specified time.
	If aShouldConnect is true, the connection is brought to Ready, so that the device qualifies for storing. */
	DevicePtr makeDevice(
		const QString & aAddress,
		const QString & aUuid,
		double aLastDetection,
		bool aShouldConnect,
		const QString & aClientKey = QString()
	)
	{
		auto dev = std::make_shared<Device>(mEnv.logger("Devices"), aAddress);
		auto conn = std::make_shared<TestConnection>(
			mEnv.logger("Connections"),
			TestConnection::makeDescription("webOS TV", aUuid, aAddress, aLastDetection)
		);
		conn->setAutoConnect(true);
		if (!aClientKey.isEmpty())
		{
			QJsonObject creds;
			creds["clientKey"] = aClientKey;
			conn->setCredentials(creds);
		}
		dev->addConnection(conn);
		if (aShouldConnect)
		{
			dev->openConnections();
			processQueuedSignals();
		}
		return dev;
	}

	/** Returns a store in the version 1 format, with a single device detected at the specified time. */
	static QJsonObject version1Store(double aLastDetection)
	{
		QJsonObject config;
		config["class"] = "WebOSTVServiceConfig";
		config["UUID"] = "uuid-v1";
		config["clientKey"] = "legacy-key";
		QJsonObject description;
		description["serviceId"] = "webOS TV";
		description["UUID"] = "uuid-v1";
		description["address"] = "192.168.1.50";
		QJsonObject service;
		service["class"] = "TestConnection";
		service["config"] = config;
		service["description"] = description;
		QJsonObject services;
		services["uuid-v1"] = service;
		QJsonObject device;
		device["lastKnownIPAddress"] = "192.168.1.50";
		device["lastDetection"] = aLastDetection;
		device["services"] = services;
		QJsonObject store;
		store["version"] = 1;
		store["created"] = 1000.0;
		store["updated"] = 2000.0;
		store["devices"] = QJsonArray({device});
		return store;
	}
};





TEST_F(DeviceStoreTests, MissingFileIsEmptyStore)
{
	DeviceStore store(mEnv.mComponents, storeFile());
	EXPECT_TRUE(store.load().empty());
	EXPECT_EQ(store.version(), DeviceStoreUpgrade::currentVersion());
	EXPECT_FALSE(QFile::exists(storeFile()));
	EXPECT_EQ(store.lookupServiceConfig("uuid-1").mUuid, QString());
}





TEST_F(DeviceStoreTests, SavesOnlyConnectedFreshDevices)
{
	auto now = Utils::nowEpochSeconds();
	std::vector<DevicePtr> devices =
	{
		makeDevice("192.168.1.10", "uuid-connected", now, true, "secret-key"),
		makeDevice("192.168.1.11", "uuid-never", now, false),
		makeDevice("192.168.1.12", "uuid-stale", now - 4 * 24 * 60 * 60, true),
	};
	DeviceStore store(mEnv.mComponents, storeFile());
	store.save(devices);

	auto records = store.load();
	ASSERT_EQ(records.size(), 1u);
	const auto & rec = records[0];
	EXPECT_EQ(rec.mLastKnownIPAddress, "192.168.1.10");
	EXPECT_EQ(rec.mFriendlyName, "Living room TV");
	EXPECT_GT(rec.mLastConnected, 0);
	ASSERT_EQ(rec.mServices.size(), 1u);
	const auto & svc = rec.mServices.at("uuid-connected");
	EXPECT_EQ(svc.mClassName, "TestConnection");
	EXPECT_EQ(svc.mDescription.mServiceID, "webOS TV");
	EXPECT_EQ(svc.mDescription.mPort, 3000);
	EXPECT_TRUE(svc.mConfig.mWasConnected);
	EXPECT_EQ(svc.mConfig.mCredentials["clientKey"].toString(), "secret-key");

	// The file on disk doesn't contain the filtered-out devices either:
	auto json = mEnv.readJson(storeFile());
	EXPECT_EQ(json["version"].toInt(), DeviceStoreUpgrade::currentVersion());
	EXPECT_EQ(json["devices"].toArray().size(), 1);
}





TEST_F(DeviceStoreTests, ShorterMaxDurationPrunes)
{
	auto now = Utils::nowEpochSeconds();
	DeviceStore store(mEnv.mComponents, storeFile());
	EXPECT_EQ(store.maxStoreDuration(), DeviceStore::DEFAULT_MAX_STORE_DURATION);
	store.save({
		makeDevice("192.168.1.10", "uuid-recent", now, true),
		makeDevice("192.168.1.11", "uuid-older", now - 2 * 60 * 60, true),
	});
	ASSERT_EQ(store.load().size(), 2u);

	store.setMaxStoreDuration(60 * 60);
	auto records = store.load();
	ASSERT_EQ(records.size(), 1u);
	EXPECT_EQ(records[0].mServices.count("uuid-recent"), 1u);
	EXPECT_EQ(mEnv.readJson(storeFile())["devices"].toArray().size(), 1);

	EXPECT_THROW(store.setMaxStoreDuration(0), LogicError);
	EXPECT_EQ(store.maxStoreDuration(), 60 * 60);
}





TEST_F(DeviceStoreTests, CorruptFileIsEmptyStore)
{
	ASSERT_TRUE(mEnv.writeFile(storeFile(), "{\"version\": 2, \"devices\": [ {"));
	DeviceStore store(mEnv.mComponents, storeFile());
	EXPECT_TRUE(store.load().empty());

	// The next write replaces the corrupt file:
	EXPECT_TRUE(store.addDevice(*makeDevice("192.168.1.10", "uuid-1", Utils::nowEpochSeconds(), true)));
	EXPECT_EQ(store.load().size(), 1u);
}





TEST_F(DeviceStoreTests, NewerVersionIsRefused)
{
	QJsonObject json;
	json["version"] = DeviceStoreUpgrade::currentVersion() + 1;
	json["devices"] = QJsonArray();
	ASSERT_TRUE(mEnv.writeJson(storeFile(), json));

	DeviceStore store(mEnv.mComponents, storeFile());
	EXPECT_THROW(store.load(), DeviceStore::VersionError);
	EXPECT_THROW(store.addDevice(*makeDevice("192.168.1.10", "uuid-1", Utils::nowEpochSeconds(), true)), DeviceStore::VersionError);

	// The file is left untouched:
	EXPECT_EQ(mEnv.readJson(storeFile())["version"].toInt(), DeviceStoreUpgrade::currentVersion() + 1);
}





TEST_F(DeviceStoreTests, UpgradesVersion1WithBackup)
{
	auto now = Utils::nowEpochSeconds();
	ASSERT_TRUE(mEnv.writeJson(storeFile(), version1Store(now)));
	DeviceStore store(mEnv.mComponents, storeFile(), backupFolder());

	auto records = store.load();
	ASSERT_EQ(records.size(), 1u);
	EXPECT_EQ(records[0].mLastKnownIPAddress, "192.168.1.50");
	EXPECT_TRUE(records[0].mFriendlyName.isEmpty());
	EXPECT_EQ(records[0].mLastConnected, 0.0);
	const auto & config = records[0].mServices.at("uuid-v1").mConfig;
	EXPECT_TRUE(config.mWasConnected);
	EXPECT_EQ(config.mCredentials["clientKey"].toString(), "legacy-key");
	EXPECT_EQ(store.lookupServiceConfig("uuid-v1").mCredentials["clientKey"].toString(), "legacy-key");

	// The original file is backed up, and stays at version 1 until the next write:
	auto backups = QDir(backupFolder()).entryList({"devices-*-ver1.json"}, QDir::Files);
	EXPECT_EQ(backups.size(), 1);
	EXPECT_EQ(mEnv.readJson(storeFile())["version"].toInt(), 1);

	store.removeDeviceWithUuid("uuid-nonexistent");
	EXPECT_EQ(mEnv.readJson(storeFile())["version"].toInt(), 1);
	store.removeAll();
	EXPECT_EQ(mEnv.readJson(storeFile())["version"].toInt(), DeviceStoreUpgrade::currentVersion());
	EXPECT_EQ(store.created(), 1000.0);
}





TEST_F(DeviceStoreTests, UpgradeFillsMissingLastDetection)
{
	auto now = Utils::nowEpochSeconds();

	// Taken from the services:
	auto json = version1Store(0);
	auto devices = json["devices"].toArray();
	auto device = devices[0].toObject();
	device.remove("lastDetection");
	auto services = device["services"].toObject();
	auto service = services["uuid-v1"].toObject();
	auto config = service["config"].toObject();
	config["lastDetection"] = now - 100;
	service["config"] = config;
	services["uuid-v1"] = service;
	device["services"] = services;
	devices[0] = device;
	json["devices"] = devices;
	json["updated"] = now - 200;
	ASSERT_TRUE(mEnv.writeJson(storeFile(), json));
	{
		DeviceStore store(mEnv.mComponents, storeFile(), backupFolder());
		auto records = store.load();
		ASSERT_EQ(records.size(), 1u);
		EXPECT_EQ(records[0].mLastDetection, now - 100);
	}

	// Taken from the store's last update when no service has one:
	config.remove("lastDetection");
	service["config"] = config;
	services["uuid-v1"] = service;
	device["services"] = services;
	devices[0] = device;
	json["devices"] = devices;
	ASSERT_TRUE(mEnv.writeJson(storeFile(), json));
	DeviceStore store(mEnv.mComponents, storeFile(), backupFolder());
	auto records = store.load();
	ASSERT_EQ(records.size(), 1u);
	EXPECT_EQ(records[0].mLastDetection, now - 200);
	EXPECT_EQ(records[0].mLastKnownIPAddress, "192.168.1.50");
}





TEST_F(DeviceStoreTests, FailedDurationChangeKeepsOldDuration)
{
	QJsonObject json;
	json["version"] = DeviceStoreUpgrade::currentVersion() + 1;
	json["devices"] = QJsonArray();
	ASSERT_TRUE(mEnv.writeJson(storeFile(), json));

	DeviceStore store(mEnv.mComponents, storeFile(), backupFolder(), 1000);
	EXPECT_THROW(store.setMaxStoreDuration(10), DeviceStore::VersionError);
	EXPECT_EQ(store.maxStoreDuration(), 1000);
	EXPECT_THROW(store.setMaxStoreDuration(0), LogicError);
	EXPECT_EQ(store.maxStoreDuration(), 1000);
}





TEST_F(DeviceStoreTests, KeepsCreationTime)
{
	DeviceStore store(mEnv.mComponents, storeFile());
	store.addDevice(*makeDevice("192.168.1.10", "uuid-1", Utils::nowEpochSeconds(), true));
	auto created = mEnv.readJson(storeFile())["created"].toDouble();
	EXPECT_GT(created, 0);
	store.addDevice(*makeDevice("192.168.1.11", "uuid-2", Utils::nowEpochSeconds(), true));
	auto json = mEnv.readJson(storeFile());
	EXPECT_EQ(json["created"].toDouble(), created);
	EXPECT_GE(json["updated"].toDouble(), created);
	EXPECT_EQ(store.created(), created);
}





TEST_F(DeviceStoreTests, AddUpdateRemove)
{
	auto now = Utils::nowEpochSeconds();
	DeviceStore store(mEnv.mComponents, storeFile());
	EXPECT_FALSE(store.addDevice(*makeDevice("192.168.1.10", "uuid-1", now, false)));
	EXPECT_FALSE(QFile::exists(storeFile()));

	auto dev = makeDevice("192.168.1.10", "uuid-1", now, true, "key-1");
	EXPECT_TRUE(store.addDevice(*dev));
	EXPECT_TRUE(store.addDevice(*dev));
	EXPECT_EQ(store.load().size(), 1u);

	// Same address, different service: the same device, merged:
	dev->setLastSeenOnWifi("HomeNet");
	auto dial = std::make_shared<TestConnection>(
		mEnv.logger("Connections"),
		TestConnection::makeDescription("DIAL", "uuid-dial", "192.168.1.10", now)
	);
	dial->setAutoConnect(true);
	dev->addConnection(dial);
	dial->openConnection();
	processQueuedSignals();
	EXPECT_TRUE(store.updateDevice(*dev));
	auto records = store.load();
	ASSERT_EQ(records.size(), 1u);
	EXPECT_EQ(records[0].mServices.size(), 2u);
	EXPECT_EQ(records[0].mLastSeenOnWifi, "HomeNet");
	EXPECT_EQ(store.lookupServiceConfig("uuid-1").mCredentials["clientKey"].toString(), "key-1");
	EXPECT_TRUE(store.lookupServiceConfig("uuid-dial").mWasConnected);

	// A different device:
	EXPECT_TRUE(store.updateDevice(*makeDevice("192.168.1.20", "uuid-2", now, true)));
	EXPECT_EQ(store.load().size(), 2u);

	EXPECT_TRUE(store.removeDevice(*dev));
	EXPECT_FALSE(store.removeDevice(*dev));
	EXPECT_TRUE(store.lookupServiceConfig("uuid-1").mUuid.isEmpty());
	EXPECT_EQ(store.load().size(), 1u);

	EXPECT_FALSE(store.removeDeviceWithUuid("uuid-1"));
	EXPECT_TRUE(store.removeDeviceWithUuid("uuid-2"));
	EXPECT_TRUE(store.load().empty());
}





TEST_F(DeviceStoreTests, RemoveAll)
{
	auto now = Utils::nowEpochSeconds();
	DeviceStore store(mEnv.mComponents, storeFile());
	store.save({
		makeDevice("192.168.1.10", "uuid-1", now, true),
		makeDevice("192.168.1.11", "uuid-2", now, true),
	});
	EXPECT_EQ(store.load().size(), 2u);
	store.removeAll();
	EXPECT_TRUE(store.load().empty());
	EXPECT_TRUE(mEnv.readJson(storeFile())["devices"].toArray().isEmpty());
}
