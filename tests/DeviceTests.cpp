// DeviceTests.cpp

// Tests the Device: the connection barrier, capability resolution and the connection bookkeeping.

#include <algorithm>
#include <gtest/gtest.h>
#include "Device.hpp"
#include "TestConnection.hpp"
#include "TestHelpers.hpp"





/** Records the device-level signals, in the order of their emission. */
class DeviceRecorder
{
public:

	explicit DeviceRecorder(Device & aDevice)
	{
		QObject::connect(&aDevice, &Device::ready,
			[this](Device * aDevice)
			{
				Q_UNUSED(aDevice);
				mEvents.append("ready");
			}
		);
		QObject::connect(&aDevice, &Device::connectionFailed,
			[this](Device * aDevice, const Device::Failures & aFailures)
			{
				Q_UNUSED(aDevice);
				mEvents.append("connectionFailed");
				mFailures = aFailures;
			}
		);
		QObject::connect(&aDevice, &Device::pairingRequired,
			[this](Device * aDevice, Connection * aConnection, Connection::PairingType aPairingType, const QVariant & aPairingData)
			{
				Q_UNUSED(aDevice);
				Q_UNUSED(aPairingType);
				Q_UNUSED(aPairingData);
				mEvents.append("pairingRequired:" + aConnection->serviceName());
			}
		);
		QObject::connect(&aDevice, &Device::pairingFailed,
			[this](Device * aDevice, Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage)
			{
				Q_UNUSED(aDevice);
				Q_UNUSED(aErrorCode);
				Q_UNUSED(aErrorMessage);
				mEvents.append("pairingFailed:" + aConnection->serviceName());
			}
		);
		QObject::connect(&aDevice, &Device::disconnected,
			[this](Device * aDevice, Connection::ErrorCode aErrorCode, const QString & aErrorMessage)
			{
				Q_UNUSED(aDevice);
				Q_UNUSED(aErrorMessage);
				mEvents.append("disconnected");
				mDisconnectCodes.push_back(aErrorCode);
			}
		);
		QObject::connect(&aDevice, &Device::capabilitiesUpdated,
			[this](Device * aDevice, const QStringList & aAdded, const QStringList & aRemoved)
			{
				Q_UNUSED(aDevice);
				mCapabilityChanges.push_back(std::make_pair(aAdded, aRemoved));
			}
		);
	}

	int count(const QString & aEvent) const
	{
		return mEvents.count(aEvent);
	}

	QStringList mEvents;
	Device::Failures mFailures;
	std::vector<Connection::ErrorCode> mDisconnectCodes;
	std::vector<std::pair<QStringList, QStringList>> mCapabilityChanges;
};





class DeviceTests: public ::testing::Test
{
protected:
	TestEnvironment mEnv;

	DevicePtr makeDevice()
	{
		return std::make_shared<Device>(mEnv.logger("Devices"), "192.168.1.10");
	}

	TestConnectionPtr makeConnection(const QString & aServiceID, const QString & aUuid)
	{
		return std::make_shared<TestConnection>(
			mEnv.logger("Connections"),
			TestConnection::makeDescription(aServiceID, aUuid)
		);
	}
};





TEST_F(DeviceTests, RejectsDuplicateProtocol)
{
	auto dev = makeDevice();
	EXPECT_TRUE(dev->addConnection(makeConnection("webOS TV", "uuid-1")));
	EXPECT_FALSE(dev->addConnection(makeConnection("webOS TV", "uuid-2")));
	EXPECT_TRUE(dev->addConnection(makeConnection("DIAL", "uuid-3")));
	ASSERT_EQ(dev->services().size(), 2u);
	EXPECT_EQ(dev->services()[0]->uuid(), "uuid-1");
	EXPECT_EQ(dev->serviceWithName("DIAL")->uuid(), "uuid-3");
	EXPECT_EQ(dev->serviceWithName("Roku"), nullptr);
	EXPECT_THROW(dev->addConnection(nullptr), LogicError);
}





TEST_F(DeviceTests, FillsIdentityFromConnections)
{
	Device dev(mEnv.logger("Devices"));
	EXPECT_TRUE(dev.address().isEmpty());
	auto conn = std::make_shared<TestConnection>(
		mEnv.logger("Connections"),
		TestConnection::makeDescription("webOS TV", "uuid-1", "10.0.0.5", 1000)
	);
	dev.addConnection(conn);
	EXPECT_EQ(dev.address(), "10.0.0.5");
	EXPECT_EQ(dev.lastKnownIPAddress(), "10.0.0.5");
	EXPECT_EQ(dev.friendlyName(), "Living room TV");
	EXPECT_EQ(dev.modelName(), "Test TV");
	EXPECT_EQ(dev.modelNumber(), "T-1");
	EXPECT_EQ(dev.lastDetection(), 1000);

	// Later connections don't override, except for the newer detection:
	auto desc = TestConnection::makeDescription("DIAL", "uuid-2", "10.0.0.6", 2000);
	desc.mFriendlyName = "Other name";
	dev.addConnection(std::make_shared<TestConnection>(mEnv.logger("Connections"), desc));
	EXPECT_EQ(dev.address(), "10.0.0.5");
	EXPECT_EQ(dev.friendlyName(), "Living room TV");
	EXPECT_EQ(dev.lastDetection(), 2000);

	dev.setLastDetection(1500);
	EXPECT_EQ(dev.lastDetection(), 2000);
	dev.setLastKnownIPAddress("");
	EXPECT_EQ(dev.lastKnownIPAddress(), "10.0.0.5");
}





TEST_F(DeviceTests, ReadyImmediatelyWithoutConnectables)
{
	auto empty = makeDevice();
	DeviceRecorder emptyRec(*empty);
	empty->openConnections();
	EXPECT_EQ(emptyRec.mEvents, QStringList({"ready"}));

	auto dev = makeDevice();
	auto conn = makeConnection("DIAL", "uuid-1");
	conn->setConnectable(false);
	dev->addConnection(conn);
	DeviceRecorder rec(*dev);
	dev->openConnections();
	EXPECT_EQ(rec.mEvents, QStringList({"ready"}));
	EXPECT_TRUE(dev->isConnected());
	EXPECT_FALSE(dev->isConnecting());
	EXPECT_FALSE(dev->isConnectable());

	processQueuedSignals();
	EXPECT_EQ(rec.count("ready"), 1);
}





TEST_F(DeviceTests, ReadyOnceAfterLastConnectionInAnyOrder)
{
	std::vector<int> order = {0, 1, 2};
	do
	{
		auto dev = makeDevice();
		std::vector<TestConnectionPtr> conns =
		{
			makeConnection("webOS TV", "uuid-1"),
			makeConnection("DIAL", "uuid-2"),
			makeConnection("SSAP", "uuid-3"),
		};
		for (const auto & conn: conns)
		{
			dev->addConnection(conn);
		}
		DeviceRecorder rec(*dev);
		dev->openConnections();
		EXPECT_TRUE(dev->isConnecting());

		for (size_t i = 0; i < order.size(); ++i)
		{
			EXPECT_EQ(rec.count("ready"), 0);
			conns[static_cast<size_t>(order[i])]->reportConnected();
			processQueuedSignals();
		}
		EXPECT_EQ(rec.mEvents, QStringList({"ready"}));
		EXPECT_TRUE(dev->isConnected());
		EXPECT_FALSE(dev->isConnecting());
		EXPECT_EQ(dev->connectedServiceNames().size(), 3);
		for (const auto & conn: conns)
		{
			EXPECT_EQ(conn->numOpens(), 1);
		}
	} while (std::next_permutation(order.begin(), order.end()));
}





TEST_F(DeviceTests, ReportsFailuresBeforeReady)
{
	auto dev = makeDevice();
	auto ok = makeConnection("webOS TV", "uuid-1");
	auto failing = makeConnection("DIAL", "uuid-2");
	auto dropping = makeConnection("SSAP", "uuid-3");
	dev->addConnection(ok);
	dev->addConnection(failing);
	dev->addConnection(dropping);
	DeviceRecorder rec(*dev);
	dev->openConnections();

	failing->reportFailed(Connection::ecNetworkUnreachable, "No route to host");
	processQueuedSignals();
	dropping->reportDisconnected(Connection::ecProtocolError, "Unexpected reply");
	processQueuedSignals();
	EXPECT_EQ(rec.count("ready"), 0);
	ok->reportConnected();
	processQueuedSignals();

	EXPECT_EQ(rec.mEvents, QStringList({"connectionFailed", "ready"}));
	ASSERT_EQ(rec.mFailures.size(), 2u);
	EXPECT_EQ(rec.mFailures[0].mServiceName, "DIAL");
	EXPECT_EQ(rec.mFailures[0].mErrorCode, Connection::ecNetworkUnreachable);
	EXPECT_EQ(rec.mFailures[1].mServiceName, "SSAP");
	EXPECT_EQ(rec.mFailures[1].mErrorCode, Connection::ecProtocolError);
	EXPECT_TRUE(dev->isConnected());
	EXPECT_EQ(dev->connectedServiceNames(), QStringList({"webOS TV"}));
}





TEST_F(DeviceTests, ReadyEvenIfAllFail)
{
	auto dev = makeDevice();
	auto conn = makeConnection("webOS TV", "uuid-1");
	dev->addConnection(conn);
	DeviceRecorder rec(*dev);
	dev->openConnections();
	conn->reportFailed(Connection::ecTimeout, "Timed out");
	processQueuedSignals();
	EXPECT_EQ(rec.mEvents, QStringList({"connectionFailed", "ready"}));
	EXPECT_FALSE(dev->isConnected());
}





TEST_F(DeviceTests, EqualPriorityPicksFirstAdded)
{
	auto dev = makeDevice();
	auto first = makeConnection("webOS TV", "uuid-1");
	auto second = makeConnection("DIAL", "uuid-2");
	first->addCapability(VolumeControl::Set);
	second->addCapability(VolumeControl::Set);
	dev->addConnection(first);
	dev->addConnection(second);

	EXPECT_EQ(dev->bestConnectionFor(VolumeControl::Set), first);
	EXPECT_EQ(dev->bestConnectionFor(Capability::ciVolumeControl), first);
	EXPECT_EQ(dev->volumeControl(), static_cast<VolumeControl *>(first.get()));
}





TEST_F(DeviceTests, HigherPriorityWinsRegardlessOfOrder)
{
	for (int highIdx = 0; highIdx < 2; ++highIdx)
	{
		auto dev = makeDevice();
		std::vector<TestConnectionPtr> conns =
		{
			makeConnection("webOS TV", "uuid-1"),
			makeConnection("DIAL", "uuid-2"),
		};
		for (const auto & conn: conns)
		{
			conn->addCapability(VolumeControl::Set);
			dev->addConnection(conn);
		}
		conns[static_cast<size_t>(highIdx)]->setPriority(Capability::ciVolumeControl, Capability::plHigh);
		EXPECT_EQ(dev->bestConnectionFor(VolumeControl::Set), conns[static_cast<size_t>(highIdx)]);
		EXPECT_EQ(dev->volumeControl(), static_cast<VolumeControl *>(conns[static_cast<size_t>(highIdx)].get()));
	}
}





TEST_F(DeviceTests, ResolutionRequiresAdvertisedCapability)
{
	auto dev = makeDevice();
	auto silent = makeConnection("webOS TV", "uuid-1");
	auto advertising = makeConnection("DIAL", "uuid-2");
	advertising->addCapability(VolumeControl::Get);
	dev->addConnection(silent);
	dev->addConnection(advertising);

	// Implements VolumeControl, but doesn't advertise it:
	silent->setPriority(Capability::ciVolumeControl, Capability::plVeryHigh);
	EXPECT_EQ(dev->bestConnectionFor(Capability::ciVolumeControl), advertising);

	// Advertises, but doesn't implement:
	advertising->setImplementsVolumeControl(false);
	EXPECT_EQ(dev->bestConnectionFor(Capability::ciVolumeControl), nullptr);
	EXPECT_EQ(dev->volumeControl(), nullptr);
	EXPECT_EQ(dev->bestConnectionFor(VolumeControl::Get), advertising);

	EXPECT_EQ(dev->bestConnectionFor(Launcher::App), nullptr);
	EXPECT_EQ(dev->launcher(), nullptr);
	EXPECT_EQ(dev->bestConnectionFor(Capability::ciUnknown), nullptr);
}





TEST_F(DeviceTests, ResolvedInterfaceIsUsable)
{
	auto dev = makeDevice();
	auto conn = makeConnection("webOS TV", "uuid-1");
	conn->addCapabilities(VolumeControl::allCapabilities());
	dev->addConnection(conn);

	auto volume = dev->volumeControl();
	ASSERT_NE(volume, nullptr);
	bool hasSucceeded = false;
	volume->setVolume(0.8f,
		[&hasSucceeded]()
		{
			hasSucceeded = true;
		},
		[](const QString & aErrorMessage)
		{
			FAIL() << aErrorMessage.toStdString();
		}
	);
	EXPECT_TRUE(hasSucceeded);
	EXPECT_FLOAT_EQ(conn->volume(), 0.8f);
}





TEST_F(DeviceTests, MergesCapabilities)
{
	auto dev = makeDevice();
	DeviceRecorder rec(*dev);
	auto first = makeConnection("webOS TV", "uuid-1");
	auto second = makeConnection("DIAL", "uuid-2");
	first->addCapabilities({Launcher::App, VolumeControl::Set});
	second->addCapabilities({Launcher::App, Launcher::YouTube});
	dev->addConnection(first);
	dev->addConnection(second);

	EXPECT_EQ(dev->capabilities(), QStringList({Launcher::App, VolumeControl::Set, Launcher::YouTube}));
	EXPECT_TRUE(dev->hasCapabilities({Launcher::YouTube, "VolumeControl.Any"}));
	EXPECT_FALSE(dev->hasCapability(MediaPlayer::PlayVideo));
	EXPECT_TRUE(dev->hasAnyCapability({MediaPlayer::PlayVideo, Launcher::App}));
	ASSERT_EQ(rec.mCapabilityChanges.size(), 2u);
	EXPECT_EQ(rec.mCapabilityChanges[1].first, QStringList({Launcher::YouTube}));

	// A capability still provided by another connection is not reported as removed:
	second->removeCapabilities({Launcher::App, Launcher::YouTube});
	processQueuedSignals();
	ASSERT_EQ(rec.mCapabilityChanges.size(), 3u);
	EXPECT_TRUE(rec.mCapabilityChanges[2].first.isEmpty());
	EXPECT_EQ(rec.mCapabilityChanges[2].second, QStringList({Launcher::YouTube}));

	// Removing the connection removes its unique capabilities:
	dev->removeConnection("webOS TV");
	ASSERT_EQ(rec.mCapabilityChanges.size(), 4u);
	EXPECT_EQ(rec.mCapabilityChanges[3].second, QStringList({Launcher::App, VolumeControl::Set}));
	EXPECT_TRUE(dev->capabilities().isEmpty());
}





TEST_F(DeviceTests, CloseWhilePairingCancels)
{
	auto dev = makeDevice();
	auto pairing = makeConnection("webOS TV", "uuid-1");
	auto other = makeConnection("DIAL", "uuid-2");
	dev->addConnection(pairing);
	dev->addConnection(other);
	DeviceRecorder rec(*dev);
	dev->openConnections();
	pairing->reportPairingRequired(Connection::ptPinCode);
	processQueuedSignals();
	EXPECT_EQ(rec.mEvents, QStringList({"pairingRequired:webOS TV"}));
	pairing->pair("1234");
	processQueuedSignals();

	dev->closeConnections();
	EXPECT_FALSE(dev->isConnecting());
	processQueuedSignals();
	EXPECT_EQ(rec.count("ready"), 0);
	EXPECT_EQ(rec.count("disconnected"), 1);
	ASSERT_EQ(rec.mDisconnectCodes.size(), 1u);
	EXPECT_EQ(rec.mDisconnectCodes[0], Connection::ecCancelled);
	EXPECT_EQ(pairing->numCloses(), 1);
	EXPECT_EQ(other->numCloses(), 1);
	EXPECT_FALSE(dev->isConnected());

	// Late reports are ignored, the device can connect again:
	pairing->reportPaired();
	processQueuedSignals();
	EXPECT_EQ(rec.count("ready"), 0);
	dev->openConnections();
	EXPECT_TRUE(dev->isConnecting());
	pairing->reportConnected();
	other->reportConnected();
	processQueuedSignals();
	EXPECT_EQ(rec.count("ready"), 1);
	EXPECT_EQ(rec.count("disconnected"), 1);
}





TEST_F(DeviceTests, PairingRetryThroughDevice)
{
	auto dev = makeDevice();
	auto conn = makeConnection("webOS TV", "uuid-1");
	conn->setExpectedPin("0000");
	dev->addConnection(conn);
	DeviceRecorder rec(*dev);
	QObject::connect(dev.get(), &Device::pairingFailed,
		[](Device * aDevice, Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage)
		{
			Q_UNUSED(aDevice);
			Q_UNUSED(aErrorCode);
			Q_UNUSED(aErrorMessage);
			aConnection->pair("0000");
		}
	);
	dev->openConnections();
	conn->reportPairingRequired(Connection::ptPinCode);
	processQueuedSignals();
	conn->pair("9999");
	processQueuedSignals();

	EXPECT_EQ(rec.mEvents, QStringList({"pairingRequired:webOS TV", "pairingFailed:webOS TV", "ready"}));
	EXPECT_EQ(conn->numPairs(), 2);
	EXPECT_TRUE(dev->isConnected());
	EXPECT_TRUE(conn->config().mWasConnected);
}





TEST_F(DeviceTests, DisconnectAfterReady)
{
	auto dev = makeDevice();
	auto conn = makeConnection("webOS TV", "uuid-1");
	conn->setAutoConnect(true);
	dev->addConnection(conn);
	DeviceRecorder rec(*dev);
	dev->openConnections();
	processQueuedSignals();
	ASSERT_TRUE(dev->isConnected());
	EXPECT_GT(dev->lastConnected(), 0);

	conn->reportDisconnected(Connection::ecTimeout, "Keepalive timed out");
	processQueuedSignals();
	EXPECT_EQ(rec.mEvents, QStringList({"ready", "disconnected"}));
	EXPECT_EQ(rec.mDisconnectCodes[0], Connection::ecTimeout);
	EXPECT_FALSE(dev->isConnected());
}





TEST_F(DeviceTests, CloseAfterReady)
{
	auto dev = makeDevice();
	auto conn = makeConnection("webOS TV", "uuid-1");
	conn->setAutoConnect(true);
	dev->addConnection(conn);
	DeviceRecorder rec(*dev);
	dev->openConnections();
	processQueuedSignals();

	dev->closeConnections();
	processQueuedSignals();
	EXPECT_EQ(rec.mEvents, QStringList({"ready", "disconnected"}));
	EXPECT_EQ(rec.mDisconnectCodes[0], Connection::ecNone);
	EXPECT_EQ(conn->state(), Connection::csDisconnected);

	// Closing an inactive device reports nothing:
	dev->closeConnections();
	processQueuedSignals();
	EXPECT_EQ(rec.count("disconnected"), 1);
}





TEST_F(DeviceTests, QueuedReadyFromClosedAttemptIsIgnored)
{
	auto dev = makeDevice();
	auto conn = makeConnection("webOS TV", "uuid-1");
	dev->addConnection(conn);
	DeviceRecorder rec(*dev);
	dev->openConnections();
	conn->reportConnected();
	EXPECT_EQ(conn->state(), Connection::csReady);

	// Close and re-open before the ready report gets delivered:
	dev->closeConnections();
	EXPECT_EQ(conn->state(), Connection::csDisconnected);
	dev->openConnections();
	EXPECT_EQ(conn->state(), Connection::csConnecting);
	processQueuedSignals();
	EXPECT_EQ(rec.count("ready"), 0);
	EXPECT_FALSE(dev->isConnected());
	EXPECT_TRUE(dev->isConnecting());

	// The new attempt's own report releases the barrier:
	conn->reportConnected();
	processQueuedSignals();
	EXPECT_EQ(rec.count("ready"), 1);
	EXPECT_TRUE(dev->isConnected());
	EXPECT_FALSE(dev->isConnecting());
}





TEST_F(DeviceTests, RemovingPendingConnectionReleasesBarrier)
{
	auto dev = makeDevice();
	auto ok = makeConnection("webOS TV", "uuid-1");
	auto stuck = makeConnection("DIAL", "uuid-2");
	dev->addConnection(ok);
	dev->addConnection(stuck);
	DeviceRecorder rec(*dev);
	dev->openConnections();
	ok->reportConnected();
	processQueuedSignals();
	EXPECT_EQ(rec.count("ready"), 0);

	auto removed = dev->removeConnection("DIAL");
	EXPECT_EQ(removed, stuck);
	EXPECT_EQ(rec.mEvents, QStringList({"ready"}));

	// Reports from the removed connection no longer reach the device:
	stuck->reportFailed(Connection::ecTimeout, "Timed out");
	processQueuedSignals();
	EXPECT_EQ(rec.mEvents, QStringList({"ready"}));
	EXPECT_EQ(dev->removeConnection("DIAL"), nullptr);
}





TEST_F(DeviceTests, PairingLevelOffFailsPairing)
{
	auto dev = makeDevice();
	dev->setPairingLevel(Device::plOff);
	auto conn = makeConnection("webOS TV", "uuid-1");
	dev->addConnection(conn);
	EXPECT_FALSE(conn->isPairingEnabled());
	DeviceRecorder rec(*dev);
	dev->openConnections();
	conn->reportPairingRequired(Connection::ptOther);
	processQueuedSignals();

	EXPECT_EQ(rec.mEvents, QStringList({"connectionFailed", "ready"}));
	ASSERT_EQ(rec.mFailures.size(), 1u);
	EXPECT_EQ(rec.mFailures[0].mErrorCode, Connection::ecPairingRequired);

	dev->setPairingLevel(Device::plOn);
	EXPECT_TRUE(conn->isPairingEnabled());
}
