#include "DeviceMgr.hpp"
#include <algorithm>
#include <QMutexLocker>
#include "Comm/ConnectionFactory.hpp"
#include "DB/DeviceStore.hpp"





DeviceMgr::DeviceMgr(ComponentCollection & aComponents):
	ComponentSuper(aComponents),
	mLogger(aComponents.logger("DeviceMgr"))
{
	requireForStart(ComponentCollection::ckMultiLogger);
	requireForStart(ComponentCollection::ckConnectionFactory);
	requireForStart(ComponentCollection::ckDeviceStore);
}





void DeviceMgr::start()
{
	mLogger.log("Started.");
}





DevicePtr DeviceMgr::serviceDiscovered(const QString & aClassName, const ServiceDescription & aDescription)
{
	auto factory = mComponents.get<ConnectionFactory>();
	if (!factory->hasClass(aClassName))
	{
		mLogger.log("Ignoring service %1 at %2, class %3 is not registered.",
			aDescription.mServiceID, aDescription.mAddress, aClassName
		);
		return nullptr;
	}
	auto key = deviceKey(aDescription);
	if (key.isEmpty())
	{
		mLogger.log("Ignoring service %1, it has neither an address nor an UUID.", aDescription.mServiceID);
		return nullptr;
	}

	// Find or create the device:
	auto dev = deviceAt(key);
	bool isNewDevice = (dev == nullptr);
	if (isNewDevice)
	{
		mLogger.log("Creating a new device at %1 for service %2.", key, aDescription.mServiceID);
		dev = std::make_shared<Device>(mComponents.logger(QString("Device-%1").arg(key)), key);
		connect(dev.get(), &Device::ready,         this, &DeviceMgr::deviceReady);
		connect(dev.get(), &Device::configUpdated, this, &DeviceMgr::deviceConfigUpdated);
	}
	dev->setLastDetection(aDescription.mLastDetection);

	// Re-discovery of a known service only updates its description:
	auto existing = dev->serviceWithName(aDescription.mServiceID);
	if (existing != nullptr)
	{
		mLogger.log("Service %1 at %2 re-discovered.", aDescription.mServiceID, key);
		existing->updateDescription(aDescription);
		return dev;
	}

	// Restore the stored config (pairing credentials), if any:
	auto config = mComponents.get<DeviceStore>()->lookupServiceConfig(aDescription.mUuid);
	if (config.mUuid.isEmpty())
	{
		config.mUuid = aDescription.mUuid;
	}
	else
	{
		mLogger.log("Restored the stored config for service %1 (%2).", aDescription.mServiceID, aDescription.mUuid);
	}
	config.mLastDetection = std::max(config.mLastDetection, aDescription.mLastDetection);

	auto conn = factory->create(aClassName, dev->logger().logger(), aDescription, config);
	if (conn == nullptr)
	{
		mLogger.log("Failed to create a %1 connection for %2.", aClassName, key);
		return isNewDevice ? nullptr : dev;
	}
	dev->addConnection(conn);
	if (isNewDevice)
	{
		addDevice(dev);
	}
	return dev;
}





void DeviceMgr::serviceLost(const ServiceDescription & aDescription)
{
	auto dev = deviceAt(deviceKey(aDescription));
	if (dev == nullptr)
	{
		mLogger.log("Lost service %1 at %2, but there's no such device.", aDescription.mServiceID, aDescription.mAddress);
		return;
	}
	auto conn = dev->removeConnection(aDescription.mServiceID);
	if (conn == nullptr)
	{
		mLogger.log("Lost service %1 at %2, but the device has no such service.", aDescription.mServiceID, aDescription.mAddress);
		return;
	}
	mLogger.log("Lost service %1 at %2.", aDescription.mServiceID, aDescription.mAddress);
	conn->closeConnection();
	if (!dev->hasServices())
	{
		delDevice(dev);
	}
}





void DeviceMgr::addDevice(DevicePtr aDevice)
{
	auto key = aDevice->address();
	QMutexLocker lock(&mMtx);
	auto itr = mDevices.find(key);
	if (itr != mDevices.end())
	{
		throw DeviceAlreadyPresentError(mLogger, "Device %1 already present", key);
	}
	mDevices[key] = aDevice;
	lock.unlock();
	emit deviceAdded(aDevice);
}





void DeviceMgr::delDevice(DevicePtr aDevice)
{
	QMutexLocker lock(&mMtx);
	auto itr = mDevices.find(aDevice->address());
	if ((itr == mDevices.end()) || (itr->second != aDevice))
	{
		return;
	}
	mDevices.erase(itr);
	lock.unlock();
	mLogger.log("Removed device %1.", aDevice->address());
	emit deviceRemoved(aDevice);
}





DevicePtr DeviceMgr::deviceAt(const QString & aAddress) const
{
	QMutexLocker lock(&mMtx);
	auto itr = mDevices.find(aAddress);
	if (itr == mDevices.end())
	{
		return nullptr;
	}
	return itr->second;
}





std::vector<DevicePtr> DeviceMgr::devices() const
{
	std::vector<DevicePtr> res;
	QMutexLocker lock(&mMtx);
	for (const auto & dev: mDevices)
	{
		res.push_back(dev.second);
	}
	return res;
}





QString DeviceMgr::deviceKey(const ServiceDescription & aDescription)
{
	return aDescription.mAddress.isEmpty() ? aDescription.mUuid : aDescription.mAddress;
}





void DeviceMgr::storeDevice(Device & aDevice)
{
	try
	{
		mComponents.get<DeviceStore>()->updateDevice(aDevice);
	}
	catch (const RuntimeError & exc)
	{
		// Already logged into the DeviceStore log, the live device stays usable:
		mLogger.log("Failed to store device %1: %2", aDevice.address(), exc.message());
	}
}





void DeviceMgr::deviceReady(Device * aDevice)
{
	mLogger.log("Device %1 is ready, connected services: %2.", aDevice->address(), aDevice->connectedServiceNames());
	storeDevice(*aDevice);
}





void DeviceMgr::deviceConfigUpdated(Device * aDevice, Connection * aConnection)
{
	if (!aConnection->config().mWasConnected)
	{
		return;
	}
	storeDevice(*aDevice);
}
