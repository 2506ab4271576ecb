#pragma once

#include <map>
#include <QObject>
#include <QMutex>
#include "ComponentCollection.hpp"
#include "Device.hpp"
#include "Comm/Connection.hpp"





/** Manages all the devices currently known to the app (the live registry), keyed by their address.
The discovery layer reports the services it sees through serviceDiscovered() / serviceLost(); the DeviceMgr
groups them into Devices, creates the Connections through the ConnectionFactory (restoring their stored
config from the DeviceStore) and stores each Device into the DeviceStore once it gets connected. */
class DeviceMgr:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckDeviceMgr>
{
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckDeviceMgr>;
	Q_OBJECT


public:

	class DeviceAlreadyPresentError: public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	explicit DeviceMgr(ComponentCollection & aComponents);

	// ComponentCollection::ComponentBase overrides:
	virtual void start() override;

	/** Notification from the discovery layer, a service of the specified Connection class has been seen.
	Either adds a new Connection to the Device at the service's address (creating the Device if needed),
	or updates the description of the already present Connection.
	Returns the Device, or nullptr if the class is not registered in the ConnectionFactory. */
	DevicePtr serviceDiscovered(const QString & aClassName, const ServiceDescription & aDescription);

	/** Notification from the discovery layer, the service is no longer available.
	Removes (and closes) the Connection; the Device is removed once it has no Connections left. */
	void serviceLost(const ServiceDescription & aDescription);

	/** Adds the specified device to the internal storage.
	Throws a DeviceAlreadyPresentError if a device with the same address already exists. */
	void addDevice(DevicePtr aDevice);

	/** Removes the specified device from the internal storage.
	Ignored if the device is not in the storage. */
	void delDevice(DevicePtr aDevice);

	/** Returns the device at the specified address, or nullptr if there's none. */
	DevicePtr deviceAt(const QString & aAddress) const;

	/** Returns all the devices currently known. */
	std::vector<DevicePtr> devices() const;


protected:

	/** The logger used for all messages produced by this class. */
	Logger & mLogger;

	/** All the devices, indexed by their address.
	Protected against multithreaded access by mMtx. */
	std::map<QString, DevicePtr> mDevices;

	/** Protects mDevices against multithreaded access. */
	mutable QMutex mMtx;


	/** Returns the key under which the device of the specified service is stored. */
	static QString deviceKey(const ServiceDescription & aDescription);

	/** Stores the device into the DeviceStore, logging any failure. */
	void storeDevice(Device & aDevice);


Q_SIGNALS:

	/** Emitted after a new device is added to the internal storage. */
	void deviceAdded(DevicePtr aDevice);

	/** Emitted after a device was removed from the internal storage. */
	void deviceRemoved(DevicePtr aDevice);


protected Q_SLOTS:

	/** A device has finished openConnections(), stores it into the DeviceStore. */
	void deviceReady(Device * aDevice);

	/** A device's Connection has changed its config (such as new pairing credentials), re-stores the device. */
	void deviceConfigUpdated(Device * aDevice, Connection * aConnection);
};
