#pragma once

#include <memory>
#include <set>
#include <vector>
#include <QObject>
#include <QMutex>
#include "Comm/Connection.hpp"





// fwd:
class Device;
using DevicePtr = std::shared_ptr<Device>;





/** A single physical endpoint (TV, streaming box), aggregating all the Connections through which it is reachable.
The Device holds at most one Connection per protocol (ServiceID), in the order in which they were added.
The capabilities of all the Connections are merged; a capability request is resolved to the single best
Connection at call time (highest priority, the earliest added one on a tie).

openConnections() fans out to all connectable Connections and waits until each of them settles
(Ready, Failed or Disconnected), then emits exactly one ready() signal, preceded by connectionFailed() if
any of them didn't make it to Ready. The Connections' signals are delivered to the Device through queued
connections, so all of the aggregation runs serialized in the Device's thread, regardless of which thread
the protocols report from. */
class Device:
	public QObject,
	public std::enable_shared_from_this<Device>
{
	using Super = QObject;
	Q_OBJECT


public:

	/** Whether the Connections are allowed to ask the user for pairing. */
	enum PairingLevel
	{
		plOff,  ///< Connections requiring pairing fail with Connection::ecPairingRequired
		plOn,   ///< Connections may request pairing (default)
	};
	Q_ENUM(PairingLevel)


	/** A single Connection that didn't reach Ready during openConnections(). */
	struct Failure
	{
		QString mServiceName;
		Connection::ErrorCode mErrorCode;
		QString mErrorMessage;
	};

	using Failures = std::vector<Failure>;


	/** Creates a new empty device at the specified address. */
	explicit Device(Logger & aLogger, const QString & aAddress = QString(), QObject * aParent = nullptr);

	virtual ~Device() override;

	/** Adds the specified Connection and starts relaying its signals.
	Returns false, without any change, if a Connection for the same protocol (serviceName) is already present.
	The identity values that are still unset are filled in from the Connection's description. */
	bool addConnection(ConnectionPtr aConnection);

	/** Removes the Connection for the specified protocol and stops relaying its signals.
	Returns the removed Connection, or nullptr if there was none.
	A pending openConnections() no longer waits for the removed Connection. */
	ConnectionPtr removeConnection(const QString & aServiceName);

	/** Returns the Connection for the specified protocol, or nullptr if not present. */
	ConnectionPtr serviceWithName(const QString & aServiceName) const;

	/** Returns all the Connections, in the order in which they were added. */
	std::vector<ConnectionPtr> services() const;

	/** Returns true if the device has at least one Connection. */
	bool hasServices() const;

	/** Returns the union of the capabilities of all the Connections, without duplicates. */
	QStringList capabilities() const;

	bool hasCapability(const QString & aQuery) const;
	bool hasCapabilities(const QStringList & aQueries) const;
	bool hasAnyCapability(const QStringList & aQueries) const;

	/** Returns the Connection that wins the resolution for the specified capability, or nullptr if none matches.
	Only Connections advertising a matching capability are considered; the highest priority() wins,
	on a tie the earliest added Connection wins. */
	ConnectionPtr bestConnectionFor(const QString & aCapability) const;

	/** Returns the Connection that wins the resolution for the specified capability interface, or nullptr.
	Only Connections that advertise a capability of the interface and implement it are considered. */
	ConnectionPtr bestConnectionFor(Capability::Interface aInterface) const;

	// Capability interfaces of the resolved Connection, nullptr if no Connection implements the interface.
	// The returned pointers are valid as long as the Connection stays in this Device.
	Launcher * launcher();
	MediaPlayer * mediaPlayer();
	MediaControl * mediaControl();
	VolumeControl * volumeControl();
	TVControl * tvControl();
	KeyControl * keyControl();
	TextInputControl * textInputControl();
	MouseControl * mouseControl();
	PowerControl * powerControl();
	ToastControl * toastControl();
	WebAppLauncher * webAppLauncher();
	ExternalInputControl * externalInputControl();

	/** Connects all the connectable Connections.
	Emits ready() once all of them have settled; with no connectable Connections, ready() is emitted
	before this function returns. Ignored while a previous openConnections() is still pending. */
	void openConnections();

	/** Closes all the Connections, cancelling a pending openConnections() (no ready() is emitted for it).
	Once all the Connections report back, disconnected() is emitted if the device was connected or connecting. */
	void closeConnections();

	/** Returns true if at least one of the Connections needs an explicit connection step. */
	bool isConnectable() const;

	/** Returns true if the device has completed openConnections() with at least one usable Connection,
	and hasn't been disconnected since. */
	bool isConnected() const;

	/** Returns true while openConnections() is waiting for its Connections. */
	bool isConnecting() const;

	/** Returns the names of the Connections that are currently Ready. */
	QStringList connectedServiceNames() const;

	// Identity and bookkeeping getters:
	QString address() const;
	QString friendlyName() const;
	QString modelName() const;
	QString modelNumber() const;
	QString lastKnownIPAddress() const;
	QString lastSeenOnWifi() const;
	double lastConnected() const;
	double lastDetection() const;
	PairingLevel pairingLevel() const;

	/** Sets the friendly name, overriding the one reported by the Connections. */
	void setFriendlyName(const QString & aFriendlyName);

	/** Updates the last known IP address; empty addresses are ignored. */
	void setLastKnownIPAddress(const QString & aAddress);

	/** Updates the name of the Wi-Fi network on which the device was last seen; empty names are ignored. */
	void setLastSeenOnWifi(const QString & aWifiName);

	// Timestamp updates, never moving the value back in time:
	void setLastConnected(double aTimestamp);
	void setLastDetection(double aTimestamp);

	/** Sets the pairing level and propagates it to all the Connections. */
	void setPairingLevel(PairingLevel aPairingLevel);

	/** Returns the logger used for this device. */
	PrefixLogger & logger() { return mLogger; }


protected:

	/** The logger used for all messages produced by this class. */
	PrefixLogger mLogger;

	/** Protects the member variables below against multithreaded access.
	The barrier state (mPending, mFailures, ...) is only touched in the Device's thread and needs no locking. */
	mutable QMutex mMtx;

	/** The Connections, in the order in which they were added. Protected by mMtx. */
	std::vector<ConnectionPtr> mServices;

	// Identity and bookkeeping, protected by mMtx:
	QString mAddress;
	QString mFriendlyName;
	QString mModelName;
	QString mModelNumber;
	QString mLastKnownIPAddress;
	QString mLastSeenOnWifi;
	double mLastConnected;
	double mLastDetection;
	PairingLevel mPairingLevel;

	/** True between openConnections() and the emission of ready(). */
	bool mIsBarrierPending;

	/** The Connections that openConnections() is still waiting for. */
	std::set<Connection *> mPending;

	/** The Connections that failed during the pending openConnections(). */
	Failures mFailures;

	/** The connectable Connections that have reported ready and haven't disconnected since. */
	std::set<Connection *> mConnectedServices;

	/** True once ready() has been emitted with at least one usable Connection, until disconnected(). */
	bool mIsConnected;

	/** True while closeConnections() waits for the Connections to report their disconnects. */
	bool mIsClosing;

	/** The error code with which the disconnected() signal is emitted once closing finishes. */
	Connection::ErrorCode mCloseErrorCode;

	/** The Connections whose disconnected() signal closeConnections() is waiting for. */
	std::set<Connection *> mAwaitingDisconnect;


	/** Returns the member Connection for the specified raw pointer, or nullptr if it's no longer a member.
	Used by the slots, since a queued signal may arrive after the Connection has been removed. */
	ConnectionPtr findService(Connection * aConnection) const;

	/** Emits the ready() signal (preceded by connectionFailed()) if the barrier is pending and complete. */
	void checkBarrier();

	/** Stops waiting for the specified Connection in the barrier; unless aIsSuccess, records the failure. */
	void settle(const ConnectionPtr & aConnection, bool aIsSuccess, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);

	/** Finishes closeConnections() once all the awaited disconnects have arrived. */
	void finishClosing();

	/** Emits capabilitiesUpdated() for the specified changes, filtered to the changes of the merged capability set.
	aChangedConnection is the Connection whose capabilities were changed; it has already been updated. */
	void relayCapabilityChanges(Connection * aChangedConnection, const QStringList & aAdded, const QStringList & aRemoved);


protected slots:

	// Handlers for the Connections' signals, all connected through queued connections:
	void connStateChanged(Connection * aConnection, Connection::State aNewState);
	void connPairingRequired(Connection * aConnection, Connection::PairingType aPairingType, const QVariant & aPairingData);
	void connPairingFailed(Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);
	void connReady(Connection * aConnection);
	void connFailed(Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);
	void connDisconnected(Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);
	void connCapabilitiesUpdated(Connection * aConnection, const QStringList & aAdded, const QStringList & aRemoved);
	void connConfigUpdated(Connection * aConnection);


signals:

	/** Emitted exactly once per openConnections(), after all the connectable Connections have settled. */
	void ready(Device * aDevice);

	/** Emitted right before ready() if some of the Connections didn't reach Ready. */
	void connectionFailed(Device * aDevice, const Device::Failures & aFailures);

	/** A Connection needs pairing data; answer by calling aConnection->pair(). */
	void pairingRequired(Device * aDevice, Connection * aConnection, Connection::PairingType aPairingType, const QVariant & aPairingData);

	/** A Connection's pairing attempt failed; pairing may be retried. */
	void pairingFailed(Device * aDevice, Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);

	/** The device is no longer connected (all of its Connections have disconnected). */
	void disconnected(Device * aDevice, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);

	/** The merged capability set has changed. */
	void capabilitiesUpdated(Device * aDevice, const QStringList & aAdded, const QStringList & aRemoved);

	/** A Connection's state has changed. */
	void serviceStateChanged(Device * aDevice, Connection * aConnection, Connection::State aNewState);

	/** A Connection's connection attempt has failed. */
	void serviceFailed(Device * aDevice, Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);

	/** A Connection has disconnected. */
	void serviceDisconnected(Device * aDevice, Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);

	/** A Connection's persisted config has changed (credentials, connection flags). */
	void configUpdated(Device * aDevice, Connection * aConnection);
};

Q_DECLARE_METATYPE(DevicePtr);
Q_DECLARE_METATYPE(Device::Failures);
