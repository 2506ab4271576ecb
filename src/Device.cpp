#include "Device.hpp"
#include <algorithm>
#include <QMutexLocker>
#include "Exception.hpp"
#include "Utils.hpp"





/** Registers the types used in the queued connections between the Connections and the Device. */
static void registerMetaTypes()
{
	qRegisterMetaType<Connection *>("Connection *");
	qRegisterMetaType<Connection::State>("Connection::State");
	qRegisterMetaType<Connection::ErrorCode>("Connection::ErrorCode");
	qRegisterMetaType<Connection::PairingType>("Connection::PairingType");
	qRegisterMetaType<Device::Failures>("Device::Failures");
}





Device::Device(Logger & aLogger, const QString & aAddress, QObject * aParent):
	Super(aParent),
	mLogger(aLogger, QString("Device %1: ").arg(aAddress)),
	mAddress(aAddress),
	mLastKnownIPAddress(aAddress),
	mLastConnected(0),
	mLastDetection(0),
	mPairingLevel(plOn),
	mIsBarrierPending(false),
	mIsConnected(false),
	mIsClosing(false),
	mCloseErrorCode(Connection::ecNone)
{
	registerMetaTypes();
	mLogger.log("Created.");
}





Device::~Device()
{
	for (const auto & svc: services())
	{
		QObject::disconnect(svc.get(), nullptr, this, nullptr);
	}
	mLogger.log("Destroyed.");
}





bool Device::addConnection(ConnectionPtr aConnection)
{
	if (aConnection == nullptr)
	{
		throw LogicError("Cannot add a null connection to device %1", address());
	}

	auto serviceName = aConnection->serviceName();
	auto desc = aConnection->description();
	auto newCaps = aConnection->capabilities();
	QStringList addedCaps;
	bool isPairingEnabled;
	size_t numServices;
	{
		QMutexLocker lock(&mMtx);
		QStringList existingCaps;
		for (const auto & svc: mServices)
		{
			if (svc->serviceName() == serviceName)
			{
				lock.unlock();
				mLogger.log("Already has a %1 connection, ignoring the new one.", serviceName);
				return false;
			}
			existingCaps.append(svc->capabilities());
		}
		for (const auto & cap: newCaps)
		{
			if (!existingCaps.contains(cap) && !addedCaps.contains(cap))
			{
				addedCaps.append(cap);
			}
		}
		mServices.push_back(aConnection);
		numServices = mServices.size();

		// Fill in the identity from the first connection that knows it:
		if (mAddress.isEmpty())
		{
			mAddress = desc.mAddress;
		}
		if (mLastKnownIPAddress.isEmpty())
		{
			mLastKnownIPAddress = desc.mAddress;
		}
		if (mFriendlyName.isEmpty())
		{
			mFriendlyName = desc.mFriendlyName;
		}
		if (mModelName.isEmpty())
		{
			mModelName = desc.mModelName;
		}
		if (mModelNumber.isEmpty())
		{
			mModelNumber = desc.mModelNumber;
		}
		mLastDetection = std::max(mLastDetection, desc.mLastDetection);
		isPairingEnabled = (mPairingLevel == plOn);
	}

	aConnection->setPairingEnabled(isPairingEnabled);
	auto conn = aConnection.get();
	connect(conn, &Connection::stateChanged,        this, &Device::connStateChanged,        Qt::QueuedConnection);
	connect(conn, &Connection::pairingRequired,     this, &Device::connPairingRequired,     Qt::QueuedConnection);
	connect(conn, &Connection::pairingFailed,       this, &Device::connPairingFailed,       Qt::QueuedConnection);
	connect(conn, &Connection::ready,               this, &Device::connReady,               Qt::QueuedConnection);
	connect(conn, &Connection::failed,              this, &Device::connFailed,              Qt::QueuedConnection);
	connect(conn, &Connection::disconnected,        this, &Device::connDisconnected,        Qt::QueuedConnection);
	connect(conn, &Connection::capabilitiesUpdated, this, &Device::connCapabilitiesUpdated, Qt::QueuedConnection);
	connect(conn, &Connection::configUpdated,       this, &Device::connConfigUpdated,       Qt::QueuedConnection);

	mLogger.log("Added a %1 connection (%2), %3 connections total.", serviceName, aConnection->className(), numServices);
	if (!addedCaps.isEmpty())
	{
		emit capabilitiesUpdated(this, addedCaps, QStringList());
	}
	return true;
}





ConnectionPtr Device::removeConnection(const QString & aServiceName)
{
	ConnectionPtr res;
	QStringList removedCaps;
	{
		QMutexLocker lock(&mMtx);
		auto itr = std::find_if(mServices.begin(), mServices.end(),
			[&aServiceName](const ConnectionPtr & aService)
			{
				return (aService->serviceName() == aServiceName);
			}
		);
		if (itr == mServices.end())
		{
			return nullptr;
		}
		res = *itr;
		mServices.erase(itr);
		QStringList remainingCaps;
		for (const auto & svc: mServices)
		{
			remainingCaps.append(svc->capabilities());
		}
		for (const auto & cap: res->capabilities())
		{
			if (!remainingCaps.contains(cap) && !removedCaps.contains(cap))
			{
				removedCaps.append(cap);
			}
		}
	}

	auto conn = res.get();
	QObject::disconnect(conn, nullptr, this, nullptr);
	mLogger.log("Removed the %1 connection.", aServiceName);
	if (!removedCaps.isEmpty())
	{
		emit capabilitiesUpdated(this, QStringList(), removedCaps);
	}

	// Update the barrier and the connection tracking so that nothing waits for the removed connection:
	bool wasConnected = (mConnectedServices.erase(conn) > 0);
	if (mPending.erase(conn) > 0)
	{
		checkBarrier();
	}
	if (mIsClosing)
	{
		if ((mAwaitingDisconnect.erase(conn) > 0) && mAwaitingDisconnect.empty())
		{
			finishClosing();
		}
	}
	else if (wasConnected && mIsConnected && mConnectedServices.empty() && !mIsBarrierPending)
	{
		mIsConnected = false;
		emit disconnected(this, Connection::ecNone, tr("The last connected service (%1) was removed").arg(aServiceName));
	}
	return res;
}





ConnectionPtr Device::serviceWithName(const QString & aServiceName) const
{
	QMutexLocker lock(&mMtx);
	for (const auto & svc: mServices)
	{
		if (svc->serviceName() == aServiceName)
		{
			return svc;
		}
	}
	return nullptr;
}





std::vector<ConnectionPtr> Device::services() const
{
	QMutexLocker lock(&mMtx);
	return mServices;
}





bool Device::hasServices() const
{
	QMutexLocker lock(&mMtx);
	return !mServices.empty();
}





QStringList Device::capabilities() const
{
	QStringList res;
	for (const auto & svc: services())
	{
		for (const auto & cap: svc->capabilities())
		{
			if (!res.contains(cap))
			{
				res.append(cap);
			}
		}
	}
	return res;
}





bool Device::hasCapability(const QString & aQuery) const
{
	return Capability::hasCapability(capabilities(), aQuery);
}





bool Device::hasCapabilities(const QStringList & aQueries) const
{
	return Capability::hasAll(capabilities(), aQueries);
}





bool Device::hasAnyCapability(const QStringList & aQueries) const
{
	return Capability::hasAny(capabilities(), aQueries);
}





ConnectionPtr Device::bestConnectionFor(const QString & aCapability) const
{
	ConnectionPtr best;
	int bestPriority = Capability::plNotSupported;
	for (const auto & svc: services())
	{
		if (!svc->hasCapability(aCapability))
		{
			continue;
		}
		// Strictly greater, so that on a tie the earlier added connection stays:
		auto priority = svc->priorityFor(aCapability);
		if ((best == nullptr) || (priority > bestPriority))
		{
			best = svc;
			bestPriority = priority;
		}
	}
	return best;
}





ConnectionPtr Device::bestConnectionFor(Capability::Interface aInterface) const
{
	if (aInterface == Capability::ciUnknown)
	{
		return nullptr;
	}
	auto query = Capability::anyOf(aInterface);
	ConnectionPtr best;
	int bestPriority = Capability::plNotSupported;
	for (const auto & svc: services())
	{
		if (!svc->hasCapability(query) || !svc->implementsInterface(aInterface))
		{
			continue;
		}
		auto priority = svc->priority(aInterface);
		if ((best == nullptr) || (priority > bestPriority))
		{
			best = svc;
			bestPriority = priority;
		}
	}
	return best;
}





Launcher * Device::launcher()
{
	auto conn = bestConnectionFor(Capability::ciLauncher);
	return (conn == nullptr) ? nullptr : conn->launcher();
}





MediaPlayer * Device::mediaPlayer()
{
	auto conn = bestConnectionFor(Capability::ciMediaPlayer);
	return (conn == nullptr) ? nullptr : conn->mediaPlayer();
}





MediaControl * Device::mediaControl()
{
	auto conn = bestConnectionFor(Capability::ciMediaControl);
	return (conn == nullptr) ? nullptr : conn->mediaControl();
}





VolumeControl * Device::volumeControl()
{
	auto conn = bestConnectionFor(Capability::ciVolumeControl);
	return (conn == nullptr) ? nullptr : conn->volumeControl();
}





TVControl * Device::tvControl()
{
	auto conn = bestConnectionFor(Capability::ciTVControl);
	return (conn == nullptr) ? nullptr : conn->tvControl();
}





KeyControl * Device::keyControl()
{
	auto conn = bestConnectionFor(Capability::ciKeyControl);
	return (conn == nullptr) ? nullptr : conn->keyControl();
}





TextInputControl * Device::textInputControl()
{
	auto conn = bestConnectionFor(Capability::ciTextInputControl);
	return (conn == nullptr) ? nullptr : conn->textInputControl();
}





MouseControl * Device::mouseControl()
{
	auto conn = bestConnectionFor(Capability::ciMouseControl);
	return (conn == nullptr) ? nullptr : conn->mouseControl();
}





PowerControl * Device::powerControl()
{
	auto conn = bestConnectionFor(Capability::ciPowerControl);
	return (conn == nullptr) ? nullptr : conn->powerControl();
}





ToastControl * Device::toastControl()
{
	auto conn = bestConnectionFor(Capability::ciToastControl);
	return (conn == nullptr) ? nullptr : conn->toastControl();
}





WebAppLauncher * Device::webAppLauncher()
{
	auto conn = bestConnectionFor(Capability::ciWebAppLauncher);
	return (conn == nullptr) ? nullptr : conn->webAppLauncher();
}





ExternalInputControl * Device::externalInputControl()
{
	auto conn = bestConnectionFor(Capability::ciExternalInputControl);
	return (conn == nullptr) ? nullptr : conn->externalInputControl();
}





void Device::openConnections()
{
	if (mIsBarrierPending)
	{
		mLogger.log("openConnections() ignored, still waiting for %1 connections.", mPending.size());
		return;
	}
	if (mIsClosing)
	{
		// The new attempt supersedes the close, its disconnects are no longer reported at the device level:
		mLogger.log("Re-opening before all the connections reported their disconnect.");
		mIsClosing = false;
		mAwaitingDisconnect.clear();
	}

	// Collect the connections to wait for; those already Ready need no waiting:
	auto svcs = services();
	std::set<Connection *> pending;
	for (const auto & svc: svcs)
	{
		if (!svc->isConnectable())
		{
			continue;
		}
		if (svc->state() == Connection::csReady)
		{
			mConnectedServices.insert(svc.get());
			continue;
		}
		pending.insert(svc.get());
	}
	mFailures.clear();

	if (pending.empty())
	{
		mLogger.log("No connection to wait for, the device is ready.");
		mIsConnected = true;
		emit ready(this);
		return;
	}

	mLogger.log("Opening %1 connections.", pending.size());
	mPending = pending;
	mIsBarrierPending = true;
	for (const auto & svc: svcs)
	{
		if (pending.find(svc.get()) != pending.end())
		{
			// Connections already in progress ignore this and report their outcome when done:
			svc->openConnection();
		}
	}
}





void Device::closeConnections()
{
	bool wasActive = (mIsConnected || mIsBarrierPending);
	mCloseErrorCode = mIsBarrierPending ? Connection::ecCancelled : Connection::ecNone;
	if (mIsBarrierPending)
	{
		mLogger.log("Cancelling the pending openConnections(), %1 connections still pending.", mPending.size());
		mIsBarrierPending = false;
		mPending.clear();
		mFailures.clear();
	}

	mAwaitingDisconnect.clear();
	for (const auto & svc: services())
	{
		if (svc->closeConnection())
		{
			mAwaitingDisconnect.insert(svc.get());
		}
	}

	if (!wasActive)
	{
		mLogger.log("Closed the connections of an inactive device.");
		mAwaitingDisconnect.clear();
		return;
	}
	mLogger.log("Closing, waiting for %1 disconnects.", mAwaitingDisconnect.size());
	mIsClosing = true;
	if (mAwaitingDisconnect.empty())
	{
		finishClosing();
	}
}





bool Device::isConnectable() const
{
	for (const auto & svc: services())
	{
		if (svc->isConnectable())
		{
			return true;
		}
	}
	return false;
}





bool Device::isConnected() const
{
	return mIsConnected;
}





bool Device::isConnecting() const
{
	return mIsBarrierPending;
}





QStringList Device::connectedServiceNames() const
{
	QStringList res;
	for (const auto & svc: services())
	{
		if (svc->isConnectable() && (svc->state() == Connection::csReady))
		{
			res.append(svc->serviceName());
		}
	}
	return res;
}





QString Device::address() const
{
	QMutexLocker lock(&mMtx);
	return mAddress;
}





QString Device::friendlyName() const
{
	QMutexLocker lock(&mMtx);
	return mFriendlyName;
}





QString Device::modelName() const
{
	QMutexLocker lock(&mMtx);
	return mModelName;
}





QString Device::modelNumber() const
{
	QMutexLocker lock(&mMtx);
	return mModelNumber;
}





QString Device::lastKnownIPAddress() const
{
	QMutexLocker lock(&mMtx);
	return mLastKnownIPAddress;
}





QString Device::lastSeenOnWifi() const
{
	QMutexLocker lock(&mMtx);
	return mLastSeenOnWifi;
}





double Device::lastConnected() const
{
	QMutexLocker lock(&mMtx);
	return mLastConnected;
}





double Device::lastDetection() const
{
	QMutexLocker lock(&mMtx);
	return mLastDetection;
}





Device::PairingLevel Device::pairingLevel() const
{
	QMutexLocker lock(&mMtx);
	return mPairingLevel;
}





void Device::setFriendlyName(const QString & aFriendlyName)
{
	QMutexLocker lock(&mMtx);
	mFriendlyName = aFriendlyName;
}





void Device::setLastKnownIPAddress(const QString & aAddress)
{
	if (aAddress.isEmpty())
	{
		return;
	}
	QMutexLocker lock(&mMtx);
	mLastKnownIPAddress = aAddress;
}





void Device::setLastSeenOnWifi(const QString & aWifiName)
{
	if (aWifiName.isEmpty())
	{
		return;
	}
	QMutexLocker lock(&mMtx);
	mLastSeenOnWifi = aWifiName;
}





void Device::setLastConnected(double aTimestamp)
{
	QMutexLocker lock(&mMtx);
	mLastConnected = std::max(mLastConnected, aTimestamp);
}





void Device::setLastDetection(double aTimestamp)
{
	QMutexLocker lock(&mMtx);
	mLastDetection = std::max(mLastDetection, aTimestamp);
}





void Device::setPairingLevel(Device::PairingLevel aPairingLevel)
{
	{
		QMutexLocker lock(&mMtx);
		mPairingLevel = aPairingLevel;
	}
	for (const auto & svc: services())
	{
		svc->setPairingEnabled(aPairingLevel == plOn);
	}
}





ConnectionPtr Device::findService(Connection * aConnection) const
{
	QMutexLocker lock(&mMtx);
	for (const auto & svc: mServices)
	{
		if (svc.get() == aConnection)
		{
			return svc;
		}
	}
	return nullptr;
}





void Device::checkBarrier()
{
	if (!mIsBarrierPending || !mPending.empty())
	{
		return;
	}
	mIsBarrierPending = false;
	Failures failures;
	std::swap(failures, mFailures);

	bool hasConnectionless = false;
	for (const auto & svc: services())
	{
		if (!svc->isConnectable())
		{
			hasConnectionless = true;
			break;
		}
	}
	mIsConnected = (!mConnectedServices.empty() || hasConnectionless);

	mLogger.log("All connections settled, %1 failed; the device is ready.", failures.size());
	if (!failures.empty())
	{
		emit connectionFailed(this, failures);
	}
	emit ready(this);
}





void Device::settle(
	const ConnectionPtr & aConnection,
	bool aIsSuccess,
	Connection::ErrorCode aErrorCode,
	const QString & aErrorMessage
)
{
	if (!mIsBarrierPending || (mPending.erase(aConnection.get()) == 0))
	{
		return;
	}
	if (!aIsSuccess)
	{
		mFailures.push_back({aConnection->serviceName(), aErrorCode, aErrorMessage});
	}
	checkBarrier();
}





void Device::finishClosing()
{
	mIsClosing = false;
	mAwaitingDisconnect.clear();
	mConnectedServices.clear();
	mIsConnected = false;
	mLogger.log("All connections closed.");
	if (mCloseErrorCode == Connection::ecNone)
	{
		emit disconnected(this, mCloseErrorCode, QString());
	}
	else
	{
		emit disconnected(this, mCloseErrorCode, tr("Connecting was cancelled"));
	}
}





void Device::relayCapabilityChanges(Connection * aChangedConnection, const QStringList & aAdded, const QStringList & aRemoved)
{
	auto svcs = services();
	QStringList added, removed;
	for (const auto & cap: aAdded)
	{
		auto isElsewhere = std::any_of(svcs.begin(), svcs.end(),
			[aChangedConnection, &cap](const ConnectionPtr & aService)
			{
				return ((aService.get() != aChangedConnection) && aService->capabilities().contains(cap));
			}
		);
		if (!isElsewhere)
		{
			added.append(cap);
		}
	}
	for (const auto & cap: aRemoved)
	{
		auto isStillPresent = std::any_of(svcs.begin(), svcs.end(),
			[&cap](const ConnectionPtr & aService)
			{
				return aService->capabilities().contains(cap);
			}
		);
		if (!isStillPresent)
		{
			removed.append(cap);
		}
	}
	if (!added.isEmpty() || !removed.isEmpty())
	{
		emit capabilitiesUpdated(this, added, removed);
	}
}





void Device::connStateChanged(Connection * aConnection, Connection::State aNewState)
{
	if (findService(aConnection) == nullptr)
	{
		return;
	}
	emit serviceStateChanged(this, aConnection, aNewState);
}





void Device::connPairingRequired(Connection * aConnection, Connection::PairingType aPairingType, const QVariant & aPairingData)
{
	auto conn = findService(aConnection);
	if (conn == nullptr)
	{
		return;
	}
	mLogger.log("The %1 connection requires pairing.", conn->serviceName());
	emit pairingRequired(this, aConnection, aPairingType, aPairingData);
}





void Device::connPairingFailed(Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage)
{
	if (findService(aConnection) == nullptr)
	{
		return;
	}
	emit pairingFailed(this, aConnection, aErrorCode, aErrorMessage);
}





void Device::connReady(Connection * aConnection)
{
	auto conn = findService(aConnection);
	if (conn == nullptr)
	{
		return;
	}
	if (conn->state() != Connection::csReady)
	{
		// Queued from an attempt that has been closed since; the connection is no longer ready:
		mLogger.log("Ignoring a stale ready report from the %1 connection, it is now %2.",
			conn->serviceName(), Connection::stateToString(conn->state())
		);
		return;
	}
	mLogger.log("The %1 connection is ready.", conn->serviceName());
	if (conn->isConnectable())
	{
		mConnectedServices.insert(aConnection);
	}
	setLastConnected(Utils::nowEpochSeconds());
	setLastKnownIPAddress(conn->description().mAddress);
	settle(conn, true, Connection::ecNone, QString());
}





void Device::connFailed(Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage)
{
	auto conn = findService(aConnection);
	if (conn == nullptr)
	{
		return;
	}
	mLogger.log("The %1 connection failed: %2 (%3)", conn->serviceName(), Connection::errorCodeToString(aErrorCode), aErrorMessage);
	emit serviceFailed(this, aConnection, aErrorCode, aErrorMessage);

	// A report from an earlier attempt must not settle the connection if it is connecting again:
	if (Connection::isTerminal(conn->state()))
	{
		settle(conn, false, aErrorCode, aErrorMessage);
	}
}





void Device::connDisconnected(Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage)
{
	auto conn = findService(aConnection);
	if (conn == nullptr)
	{
		return;
	}
	mLogger.log("The %1 connection disconnected: %2 (%3)", conn->serviceName(), Connection::errorCodeToString(aErrorCode), aErrorMessage);
	emit serviceDisconnected(this, aConnection, aErrorCode, aErrorMessage);

	bool wasConnected = (mConnectedServices.erase(aConnection) > 0);
	if (mIsClosing)
	{
		if ((mAwaitingDisconnect.erase(aConnection) > 0) && mAwaitingDisconnect.empty())
		{
			finishClosing();
		}
		return;
	}

	if (Connection::isTerminal(conn->state()))
	{
		settle(conn, false, aErrorCode, aErrorMessage);
	}
	if (wasConnected && mIsConnected && mConnectedServices.empty() && !mIsBarrierPending)
	{
		mIsConnected = false;
		emit disconnected(this, aErrorCode, aErrorMessage);
	}
}





void Device::connCapabilitiesUpdated(Connection * aConnection, const QStringList & aAdded, const QStringList & aRemoved)
{
	if (findService(aConnection) == nullptr)
	{
		return;
	}
	relayCapabilityChanges(aConnection, aAdded, aRemoved);
}





void Device::connConfigUpdated(Connection * aConnection)
{
	if (findService(aConnection) == nullptr)
	{
		return;
	}
	emit configUpdated(this, aConnection);
}
