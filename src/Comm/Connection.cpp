#include "Connection.hpp"
#include <algorithm>
#include <QMutexLocker>





std::atomic_int Connection::mCounter(0);





/** Returns the prefix used for all log messages of the specified connection. */
static QString logPrefix(const ServiceDescription & aDescription, int aConnectionNumber)
{
	return QString("Connection %1 (%2 @ %3): ")
		.arg(aConnectionNumber)
		.arg(aDescription.mServiceID, aDescription.mAddress);
}





Connection::Connection(
	Logger & aLogger,
	const ServiceDescription & aDescription,
	const ServiceConfig & aConfig,
	QObject * aParent
):
	Super(aParent),
	mLogger(aLogger, logPrefix(aDescription, mCounter.fetch_add(1))),
	mState(csIdle),
	mDescription(aDescription),
	mConfig(aConfig),
	mPairingType(ptUnknown),
	mIsPairingEnabled(true)
{
	if (mConfig.mUuid.isEmpty())
	{
		mConfig.mUuid = mDescription.mUuid;
	}

	// A freshly created connection is never connected, no matter what was persisted:
	mConfig.mIsConnected = false;
	mLogger.log("Created, UUID %1.", mDescription.mUuid);
}





Connection::~Connection()
{
	mLogger.log("Destroyed.");
}





int Connection::priority(Capability::Interface aInterface) const
{
	if (hasCapability(Capability::anyOf(aInterface)))
	{
		return Capability::plNormal;
	}
	return Capability::plNotSupported;
}





bool Connection::implementsInterface(Capability::Interface aInterface)
{
	switch (aInterface)
	{
		case Capability::ciLauncher:             return (launcher() != nullptr);
		case Capability::ciMediaPlayer:          return (mediaPlayer() != nullptr);
		case Capability::ciMediaControl:         return (mediaControl() != nullptr);
		case Capability::ciVolumeControl:        return (volumeControl() != nullptr);
		case Capability::ciTVControl:            return (tvControl() != nullptr);
		case Capability::ciKeyControl:           return (keyControl() != nullptr);
		case Capability::ciTextInputControl:     return (textInputControl() != nullptr);
		case Capability::ciMouseControl:         return (mouseControl() != nullptr);
		case Capability::ciPowerControl:         return (powerControl() != nullptr);
		case Capability::ciToastControl:         return (toastControl() != nullptr);
		case Capability::ciWebAppLauncher:       return (webAppLauncher() != nullptr);
		case Capability::ciExternalInputControl: return (externalInputControl() != nullptr);
		case Capability::ciUnknown:              return false;
	}
	return false;
}





Connection::State Connection::state() const
{
	if (!isConnectable())
	{
		return csReady;
	}
	QMutexLocker lock(&mMtx);
	return mState;
}





ServiceDescription Connection::description() const
{
	QMutexLocker lock(&mMtx);
	return mDescription;
}





ServiceConfig Connection::config() const
{
	QMutexLocker lock(&mMtx);
	auto res = mConfig;
	lock.unlock();
	if (res.mClassName.isEmpty())
	{
		res.mClassName = className();
	}
	return res;
}





QStringList Connection::capabilities() const
{
	QMutexLocker lock(&mMtx);
	return mCapabilities;
}





Connection::PairingType Connection::pairingType() const
{
	QMutexLocker lock(&mMtx);
	return mPairingType;
}





QVariant Connection::pairingData() const
{
	QMutexLocker lock(&mMtx);
	return mPairingData;
}





bool Connection::isPairingEnabled() const
{
	QMutexLocker lock(&mMtx);
	return mIsPairingEnabled;
}





QString Connection::serviceName() const
{
	QMutexLocker lock(&mMtx);
	return mDescription.mServiceID;
}





QString Connection::uuid() const
{
	QMutexLocker lock(&mMtx);
	return mDescription.mUuid;
}





bool Connection::requiresPairing() const
{
	auto pt = pairingType();
	return ((pt == ptPinCode) || (pt == ptOther));
}





QString Connection::stateToString(Connection::State aState)
{
	switch (aState)
	{
		case csIdle:            return "Idle";
		case csConnecting:      return "Connecting";
		case csPairingRequired: return "PairingRequired";
		case csPairing:         return "Pairing";
		case csPaired:          return "Paired";
		case csConnected:       return "Connected";
		case csReady:           return "Ready";
		case csDisconnected:    return "Disconnected";
		case csFailed:          return "Failed";
	}
	return QString("<invalid state %1>").arg(static_cast<int>(aState));
}





QString Connection::errorCodeToString(Connection::ErrorCode aErrorCode)
{
	switch (aErrorCode)
	{
		case ecNone:               return "None";
		case ecNetworkUnreachable: return "NetworkUnreachable";
		case ecPairingRejected:    return "PairingRejected";
		case ecPairingRequired:    return "PairingRequired";
		case ecTimeout:            return "Timeout";
		case ecProtocolError:      return "ProtocolError";
		case ecCancelled:          return "Cancelled";
		case ecInvalidState:       return "InvalidState";
	}
	return QString("<invalid error code %1>").arg(static_cast<int>(aErrorCode));
}





bool Connection::hasCapability(const QString & aQuery) const
{
	return Capability::hasCapability(capabilities(), aQuery);
}





bool Connection::hasCapabilities(const QStringList & aQueries) const
{
	return Capability::hasAll(capabilities(), aQueries);
}





bool Connection::hasAnyCapability(const QStringList & aQueries) const
{
	return Capability::hasAny(capabilities(), aQueries);
}





void Connection::updateDescription(const ServiceDescription & aDescription)
{
	QMutexLocker lock(&mMtx);
	auto serviceID = mDescription.mServiceID;
	auto uuid = mDescription.mUuid;
	auto lastDetection = std::max(mDescription.mLastDetection, aDescription.mLastDetection);
	mDescription = aDescription;
	mDescription.mServiceID = serviceID;
	mDescription.mUuid = uuid;
	mDescription.mLastDetection = lastDetection;
	mConfig.mLastDetection = std::max(mConfig.mLastDetection, lastDetection);
}





void Connection::setPairingEnabled(bool aIsPairingEnabled)
{
	QMutexLocker lock(&mMtx);
	mIsPairingEnabled = aIsPairingEnabled;
}





void Connection::openConnection()
{
	if (!isConnectable())
	{
		mLogger.log("Connectionless protocol, no need to connect.");
		emit ready(this);
		return;
	}
	if (!transition({csIdle, csDisconnected, csFailed}, csConnecting, "openConnection()"))
	{
		return;
	}
	emit stateChanged(this, csConnecting);
	doOpen();
}





bool Connection::closeConnection()
{
	if (!isConnectable())
	{
		mLogger.log("Connectionless protocol, nothing to close.");
		emit disconnected(this, ecNone, QString());
		return true;
	}

	State prevState;
	{
		QMutexLocker lock(&mMtx);
		prevState = mState;
		if (isTerminal(prevState))
		{
			lock.unlock();
			mLogger.log("closeConnection() ignored, already %1.", stateToString(prevState));
			return false;
		}
		mState = csDisconnected;
		mConfig.mIsConnected = false;
	}
	mLogger.log("Closing, was %1.", stateToString(prevState));

	// Let the protocol abort whatever is in progress; any later reports are ignored due to the state:
	doClose();

	emit stateChanged(this, csDisconnected);
	if (prevState == csReady)
	{
		emit configUpdated(this);
	}
	if ((prevState == csIdle) || (prevState == csReady))
	{
		emit disconnected(this, ecNone, QString());
	}
	else
	{
		emit disconnected(this, ecCancelled, tr("Closed while %1").arg(stateToString(prevState)));
	}
	return true;
}





void Connection::pair(const QVariant & aPairingData)
{
	if (!transition({csPairingRequired, csPairing}, csPairing, "pair()"))
	{
		emit pairingFailed(this, ecInvalidState, tr("The connection is not waiting for pairing (%1)").arg(stateToString(state())));
		return;
	}
	emit stateChanged(this, csPairing);
	doPair(aPairingData);
}





void Connection::doPair(const QVariant & aPairingData)
{
	Q_UNUSED(aPairingData);
	reportPairingFailed(ecPairingRejected, tr("The protocol doesn't support pairing"));
}





void Connection::reportPairingRequired(Connection::PairingType aPairingType, const QVariant & aPairingData)
{
	bool isPairingEnabled;
	{
		QMutexLocker lock(&mMtx);
		if (mState != csConnecting)
		{
			auto curState = mState;
			lock.unlock();
			mLogger.log("Pairing request ignored in state %1.", stateToString(curState));
			return;
		}
		mPairingType = aPairingType;
		mPairingData = aPairingData;
		isPairingEnabled = mIsPairingEnabled;
		mState = isPairingEnabled ? csPairingRequired : csFailed;
	}

	if (!isPairingEnabled)
	{
		mLogger.log("The remote requires pairing, but pairing is disabled; failing.");
		doClose();
		emit stateChanged(this, csFailed);
		emit failed(this, ecPairingRequired, tr("The device requires pairing, but pairing is disabled"));
		return;
	}

	mLogger.log("The remote requires pairing, type %1.", aPairingType);
	emit stateChanged(this, csPairingRequired);
	emit pairingRequired(this, aPairingType, aPairingData);
}





void Connection::reportPairingFailed(Connection::ErrorCode aErrorCode, const QString & aErrorMessage)
{
	State prevState;
	{
		QMutexLocker lock(&mMtx);
		prevState = mState;
		if ((prevState != csPairing) && (prevState != csPairingRequired))
		{
			lock.unlock();
			mLogger.log("Pairing failure ignored in state %1.", stateToString(prevState));
			return;
		}
		mState = csPairingRequired;
	}
	mLogger.log("Pairing failed: %1 (%2)", errorCodeToString(aErrorCode), aErrorMessage);
	if (prevState != csPairingRequired)
	{
		emit stateChanged(this, csPairingRequired);
	}
	emit pairingFailed(this, aErrorCode, aErrorMessage);
}





void Connection::reportPaired()
{
	if (!transition({csPairing}, csPaired, "reportPaired()"))
	{
		return;
	}
	emit stateChanged(this, csPaired);
	reportConnected();
}





void Connection::reportConnected()
{
	if (!transition({csConnecting, csPaired}, csConnected, "reportConnected()"))
	{
		return;
	}
	emit stateChanged(this, csConnected);
	if (!hasPostConnectHandshake())
	{
		enterReady();
	}
}





void Connection::reportHandshakeFinished()
{
	{
		QMutexLocker lock(&mMtx);
		if (mState != csConnected)
		{
			auto curState = mState;
			lock.unlock();
			mLogger.log("Handshake completion ignored in state %1.", stateToString(curState));
			return;
		}
	}
	enterReady();
}





void Connection::enterReady()
{
	{
		QMutexLocker lock(&mMtx);
		if (mState != csConnected)
		{
			return;
		}
		mState = csReady;
		mConfig.mIsConnected = true;
		mConfig.mWasConnected = true;
		if (mPairingType == ptUnknown)
		{
			mPairingType = ptNone;
		}
	}
	mLogger.log("Ready.");
	emit stateChanged(this, csReady);
	emit configUpdated(this);
	emit ready(this);
}





void Connection::reportFailed(Connection::ErrorCode aErrorCode, const QString & aErrorMessage)
{
	State prevState;
	{
		QMutexLocker lock(&mMtx);
		prevState = mState;
		switch (prevState)
		{
			case csConnecting:
			case csPairingRequired:
			case csPairing:
			case csPaired:
			case csConnected:
			{
				mState = csFailed;
				break;
			}
			case csReady:
			{
				// A failure of an established connection is a disconnect:
				mState = csDisconnected;
				mConfig.mIsConnected = false;
				break;
			}
			case csIdle:
			case csDisconnected:
			case csFailed:
			{
				lock.unlock();
				mLogger.log("Failure ignored in state %1: %2 (%3)", stateToString(prevState), errorCodeToString(aErrorCode), aErrorMessage);
				return;
			}
		}
	}

	if (prevState == csReady)
	{
		mLogger.log("Connection lost: %1 (%2)", errorCodeToString(aErrorCode), aErrorMessage);
		emit stateChanged(this, csDisconnected);
		emit configUpdated(this);
		emit disconnected(this, aErrorCode, aErrorMessage);
		return;
	}
	mLogger.log("Failed in state %1: %2 (%3)", stateToString(prevState), errorCodeToString(aErrorCode), aErrorMessage);
	emit stateChanged(this, csFailed);
	emit failed(this, aErrorCode, aErrorMessage);
}





void Connection::reportDisconnected(Connection::ErrorCode aErrorCode, const QString & aErrorMessage)
{
	State prevState;
	{
		QMutexLocker lock(&mMtx);
		prevState = mState;
		if ((prevState == csIdle) || isTerminal(prevState))
		{
			lock.unlock();
			mLogger.log("Disconnect ignored in state %1.", stateToString(prevState));
			return;
		}
		mState = csDisconnected;
		mConfig.mIsConnected = false;
	}
	mLogger.log("Disconnected by the remote in state %1: %2 (%3)", stateToString(prevState), errorCodeToString(aErrorCode), aErrorMessage);
	emit stateChanged(this, csDisconnected);
	if (prevState == csReady)
	{
		emit configUpdated(this);
	}
	emit disconnected(this, aErrorCode, aErrorMessage);
}





void Connection::setPairingType(Connection::PairingType aPairingType)
{
	QMutexLocker lock(&mMtx);
	mPairingType = aPairingType;
}





void Connection::setCredentials(const QJsonObject & aCredentials)
{
	{
		QMutexLocker lock(&mMtx);
		mConfig.mCredentials = aCredentials;
	}
	emit configUpdated(this);
}





void Connection::addCapability(const QString & aCapability)
{
	addCapabilities({aCapability});
}





void Connection::addCapabilities(const QStringList & aCapabilities)
{
	QStringList added;
	{
		QMutexLocker lock(&mMtx);
		for (const auto & cap: aCapabilities)
		{
			if (cap.isEmpty() || mCapabilities.contains(cap))
			{
				continue;
			}
			mCapabilities.append(cap);
			added.append(cap);
		}
	}
	if (!added.isEmpty())
	{
		emit capabilitiesUpdated(this, added, QStringList());
	}
}





void Connection::removeCapability(const QString & aCapability)
{
	removeCapabilities({aCapability});
}





void Connection::removeCapabilities(const QStringList & aCapabilities)
{
	QStringList removed;
	{
		QMutexLocker lock(&mMtx);
		for (const auto & cap: aCapabilities)
		{
			if (cap.isEmpty())
			{
				continue;
			}
			if (mCapabilities.removeAll(cap) > 0)
			{
				removed.append(cap);
			}
		}
	}
	if (!removed.isEmpty())
	{
		emit capabilitiesUpdated(this, QStringList(), removed);
	}
}





bool Connection::transition(std::initializer_list<Connection::State> aAllowedStates, Connection::State aNewState, const char * aOperation)
{
	QMutexLocker lock(&mMtx);
	auto curState = mState;
	for (const auto allowed: aAllowedStates)
	{
		if (curState == allowed)
		{
			mState = aNewState;
			lock.unlock();
			mLogger.log("%1: %2 -> %3", aOperation, stateToString(curState), stateToString(aNewState));
			return true;
		}
	}
	lock.unlock();
	mLogger.log("%1 ignored in state %2.", aOperation, stateToString(curState));
	return false;
}
