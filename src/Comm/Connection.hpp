#pragma once

#include <atomic>
#include <initializer_list>
#include <memory>
#include <QObject>
#include <QMutex>
#include <QStringList>
#include <QVariant>
#include "../Logger.hpp"
#include "../Capabilities/Capability.hpp"
#include "ServiceDescription.hpp"
#include "ServiceConfig.hpp"





// fwd:
class Launcher;
class MediaPlayer;
class MediaControl;
class VolumeControl;
class TVControl;
class KeyControl;
class TextInputControl;
class MouseControl;
class PowerControl;
class ToastControl;
class WebAppLauncher;
class ExternalInputControl;





/** A link to a single endpoint over a single protocol (webOS, DIAL, Cast, ...).
The Connection is the base class that all protocol implementations derive from. It owns the lifecycle
state machine; the descendants only implement the protocol hooks (doOpen(), doClose(), doPair()) and report
the protocol's progress through the report*() functions.

State machine:
csIdle -> csConnecting -> [csPairingRequired -> csPairing -> csPaired] -> csConnected -> csReady
Terminal states are csDisconnected and csFailed; openConnection() may be called again from them.

openConnection(), closeConnection() and pair() never block and never throw, their outcome is always
reported by a signal. The report*() functions may be called from any thread; the signals are then emitted
from that thread, so the receivers (Device) use queued connections to serialize them.
A Connection that is not connectable (connectionless protocol) is always considered csReady. */
class Connection:
	public QObject,
	public std::enable_shared_from_this<Connection>
{
	using Super = QObject;
	Q_OBJECT

	/** The counter used to identify connections in the logs. */
	static std::atomic_int mCounter;


public:

	enum State
	{
		csIdle,             ///< Created, not yet connecting
		csConnecting,       ///< openConnection() called, the protocol is working on it
		csPairingRequired,  ///< The protocol needs pairing data from the user, see pair()
		csPairing,          ///< The pairing data is being verified by the remote
		csPaired,           ///< The pairing has succeeded, connection continues
		csConnected,        ///< Connected, the protocol may still be doing its post-connect handshake
		csReady,            ///< Fully usable
		csDisconnected,     ///< Terminal: closed, either locally or by the remote
		csFailed,           ///< Terminal: the connection attempt failed
	};
	Q_ENUM(State)


	enum PairingType
	{
		ptUnknown,  ///< Not known until a connection attempt is made
		ptNone,     ///< The protocol needs no pairing
		ptPinCode,  ///< The user needs to type a code displayed on the device
		ptOther,    ///< Protocol-specific pairing (confirmation on the device, key exchange, ...)
	};
	Q_ENUM(PairingType)


	enum ErrorCode
	{
		ecNone,
		ecNetworkUnreachable,  ///< The remote cannot be reached
		ecPairingRejected,     ///< The remote rejected the pairing data
		ecPairingRequired,     ///< The remote requires pairing, but pairing is disabled
		ecTimeout,             ///< The protocol gave up waiting for the remote
		ecProtocolError,       ///< The remote violated the protocol
		ecCancelled,           ///< The operation was aborted by closeConnection()
		ecInvalidState,        ///< The operation is not valid in the current state
	};
	Q_ENUM(ErrorCode)


	/** Creates a new Connection in the csIdle state.
	The description identifies the endpoint, the config carries the persisted credentials (if any). */
	Connection(
		Logger & aLogger,
		const ServiceDescription & aDescription,
		const ServiceConfig & aConfig,
		QObject * aParent = nullptr
	);

	virtual ~Connection() override;

	/** Returns the name of the protocol class, stored as the "class" discriminator in the DeviceStore
	and used by the ConnectionFactory to re-create the connection. */
	virtual QString className() const = 0;

	/** Returns true if the protocol requires an explicit connection / registration step.
	Connectionless protocols are always csReady and take no part in the Device's ready barrier. */
	virtual bool isConnectable() const = 0;

	/** Returns the priority with which this connection implements the specified capability interface.
	The default returns plNormal for interfaces with at least one advertised capability, plNotSupported otherwise.
	Descendants override to express how good their implementation is, compared to other protocols. */
	virtual int priority(Capability::Interface aInterface) const;

	/** Returns the priority for the interface implementing the specified capability. */
	int priorityFor(const QString & aCapability) const { return priority(Capability::interfaceFromCapability(aCapability)); }

	// Capability interfaces, nullptr if not implemented by the protocol:
	virtual Launcher * launcher() { return nullptr; }
	virtual MediaPlayer * mediaPlayer() { return nullptr; }
	virtual MediaControl * mediaControl() { return nullptr; }
	virtual VolumeControl * volumeControl() { return nullptr; }
	virtual TVControl * tvControl() { return nullptr; }
	virtual KeyControl * keyControl() { return nullptr; }
	virtual TextInputControl * textInputControl() { return nullptr; }
	virtual MouseControl * mouseControl() { return nullptr; }
	virtual PowerControl * powerControl() { return nullptr; }
	virtual ToastControl * toastControl() { return nullptr; }
	virtual WebAppLauncher * webAppLauncher() { return nullptr; }
	virtual ExternalInputControl * externalInputControl() { return nullptr; }

	/** Returns true if the connection implements the specified capability interface (the accessor is non-null). */
	bool implementsInterface(Capability::Interface aInterface);

	// Thread-safe getters:
	State state() const;
	ServiceDescription description() const;
	ServiceConfig config() const;
	QStringList capabilities() const;
	PairingType pairingType() const;
	QVariant pairingData() const;
	bool isPairingEnabled() const;

	/** Returns the protocol type name (the description's ServiceID), the key under which a Device holds the connection. */
	QString serviceName() const;

	/** Returns the endpoint's UUID. */
	QString uuid() const;

	/** Returns true if the pairing type is known to require user input. */
	bool requiresPairing() const;

	/** Returns true if the state is csDisconnected or csFailed. */
	static bool isTerminal(State aState) { return ((aState == csDisconnected) || (aState == csFailed)); }

	/** Translates the State into a string representation, used mainly for logging. */
	static QString stateToString(State aState);

	/** Translates the ErrorCode into a string representation, used mainly for logging. */
	static QString errorCodeToString(ErrorCode aErrorCode);

	bool hasCapability(const QString & aQuery) const;
	bool hasCapabilities(const QStringList & aQueries) const;
	bool hasAnyCapability(const QStringList & aQueries) const;

	/** Updates the description, when the endpoint is re-discovered.
	The ServiceID and UUID stay unchanged. */
	void updateDescription(const ServiceDescription & aDescription);

	/** Enables or disables pairing.
	With pairing disabled, a connection that needs pairing fails with ecPairingRequired. */
	void setPairingEnabled(bool aIsPairingEnabled);

	/** Starts connecting to the endpoint.
	Valid only in csIdle, csDisconnected and csFailed, ignored (and logged) otherwise. */
	Q_INVOKABLE void openConnection();

	/** Closes the connection, aborting any connecting or pairing in progress.
	Valid in all non-terminal states; emits exactly one disconnected() signal.
	Returns true if the disconnected() signal was emitted, false if the call was ignored (already terminal). */
	Q_INVOKABLE bool closeConnection();

	/** Provides the pairing data (PIN code etc.) requested by the pairingRequired() signal.
	Valid only in csPairingRequired and csPairing; otherwise pairingFailed() is emitted with ecInvalidState. */
	Q_INVOKABLE void pair(const QVariant & aPairingData);

	/** Returns the logger used for this connection. */
	PrefixLogger & logger() { return mLogger; }


protected:

	/** The logger used for all messages produced by this class. */
	PrefixLogger mLogger;

	/** Protects all the mutable members below against multithreaded access. */
	mutable QMutex mMtx;

	/** The current state, protected by mMtx. */
	State mState;

	/** The discovered metadata, protected by mMtx. */
	ServiceDescription mDescription;

	/** The persisted data, protected by mMtx. */
	ServiceConfig mConfig;

	/** The currently advertised capabilities, in the order they were added; protected by mMtx. */
	QStringList mCapabilities;

	/** The pairing type, as learned by the protocol; protected by mMtx. */
	PairingType mPairingType;

	/** The pairing hint data (such as the expected PIN length); protected by mMtx. */
	QVariant mPairingData;

	/** If false, connections requiring pairing fail instead; protected by mMtx. */
	bool mIsPairingEnabled;


	// Protocol hooks, to be implemented by the descendants:

	/** Starts the asynchronous connection.
	Called in the csConnecting state, without mMtx locked. The progress is reported via the report*() functions. */
	virtual void doOpen() = 0;

	/** Aborts any work in progress and releases the transport.
	Called after the state has already been set to csDisconnected; the descendant must not report anything further. */
	virtual void doClose() {}

	/** Verifies the pairing data with the remote.
	Called in the csPairing state, reports back via reportPaired() or reportPairingFailed().
	The default rejects pairing. */
	virtual void doPair(const QVariant & aPairingData);

	/** Returns true if the protocol does a handshake after connecting, finished by reportHandshakeFinished().
	If false, csConnected is immediately followed by csReady. */
	virtual bool hasPostConnectHandshake() const { return false; }


	// Progress reporting, to be called by the descendants (from any thread).
	// Each is ignored (and logged) when not valid in the current state, such as after a closeConnection().

	/** The remote requires pairing. Moves from csConnecting to csPairingRequired. */
	void reportPairingRequired(PairingType aPairingType, const QVariant & aPairingData = QVariant());

	/** The remote rejected the pairing data. Moves back to csPairingRequired, the user may retry. */
	void reportPairingFailed(ErrorCode aErrorCode, const QString & aErrorMessage);

	/** The remote accepted the pairing data. Moves to csPaired and on to csConnected. */
	void reportPaired();

	/** The transport is connected. Moves to csConnected, and on to csReady if there's no handshake. */
	void reportConnected();

	/** The post-connect handshake has finished. Moves from csConnected to csReady. */
	void reportHandshakeFinished();

	/** The connection attempt failed. Moves to csFailed; if already csReady, to csDisconnected instead. */
	void reportFailed(ErrorCode aErrorCode, const QString & aErrorMessage);

	/** The remote has closed the connection. Moves to csDisconnected. */
	void reportDisconnected(ErrorCode aErrorCode, const QString & aErrorMessage);

	/** Sets the pairing type, as learned by the protocol. */
	void setPairingType(PairingType aPairingType);

	/** Replaces the protocol-specific credentials and emits configUpdated(). */
	void setCredentials(const QJsonObject & aCredentials);

	// Capability list modifications; each effective change emits a single capabilitiesUpdated().
	// Empty and duplicate capabilities are ignored.
	void addCapability(const QString & aCapability);
	void addCapabilities(const QStringList & aCapabilities);
	void removeCapability(const QString & aCapability);
	void removeCapabilities(const QStringList & aCapabilities);

	/** Atomically moves to aNewState if the current state is one of aAllowedStates.
	Returns true on success; on failure logs the ignored transition under the specified operation name. */
	bool transition(std::initializer_list<State> aAllowedStates, State aNewState, const char * aOperation);

	/** Moves from csConnected to csReady, updating the config's connection flags and emitting the signals.
	Expects the current state to be csConnected. */
	void enterReady();


signals:

	/** Emitted after each state change. */
	void stateChanged(Connection * aConnection, Connection::State aNewState);

	/** Emitted when the protocol needs pairing data; answer by calling pair(). */
	void pairingRequired(Connection * aConnection, Connection::PairingType aPairingType, const QVariant & aPairingData);

	/** Emitted when pair() fails; the connection stays in csPairingRequired and pair() may be retried. */
	void pairingFailed(Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);

	/** Emitted when the connection reaches csReady. */
	void ready(Connection * aConnection);

	/** Emitted when the connection attempt fails (csFailed). */
	void failed(Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);

	/** Emitted exactly once per connection attempt when the connection reaches csDisconnected. */
	void disconnected(Connection * aConnection, Connection::ErrorCode aErrorCode, const QString & aErrorMessage);

	/** Emitted when the advertised capabilities change. */
	void capabilitiesUpdated(Connection * aConnection, const QStringList & aAdded, const QStringList & aRemoved);

	/** Emitted when the persisted part (config) changes, such as after pairing or connecting. */
	void configUpdated(Connection * aConnection);
};

using ConnectionPtr = std::shared_ptr<Connection>;

Q_DECLARE_METATYPE(ConnectionPtr);
