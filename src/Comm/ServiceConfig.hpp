#pragma once

#include <QString>
#include <QJsonObject>
#include <QMetaType>





/** The persisted part of a single Connection: the pairing credentials and the connection history.
Serialized into the "config" object of each stored service. The protocol-specific credentials
(client keys, certificates, ...) are kept as an opaque JSON object that the protocol implementation owns. */
struct ServiceConfig
{
	/** The name of the config class, used as a discriminator by the protocol implementations. */
	QString mClassName;

	/** The UUID of the endpoint this config belongs to. */
	QString mUuid;

	/** True while the connection is Ready. */
	bool mIsConnected = false;

	/** True once the connection has ever reached Ready; never reset.
	Only devices with at least one such connection are persisted. */
	bool mWasConnected = false;

	/** The time (in seconds since epoch) when the endpoint was last seen. */
	double mLastDetection = 0;

	/** Protocol-specific credentials, merged into the "config" JSON object on save. */
	QJsonObject mCredentials;


	/** Returns the JSON representation, as stored in the DeviceStore. */
	QJsonObject toJson() const;

	/** Creates a config from its JSON representation.
	All unknown keys are considered credentials and kept in mCredentials. */
	static ServiceConfig fromJson(const QJsonObject & aJson);
};

Q_DECLARE_METATYPE(ServiceConfig);
