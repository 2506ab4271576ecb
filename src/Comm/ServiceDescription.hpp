#pragma once

#include <QString>
#include <QJsonObject>
#include <QMetaType>





/** The metadata of a single protocol endpoint, as reported by the discovery layer.
Serialized into the "description" object of each stored service. */
struct ServiceDescription
{
	/** The network address (IP) where the endpoint was seen. */
	QString mAddress;

	/** The protocol type name (such as "webOS TV" or "DIAL"); a Device holds at most one Connection per ServiceID. */
	QString mServiceID;

	/** The stable identifier of the endpoint. */
	QString mUuid;

	/** The port on which the endpoint listens. */
	int mPort = 0;

	/** The discovery-level type (such as the SSDP ST / USN service type). */
	QString mType;

	QString mVersion;
	QString mFriendlyName;
	QString mManufacturer;
	QString mModelName;
	QString mModelDescription;
	QString mModelNumber;

	/** The URL to which the protocol sends its commands. */
	QString mCommandUrl;

	/** The time (in seconds since epoch) when the endpoint was last seen by the discovery. */
	double mLastDetection = 0;


	/** Returns the JSON representation, as stored in the DeviceStore. */
	QJsonObject toJson() const;

	/** Creates a description from its JSON representation.
	Missing values are left at their defaults. */
	static ServiceDescription fromJson(const QJsonObject & aJson);
};

Q_DECLARE_METATYPE(ServiceDescription);
