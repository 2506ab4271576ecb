#pragma once

#include <QJsonObject>
#include "../Logger.hpp"





/** Upgrades the JSON document of the device store from older versions to the current one.
Each version has a single upgrade step that brings the document from the previous version;
the steps only default the missing values, no data is ever dropped. */
class DeviceStoreUpgrade
{
public:

	/** Upgrades the store document to the latest known version, in place.
	Expects the document version not to be newer than currentVersion(). */
	static void upgrade(QJsonObject & aStore, Logger & aLogger);

	/** Returns the highest version that the upgrade knows (current version). */
	static int currentVersion();

	/** Returns the version stored in the document.
	Documents without a valid version value are the initial version, 1. */
	static int getVersion(const QJsonObject & aStore);


protected:

	/** The document on which to perform the upgrade. */
	QJsonObject & mStore;

	Logger & mLogger;


	/** Creates a new instance of this object. */
	DeviceStoreUpgrade(QJsonObject & aStore, Logger & aLogger);

	/** Performs the whole upgrade on mStore. */
	void execute();
};
