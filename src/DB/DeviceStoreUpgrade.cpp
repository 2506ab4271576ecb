#include "DeviceStoreUpgrade.hpp"
#include <algorithm>
#include <functional>
#include <vector>
#include <QJsonArray>





/** Sets the value in the object, unless it is already present. */
static void setDefault(QJsonObject & aObject, const QString & aKey, const QJsonValue & aValue)
{
	if (!aObject.contains(aKey))
	{
		aObject[aKey] = aValue;
	}
}





/** Returns the latest lastDetection of the device's services (their config or description),
or 0 if none of them has one. */
static double latestServiceDetection(const QJsonObject & aDevice)
{
	double res = 0;
	const auto services = aDevice["services"].toObject();
	for (const auto & v: services)
	{
		auto svc = v.toObject();
		res = std::max(res, svc["config"].toObject()["lastDetection"].toDouble());
		res = std::max(res, svc["description"].toObject()["lastDetection"].toDouble());
	}
	return res;
}





/** Version 2 requires all the bookkeeping values of the devices and the wasConnected flag in each service config.
Version 1 stores contain only devices that have been connected, so the flag defaults to true.
A missing lastDetection is taken from the services, or from the store's last update, so that
the upgraded device isn't pruned as stale right away. */
static void upgradeToVersion2(QJsonObject & aStore)
{
	const auto storeUpdated = std::max(aStore["updated"].toDouble(), aStore["created"].toDouble());
	QJsonArray devices;
	for (const auto & v: aStore["devices"].toArray())
	{
		auto dev = v.toObject();
		setDefault(dev, "friendlyName", QString());
		setDefault(dev, "lastKnownIPAddress", QString());
		setDefault(dev, "lastSeenOnWifi", QString());
		setDefault(dev, "lastConnected", 0.0);
		if (!dev.contains("lastDetection"))
		{
			auto lastDetection = latestServiceDetection(dev);
			dev["lastDetection"] = (lastDetection > 0) ? lastDetection : storeUpdated;
		}
		setDefault(dev, "services", QJsonObject());

		auto services = dev["services"].toObject();
		for (const auto & uuid: services.keys())
		{
			auto svc = services[uuid].toObject();
			auto config = svc["config"].toObject();
			setDefault(config, "wasConnected", true);
			svc["config"] = config;
			services[uuid] = svc;
		}
		dev["services"] = services;
		devices.append(dev);
	}
	aStore["devices"] = devices;
}





/** The upgrade steps; the step at index N upgrades from version N + 1 to version N + 2. */
static const std::vector<std::function<void(QJsonObject &)>> & upgradeSteps()
{
	static const std::vector<std::function<void(QJsonObject &)>> steps =
	{
		&upgradeToVersion2,
	};
	return steps;
}





DeviceStoreUpgrade::DeviceStoreUpgrade(QJsonObject & aStore, Logger & aLogger):
	mStore(aStore),
	mLogger(aLogger)
{
}





void DeviceStoreUpgrade::upgrade(QJsonObject & aStore, Logger & aLogger)
{
	DeviceStoreUpgrade upg(aStore, aLogger);
	upg.execute();
}





int DeviceStoreUpgrade::currentVersion()
{
	return static_cast<int>(upgradeSteps().size()) + 1;
}





int DeviceStoreUpgrade::getVersion(const QJsonObject & aStore)
{
	return std::max(aStore.value("version").toInt(1), 1);
}





void DeviceStoreUpgrade::execute()
{
	const auto & steps = upgradeSteps();
	auto version = getVersion(mStore);
	mLogger.log("Store version: %1; upgrade script version: %2", version, currentVersion());
	for (auto v = version; v < currentVersion(); ++v)
	{
		mLogger.log("Upgrading the store to version %1", v + 1);
		steps[static_cast<size_t>(v - 1)](mStore);
		mStore["version"] = v + 1;
	}
}
