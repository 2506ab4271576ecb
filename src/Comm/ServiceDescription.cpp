#include "ServiceDescription.hpp"
#include <QJsonValue>





QJsonObject ServiceDescription::toJson() const
{
	QJsonObject res;
	res["address"] = mAddress;
	res["serviceId"] = mServiceID;
	res["UUID"] = mUuid;
	res["port"] = mPort;
	res["type"] = mType;
	res["version"] = mVersion;
	res["friendlyName"] = mFriendlyName;
	res["manufacturer"] = mManufacturer;
	res["modelName"] = mModelName;
	res["modelDescription"] = mModelDescription;
	res["modelNumber"] = mModelNumber;
	res["commandURL"] = mCommandUrl;
	res["lastDetection"] = mLastDetection;
	return res;
}





ServiceDescription ServiceDescription::fromJson(const QJsonObject & aJson)
{
	ServiceDescription res;
	res.mAddress          = aJson["address"].toString();
	res.mServiceID        = aJson["serviceId"].toString();
	res.mUuid             = aJson["UUID"].toString();
	res.mPort             = aJson["port"].toInt();
	res.mType             = aJson["type"].toString();
	res.mVersion          = aJson["version"].toString();
	res.mFriendlyName     = aJson["friendlyName"].toString();
	res.mManufacturer     = aJson["manufacturer"].toString();
	res.mModelName        = aJson["modelName"].toString();
	res.mModelDescription = aJson["modelDescription"].toString();
	res.mModelNumber      = aJson["modelNumber"].toString();
	res.mCommandUrl       = aJson["commandURL"].toString();
	res.mLastDetection    = aJson["lastDetection"].toDouble();
	return res;
}
