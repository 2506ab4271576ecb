#include "ServiceConfig.hpp"
#include <QJsonValue>





/** The keys that ServiceConfig handles itself; everything else is a credential. */
static const char * const gStandardKeys[] =
{
	"class",
	"UUID",
	"connected",
	"wasConnected",
	"lastDetection",
};





QJsonObject ServiceConfig::toJson() const
{
	auto res = mCredentials;
	res["class"] = mClassName;
	res["UUID"] = mUuid;
	res["connected"] = mIsConnected;
	res["wasConnected"] = mWasConnected;
	res["lastDetection"] = mLastDetection;
	return res;
}





ServiceConfig ServiceConfig::fromJson(const QJsonObject & aJson)
{
	ServiceConfig res;
	res.mClassName     = aJson["class"].toString();
	res.mUuid          = aJson["UUID"].toString();
	res.mIsConnected   = aJson["connected"].toBool(false);
	res.mWasConnected  = aJson["wasConnected"].toBool(false);
	res.mLastDetection = aJson["lastDetection"].toDouble();
	res.mCredentials = aJson;
	for (const auto key: gStandardKeys)
	{
		res.mCredentials.remove(QString::fromLatin1(key));
	}
	return res;
}
