#include "Utils.hpp"
#include <cmath>





namespace Utils
{





double nowEpochSeconds()
{
	return toEpochSeconds(QDateTime::currentDateTimeUtc());
}





double toEpochSeconds(const QDateTime & aDateTime)
{
	return static_cast<double>(aDateTime.toMSecsSinceEpoch()) / 1000.0;
}





QDateTime fromEpochSeconds(double aEpochSeconds)
{
	return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(std::llround(aEpochSeconds * 1000.0)), Qt::UTC);
}





QString formatEpochSeconds(double aEpochSeconds)
{
	if (aEpochSeconds <= 0)
	{
		return QString::fromUtf8("never");
	}
	return fromEpochSeconds(aEpochSeconds).toString(Qt::ISODate);
}





}  // namespace Utils
