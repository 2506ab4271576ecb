#pragma once

#include <QDateTime>
#include <QString>





namespace Utils
{





/** Returns the current time as (fractional) seconds since the epoch, the unit of all stored timestamps. */
double nowEpochSeconds();

/** Converts the datetime into (fractional) seconds since the epoch. */
double toEpochSeconds(const QDateTime & aDateTime);

/** Converts the (fractional) seconds since the epoch into a UTC datetime. */
QDateTime fromEpochSeconds(double aEpochSeconds);

/** Returns the timestamp formatted for humans (ISO date and time, UTC), or "never" for zero timestamps. */
QString formatEpochSeconds(double aEpochSeconds);





}  // namespace Utils
