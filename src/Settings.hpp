#pragma once

#include <memory>
#include <QString>
#include <QVariant>





// fwd:
class QSettings;





/** Provides app-wide access to the persistent user settings, stored in an INI file.
Settings::init() must be called before any other function; until then, loadValue() returns the defaults
and saveValue() is ignored. */
class Settings
{
public:

	/** Opens the specified INI file as the settings storage. */
	static void init(const QString & aIniFileName);

	/** Returns the value stored under the specified group and key, or aDefault if not stored. */
	static QVariant loadValue(const QString & aGroup, const QString & aKey, const QVariant & aDefault = QVariant());

	/** Stores the value under the specified group and key, and syncs the file. */
	static void saveValue(const QString & aGroup, const QString & aKey, const QVariant & aValue);


protected:

	/** The storage; nullptr until init() is called. */
	static std::unique_ptr<QSettings> mSettings;
};
