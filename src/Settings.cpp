#include "Settings.hpp"
#include <QSettings>
#include <QDebug>





std::unique_ptr<QSettings> Settings::mSettings;





void Settings::init(const QString & aIniFileName)
{
	mSettings = std::make_unique<QSettings>(aIniFileName, QSettings::IniFormat);
	qDebug() << "Settings are stored in " << aIniFileName;
}





QVariant Settings::loadValue(const QString & aGroup, const QString & aKey, const QVariant & aDefault)
{
	if (mSettings == nullptr)
	{
		return aDefault;
	}
	return mSettings->value(aGroup + "/" + aKey, aDefault);
}





void Settings::saveValue(const QString & aGroup, const QString & aKey, const QVariant & aValue)
{
	if (mSettings == nullptr)
	{
		qWarning() << "Settings not initialized, dropping value for " << aGroup << "/" << aKey;
		return;
	}
	mSettings->setValue(aGroup + "/" + aKey, aValue);
	mSettings->sync();
}
