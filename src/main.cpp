#include <memory>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include "ComponentCollection.hpp"
#include "Device.hpp"
#include "InstallConfiguration.hpp"
#include "MultiLogger.hpp"
#include "Settings.hpp"
#include "Utils.hpp"
#include "DB/DeviceStore.hpp"





/** Prints the stored devices in a human-readable form. */
static void listDevices(const std::vector<DeviceStore::Record> & aRecords, QTextStream & aOut)
{
	if (aRecords.empty())
	{
		aOut << QCoreApplication::translate("main", "No stored devices.") << "\n";
		return;
	}
	for (const auto & rec: aRecords)
	{
		aOut << QString("%1 (%2, Wi-Fi \"%3\")\n").arg(rec.mFriendlyName, rec.mLastKnownIPAddress, rec.mLastSeenOnWifi);
		aOut << QString("  last connected: %1\n").arg(Utils::formatEpochSeconds(rec.mLastConnected));
		aOut << QString("  last detected:  %1\n").arg(Utils::formatEpochSeconds(rec.mLastDetection));
		for (const auto & svc: rec.mServices)
		{
			aOut << QString("  %1: %2 (%3), port %4, %5\n")
				.arg(svc.first, svc.second.mDescription.mServiceID, svc.second.mClassName)
				.arg(svc.second.mDescription.mPort)
				.arg(svc.second.mConfig.mCredentials.isEmpty() ? "no credentials" : "paired");
		}
	}
}





int main(int argc, char * argv[])
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName("Castlink");

	QCommandLineParser parser;
	parser.setApplicationDescription(QCoreApplication::translate("main", "Inspects and maintains the Castlink device store."));
	parser.addHelpOption();
	QCommandLineOption dataOption("data", QCoreApplication::translate("main", "The data folder (settings, logs, backups)."), "folder");
	QCommandLineOption storeOption("store", QCoreApplication::translate("main", "The device store file to use."), "file");
	QCommandLineOption listOption("list", QCoreApplication::translate("main", "Lists the stored devices (the default action)."));
	QCommandLineOption maxAgeOption("max-age", QCoreApplication::translate("main", "Applies a new max store duration, removing the older devices."), "seconds");
	QCommandLineOption removeOption("remove", QCoreApplication::translate("main", "Removes the device that has a service with the specified UUID."), "uuid");
	QCommandLineOption clearOption("clear", QCoreApplication::translate("main", "Removes all the stored devices."));
	parser.addOption(dataOption);
	parser.addOption(storeOption);
	parser.addOption(listOption);
	parser.addOption(maxAgeOption);
	parser.addOption(removeOption);
	parser.addOption(clearOption);
	parser.process(app);

	QTextStream out(stdout);
	QTextStream err(stderr);
	try
	{
		qRegisterMetaType<DevicePtr>();
		qRegisterMetaType<ConnectionPtr>();
		ComponentCollection cc;
		auto instConf = std::make_shared<InstallConfiguration>(cc, parser.value(dataOption));
		Settings::init(instConf->dataLocation("Castlink.ini"));
		instConf->loadFromSettings();

		// Create the components:
		cc.addComponent(instConf);
		auto multiLogger = cc.addNew<MultiLogger>(instConf->logsFolder(), instConf->maxLogSize());
		auto storeFileName = parser.isSet(storeOption) ? parser.value(storeOption) : instConf->deviceStoreFileName();
		auto store = cc.addNew<DeviceStore>(storeFileName, instConf->backupsFolder(), instConf->maxStoreDuration());
		auto & logger = multiLogger->mainLogger();
		cc.start();
		logger.log("castlink-store running on %1", storeFileName);
		auto numPruned = multiLogger->pruneOldLogs(static_cast<qint64>(instConf->maxStoreDuration()));
		if (numPruned > 0)
		{
			logger.log("Removed %1 old log files", numPruned);
		}

		bool hasModified = false;
		if (parser.isSet(maxAgeOption))
		{
			bool isOK = false;
			auto maxAge = parser.value(maxAgeOption).toDouble(&isOK);
			if (!isOK || (maxAge <= 0))
			{
				err << QCoreApplication::translate("main", "Invalid --max-age value: %1").arg(parser.value(maxAgeOption)) << "\n";
				return 1;
			}
			store->setMaxStoreDuration(maxAge);
			hasModified = true;
		}
		if (parser.isSet(removeOption))
		{
			auto uuid = parser.value(removeOption);
			if (!store->removeDeviceWithUuid(uuid))
			{
				err << QCoreApplication::translate("main", "No stored device has a service %1.").arg(uuid) << "\n";
				return 1;
			}
			hasModified = true;
		}
		if (parser.isSet(clearOption))
		{
			store->removeAll();
			hasModified = true;
		}
		if (parser.isSet(listOption) || !hasModified)
		{
			listDevices(store->storedDevices(), out);
		}

		logger.log("Done.");
		multiLogger->flushAllLogs();
		return 0;
	}
	catch (const Exception & exc)
	{
		err << QCoreApplication::translate("main", "castlink-store: fatal error: %1").arg(exc.message()) << "\n";
		return 1;
	}
	catch (const std::exception & exc)
	{
		err << QCoreApplication::translate("main", "castlink-store: fatal error: %1").arg(exc.what()) << "\n";
		return 1;
	}
}
