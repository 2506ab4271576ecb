#include "ConnectionFactory.hpp"
#include <QMutexLocker>





ConnectionFactory::ConnectionFactory(ComponentCollection & aComponents):
	Super(aComponents)
{
}





void ConnectionFactory::registerClass(
	const QString & aClassName,
	const ConnectionFactory::DiscoveryParameters & aParams,
	ConnectionFactory::Creator aCreator
)
{
	QMutexLocker lock(&mMtx);
	if (findRegistration(aClassName) != nullptr)
	{
		throw DuplicateClassError("Connection class %1 is already registered", aClassName);
	}
	mRegistrations.push_back({aClassName, aParams, std::move(aCreator)});
}





bool ConnectionFactory::hasClass(const QString & aClassName) const
{
	QMutexLocker lock(&mMtx);
	return (findRegistration(aClassName) != nullptr);
}





ConnectionPtr ConnectionFactory::create(
	const QString & aClassName,
	Logger & aLogger,
	const ServiceDescription & aDescription,
	const ServiceConfig & aConfig
) const
{
	Creator creator;
	{
		QMutexLocker lock(&mMtx);
		auto reg = findRegistration(aClassName);
		if (reg == nullptr)
		{
			lock.unlock();
			qWarning() << "Cannot create a connection of unknown class " << aClassName;
			return nullptr;
		}
		creator = reg->mCreator;
	}
	return creator(aLogger, aDescription, aConfig);
}





QString ConnectionFactory::classForServiceID(const QString & aServiceID) const
{
	QMutexLocker lock(&mMtx);
	for (const auto & reg: mRegistrations)
	{
		if (reg.mParams.mServiceID == aServiceID)
		{
			return reg.mClassName;
		}
	}
	return QString();
}





std::vector<ConnectionFactory::DiscoveryParameters> ConnectionFactory::discoveryParameters() const
{
	std::vector<DiscoveryParameters> res;
	QMutexLocker lock(&mMtx);
	for (const auto & reg: mRegistrations)
	{
		res.push_back(reg.mParams);
	}
	return res;
}





const ConnectionFactory::Registration * ConnectionFactory::findRegistration(const QString & aClassName) const
{
	for (const auto & reg: mRegistrations)
	{
		if (reg.mClassName == aClassName)
		{
			return &reg;
		}
	}
	return nullptr;
}
