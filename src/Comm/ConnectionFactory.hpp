#pragma once

#include <functional>
#include <map>
#include <vector>
#include <QMutex>
#include <QStringList>
#include "../ComponentCollection.hpp"
#include "Connection.hpp"





/** The registry of the protocol implementations (Connection descendants).
Each protocol registers its class name, a creator function and the parameters that the discovery layer
needs in order to find the protocol's endpoints. The DeviceStore keeps the class name of each stored
service, the factory re-creates the Connection from it. */
class ConnectionFactory:
	public ComponentCollection::Component<ComponentCollection::ckConnectionFactory>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckConnectionFactory>;


public:

	/** The static descriptor of a protocol, consumed by the discovery layer to know what to scan for. */
	struct DiscoveryParameters
	{
		/** The protocol type name, matches ServiceDescription::mServiceID of the discovered endpoints. */
		QString mServiceID;

		/** The SSDP search target (or equivalent filter) that identifies the protocol's endpoints. */
		QString mFilter;

		/** The UPnP services that the endpoint must advertise for the protocol to be usable. */
		QStringList mRequiredServices;
	};


	/** The function that creates a new Connection instance for the protocol. */
	using Creator = std::function<ConnectionPtr(
		Logger & aLogger,
		const ServiceDescription & aDescription,
		const ServiceConfig & aConfig
	)>;


	class DuplicateClassError: public LogicError
	{
	public:
		using LogicError::LogicError;
	};


	explicit ConnectionFactory(ComponentCollection & aComponents);

	// ComponentCollection::ComponentBase overrides:
	virtual void start() override {}

	/** Registers a new protocol class.
	Throws a DuplicateClassError if a class of the same name is already registered. */
	void registerClass(const QString & aClassName, const DiscoveryParameters & aParams, Creator aCreator);

	/** Returns true if the specified class is registered. */
	bool hasClass(const QString & aClassName) const;

	/** Creates a new Connection of the specified class.
	Returns nullptr if the class is not registered. */
	ConnectionPtr create(
		const QString & aClassName,
		Logger & aLogger,
		const ServiceDescription & aDescription,
		const ServiceConfig & aConfig = ServiceConfig()
	) const;

	/** Returns the name of the class registered for the specified ServiceID.
	Returns an empty string if there's no such class. */
	QString classForServiceID(const QString & aServiceID) const;

	/** Returns the discovery parameters of all the registered protocols, in registration order. */
	std::vector<DiscoveryParameters> discoveryParameters() const;


protected:

	struct Registration
	{
		QString mClassName;
		DiscoveryParameters mParams;
		Creator mCreator;
	};


	/** All the registered classes, in registration order.
	Protected against multithreaded access by mMtx. */
	std::vector<Registration> mRegistrations;

	/** Protects mRegistrations against multithreaded access. */
	mutable QMutex mMtx;


	/** Returns the registration of the specified class, or nullptr if not registered.
	Expects mMtx to be locked by the caller. */
	const Registration * findRegistration(const QString & aClassName) const;
};
