#pragma once

#include <memory>
#include <map>
#include <vector>
#include <QString>
#include "Exception.hpp"





// fwd:
class Logger;





/** Owns the long-lived application objects (install configuration, loggers, protocol registry,
device store, device manager), at most one of each kind.
Each component gets the collection in its constructor and looks up its peers through get<>() when needed.
The owner adds all the components, then calls start(), which starts them so that every component's
requirements (declared via requireForStart() in its constructor) are started before it:
	ComponentCollection cc;
	cc.addNew<MultiLogger>(logsFolder);
	auto store = cc.addNew<DeviceStore>(fileName, backupsFolder, maxDuration);
	cc.start();
*/
class ComponentCollection
{
public:

	/** Specifies the kind of the individual component. */
	enum ComponentKind
	{
		ckInstallConfiguration,  ///< Locations of the data, logs and store files
		ckMultiLogger,           ///< The per-subsystem logger
		ckConnectionFactory,     ///< The registry of the protocol (Connection) classes
		ckDeviceStore,           ///< The persisted list of previously connected devices
		ckDeviceMgr,             ///< The live registry of logical devices
	};


protected:

	/** The common base of all the components, so that they can be stored in a single map. */
	class ComponentBase
	{
		friend class ::ComponentCollection;

	public:

		ComponentBase(ComponentKind aKind, ComponentCollection & aComponents):
			mKind(aKind),
			mComponents(aComponents)
		{
		}

		virtual ~ComponentBase() {}

		/** Called by ComponentCollection::start(), after all the required components have been started. */
		virtual void start() = 0;

		/** Declares that aRequiredComponent must be started before this component.
		Throws a LogicError once the collection has been started. */
		inline void requireForStart(ComponentKind aRequiredComponent)
		{
			mComponents.requireForStart(mKind, aRequiredComponent);
		}


	protected:

		ComponentKind mKind;

		/** The owning collection, for looking up the peer components. */
		ComponentCollection & mComponents;
	};

	using ComponentBasePtr = std::shared_ptr<ComponentBase>;


public:

	/** The base for the concrete components; provides the static kind() used by the typed accessors. */
	template <ComponentKind tKind>
	class Component:
		public ComponentBase
	{
	public:
		Component(ComponentCollection & aComponents):
			ComponentBase(tKind, aComponents)
		{
		}

		static ComponentKind kind() { return tKind; }
	};



	/** Creates a new empty collection. */
	ComponentCollection();

	/** Releases the components in the reverse of their start order, so that each component
	still has its requirements (such as the MultiLogger) available while being destroyed. */
	~ComponentCollection();

	/** Returns the human-readable name of the component kind, used in logs and error messages. */
	static QString kindName(ComponentKind aKind);

	/** Adds the specified component into the collection.
	Throws a LogicError if a component of the same kind already exists. */
	template <typename ComponentClass>
	void addComponent(std::shared_ptr<ComponentClass> aComponent)
	{
		addComponent(ComponentClass::kind(), aComponent);
	}

	/** Creates a new component of the specified template type,
	adds it to the collection and returns a shared ptr to it.
	Throws a LogicError if a component of the same kind already exists. */
	template <typename ComponentClass, typename... Args>
	std::shared_ptr<ComponentClass> addNew(Args &&... aArgs)
	{
		auto res = std::make_shared<ComponentClass>(*this, std::forward<Args>(aArgs)...);
		addComponent(ComponentClass::kind(), res);
		return res;
	}

	/** Returns the component of the specified class.
	Throws a LogicError if there's no such component.
	Usage: auto store = mComponents.get<DeviceStore>(); */
	template <typename ComponentClass>
	std::shared_ptr<ComponentClass> get()
	{
		return std::dynamic_pointer_cast<ComponentClass>(get(ComponentClass::kind()));
	}

	/** Returns true if a component of the specified kind is present. */
	bool has(ComponentKind aKind) const { return (mComponents.find(aKind) != mComponents.end()); }

	/** Starts all the components, in a topological order.
	Throws a LogicError if a required component is missing or the requirements are cyclic. */
	void start();

	/** Returns true once start() has finished. */
	bool isStarted() const { return mIsStarted; }

	/** Returns a logger for the specified subsystem name.
	Requires the MultiLogger component to be present. */
	Logger & logger(const QString & aName);


protected:

	/** The collection of all components. */
	std::map<ComponentKind, ComponentBasePtr> mComponents;

	/** The requirements for starting the individual components.
	Map of ComponentKind (to be started) -> vector of ComponentKind (needs to be already running). */
	std::map<ComponentKind, std::vector<ComponentKind>> mStartRequirements;

	/** Indicates whether start() has been called. */
	bool mIsStarted;


	/** Adds the specified component into the collection.
	Client code should use the templated version, this is its actual implementation. */
	void addComponent(ComponentKind aKind, ComponentBasePtr aComponent);

	/** Returns the component of the specified kind, as a base pointer.
	Clients should use the templated get() instead (which calls this internally). */
	ComponentBasePtr get(ComponentKind aKind);

	/** Requests that the aRequiredComponent be started before aThisComponent. */
	void requireForStart(ComponentKind aThisComponent, ComponentKind aRequiredComponent);

	/** Returns the mComponents in the order in which they should be started.
	Throws a LogicError if the start order cannot be constructed (due to cycles or missing components). */
	std::vector<ComponentBasePtr> componentsInStartOrder();
};
