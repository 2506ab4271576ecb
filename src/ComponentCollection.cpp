#include "ComponentCollection.hpp"
#include <algorithm>
#include <set>
#include <QStringList>
#include "MultiLogger.hpp"





ComponentCollection::ComponentCollection():
	mIsStarted(false)
{
}





ComponentCollection::~ComponentCollection()
{
	std::vector<ComponentBasePtr> order;
	try
	{
		order = componentsInStartOrder();
	}
	catch (const LogicError &)
	{
		// The requirements were never satisfiable, so nothing was started; any release order will do
		mComponents.clear();
		return;
	}
	mComponents.clear();
	while (!order.empty())
	{
		order.pop_back();
	}
}





QString ComponentCollection::kindName(ComponentCollection::ComponentKind aKind)
{
	switch (aKind)
	{
		case ckInstallConfiguration: return QString("InstallConfiguration");
		case ckMultiLogger:          return QString("MultiLogger");
		case ckConnectionFactory:    return QString("ConnectionFactory");
		case ckDeviceStore:          return QString("DeviceStore");
		case ckDeviceMgr:            return QString("DeviceMgr");
	}
	return QString("<unknown component kind %1>").arg(static_cast<int>(aKind));
}





void ComponentCollection::start()
{
	if (mIsStarted)
	{
		throw LogicError("The components have already been started.");
	}
	auto order = componentsInStartOrder();
	QStringList names;
	for (const auto & component: order)
	{
		component->start();
		names.append(kindName(component->mKind));
	}
	mIsStarted = true;
	if (has(ckMultiLogger))
	{
		logger("main").log("Started components: %1", names.join(", "));
	}
}





Logger & ComponentCollection::logger(const QString & aName)
{
	return get<MultiLogger>()->logger(aName);
}





void ComponentCollection::addComponent(
	ComponentCollection::ComponentKind aKind,
	ComponentCollection::ComponentBasePtr aComponent
)
{
	if (aComponent == nullptr)
	{
		throw LogicError("Cannot add an empty %1 component", kindName(aKind));
	}
	if (mComponents.find(aKind) != mComponents.end())
	{
		throw LogicError("A %1 component is already present", kindName(aKind));
	}
	mComponents[aKind] = aComponent;
}





ComponentCollection::ComponentBasePtr ComponentCollection::get(ComponentCollection::ComponentKind aKind)
{
	auto itr = mComponents.find(aKind);
	if (itr == mComponents.end())
	{
		throw LogicError("There's no %1 component", kindName(aKind));
	}
	return itr->second;
}





void ComponentCollection::requireForStart(
	ComponentCollection::ComponentKind aThisComponent,
	ComponentCollection::ComponentKind aRequiredComponent
)
{
	if (mIsStarted)
	{
		throw LogicError("Cannot add a start requirement for %1, the components are already started.", kindName(aThisComponent));
	}
	if (aThisComponent == aRequiredComponent)
	{
		throw LogicError("The %1 component cannot require itself", kindName(aThisComponent));
	}
	auto & required = mStartRequirements[aThisComponent];
	if (std::find(required.begin(), required.end(), aRequiredComponent) == required.end())
	{
		required.push_back(aRequiredComponent);
	}
}





std::vector<ComponentCollection::ComponentBasePtr> ComponentCollection::componentsInStartOrder()
{
	// Every requirement of a present component must be present as well:
	for (const auto & req: mStartRequirements)
	{
		if (mComponents.find(req.first) == mComponents.end())
		{
			continue;
		}
		for (const auto kind: req.second)
		{
			if (mComponents.find(kind) == mComponents.end())
			{
				throw LogicError("The %1 component requires %2, which is missing", kindName(req.first), kindName(kind));
			}
		}
	}

	// Repeatedly pick the components whose requirements have all been picked already:
	std::vector<ComponentBasePtr> res;
	std::set<ComponentKind> picked;
	while (res.size() < mComponents.size())
	{
		bool hasPicked = false;
		for (const auto & comp: mComponents)
		{
			if (picked.find(comp.first) != picked.end())
			{
				continue;
			}
			const auto & required = mStartRequirements[comp.first];
			auto isSatisfied = std::all_of(required.begin(), required.end(),
				[&picked](ComponentKind aKind)
				{
					return (picked.find(aKind) != picked.end());
				}
			);
			if (!isSatisfied)
			{
				continue;
			}
			res.push_back(comp.second);
			picked.insert(comp.first);
			hasPicked = true;
		}
		if (!hasPicked)
		{
			QStringList unresolved;
			for (const auto & comp: mComponents)
			{
				if (picked.find(comp.first) == picked.end())
				{
					unresolved.append(kindName(comp.first));
				}
			}
			throw LogicError("Cyclic start requirements between components: %1", unresolved.join(", "));
		}
	}
	return res;
}
