#include "Capability.hpp"





namespace Capability
{





const QString Any("Any");

/** Names of the interfaces, indexed by the Interface enum. */
static const char * const gInterfaceNames[] =
{
	"Launcher",
	"MediaPlayer",
	"MediaControl",
	"VolumeControl",
	"TVControl",
	"KeyControl",
	"TextInputControl",
	"MouseControl",
	"PowerControl",
	"ToastControl",
	"WebAppLauncher",
	"ExternalInputControl",
};

static_assert(sizeof(gInterfaceNames) / sizeof(gInterfaceNames[0]) == ciUnknown, "Interface names out of sync with the enum");





bool matches(const QString & aQuery, const QString & aAdvertised)
{
	if (aQuery == aAdvertised)
	{
		return true;
	}

	// Wildcard: either the bare "Any", or "<prefix>.Any":
	if (aQuery == Any)
	{
		return true;
	}
	static const QString wildcardSuffix = "." + Any;
	if (!aQuery.endsWith(wildcardSuffix))
	{
		return false;
	}
	auto prefix = aQuery.left(aQuery.size() - wildcardSuffix.size());
	if (aAdvertised == prefix)
	{
		return true;
	}
	// Segment-wise prefix: "Launcher.App" matches "Launcher.App.Params", but not "Launcher.AppStore":
	return aAdvertised.startsWith(prefix + '.');
}





bool hasCapability(const QStringList & aAdvertised, const QString & aQuery)
{
	for (const auto & adv: aAdvertised)
	{
		if (matches(aQuery, adv))
		{
			return true;
		}
	}
	return false;
}





bool hasAll(const QStringList & aAdvertised, const QStringList & aQueries)
{
	for (const auto & query: aQueries)
	{
		if (!hasCapability(aAdvertised, query))
		{
			return false;
		}
	}
	return true;
}





bool hasAny(const QStringList & aAdvertised, const QStringList & aQueries)
{
	for (const auto & query: aQueries)
	{
		if (hasCapability(aAdvertised, query))
		{
			return true;
		}
	}
	return false;
}





Interface interfaceFromCapability(const QString & aCapability)
{
	auto firstSegment = aCapability.section('.', 0, 0);
	for (int i = 0; i < ciUnknown; ++i)
	{
		if (firstSegment == QLatin1String(gInterfaceNames[i]))
		{
			return static_cast<Interface>(i);
		}
	}
	return ciUnknown;
}





QString interfaceName(Interface aInterface)
{
	if ((aInterface < 0) || (aInterface >= ciUnknown))
	{
		return QString("Unknown");
	}
	return QString::fromLatin1(gInterfaceNames[aInterface]);
}





QString anyOf(Interface aInterface)
{
	if ((aInterface < 0) || (aInterface >= ciUnknown))
	{
		// Nothing may match an unknown interface; return a query that cannot be advertised:
		return QString();
	}
	return interfaceName(aInterface) + "." + Any;
}

}  // namespace Capability
