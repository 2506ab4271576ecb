#pragma once

#include <functional>
#include <QString>
#include <QStringList>
#include <QMetaType>





/** The capability directory.
A capability is a dot-delimited hierarchical name, such as "Launcher.App" or "VolumeControl.Mute.Set".
A query may end in the wildcard segment "Any", such as "Launcher.Any"; it then matches every capability
that starts with the segments preceding the wildcard. A bare "Any" matches everything.
The first segment of a capability names the capability interface (group) that implements it. */
namespace Capability
{





/** The closed set of capability interfaces that a Connection may implement. */
enum Interface
{
	ciLauncher,
	ciMediaPlayer,
	ciMediaControl,
	ciVolumeControl,
	ciTVControl,
	ciKeyControl,
	ciTextInputControl,
	ciMouseControl,
	ciPowerControl,
	ciToastControl,
	ciWebAppLauncher,
	ciExternalInputControl,
	ciUnknown,  ///< Not a known interface; also the count of the known interfaces
};


/** The priority levels used by Connections when reporting how well they implement an interface.
When multiple Connections on one Device implement the same interface, the highest priority wins. */
enum PriorityLevel
{
	plNotSupported = 0,
	plVeryLow = 1,
	plLow = 25,
	plNormal = 50,
	plHigh = 75,
	plVeryHigh = 100,
};


/** Generic handlers used by the asynchronous capability interface functions. */
using SuccessHandler = std::function<void()>;
using FailureHandler = std::function<void(const QString & aErrorMessage)>;


/** The wildcard segment. */
extern const QString Any;

/** Returns true if the advertised capability satisfies the query.
Either the strings are equal, or the query ends in the wildcard segment and the advertised capability
has all of the query's preceding segments as its leading segments. */
bool matches(const QString & aQuery, const QString & aAdvertised);

/** Returns true if any of the advertised capabilities satisfies the query. */
bool hasCapability(const QStringList & aAdvertised, const QString & aQuery);

/** Returns true if every query is satisfied by at least one advertised capability.
An empty query list is satisfied trivially. */
bool hasAll(const QStringList & aAdvertised, const QStringList & aQueries);

/** Returns true if at least one query is satisfied by an advertised capability. */
bool hasAny(const QStringList & aAdvertised, const QStringList & aQueries);

/** Returns the interface implementing the specified capability (by its first segment).
Returns ciUnknown for capabilities outside of the known groups, including the bare wildcard. */
Interface interfaceFromCapability(const QString & aCapability);

/** Returns the name of the interface, which is also the first segment of all its capabilities. */
QString interfaceName(Interface aInterface);

/** Returns the wildcard query matching all capabilities of the specified interface ("<Name>.Any"). */
QString anyOf(Interface aInterface);

}  // namespace Capability

Q_DECLARE_METATYPE(Capability::Interface);
