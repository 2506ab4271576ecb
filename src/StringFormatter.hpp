#pragma once

#include <QString>
#include <QStringList>
#include <QDebug>





/** Provides functions for formatting strings using QString::arg()-style placeholders (%1 .. %99),
but the arguments are stringified using QDebug.
This enables us to output many more custom types very simply. */
namespace StringFormatter
{





/** Simple wrapper over QDebug that requires an output string and sets the underlying QDebug to nospace, noquote. */
class Debug:
	public QDebug
{
	using Super = QDebug;


public:

	Debug(QString * aOutput):
		Super(aOutput)
	{
		nospace();
		noquote();
	}
};





/** Replaces each %N placeholder in the format string with the N-th (1-based) string from aArgs.
Placeholders that have no corresponding argument are left untouched.
Substituted text is never re-scanned for placeholders. */
QString formatList(const QString & aFormatString, const QStringList & aArgs);





namespace Detail
{
	inline void appendArgs(QStringList & aDest)
	{
		Q_UNUSED(aDest);
	}

	template <typename ArgType, typename... OtherTypes>
	void appendArgs(QStringList & aDest, const ArgType & aArg, const OtherTypes &... aOtherArgs)
	{
		QString str;
		Debug(&str) << aArg;
		aDest.append(str);
		appendArgs(aDest, aOtherArgs...);
	}
}  // namespace Detail





inline QString format(const QString & aFormatString)
{
	return aFormatString;
}





/** Returns the format string with all the arguments stringified and substituted. */
template <typename... ArgTypes>
QString format(const QString & aFormatString, const ArgTypes &... aArgs)
{
	QStringList args;
	Detail::appendArgs(args, aArgs...);
	return formatList(aFormatString, args);
}

}  // namespace StringFormatter
