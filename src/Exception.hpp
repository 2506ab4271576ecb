#pragma once

#include <stdexcept>

#include <QString>

#include "Logger.hpp"





/** The base of all the exceptions that Castlink throws.
The message is built by StringFormatter from a format string and its arguments, and may also be written
into a log at the point where the error is detected, so that the log shows the failure in its context:
	throw RuntimeError(mLogger, "Cannot open %1: %2", fileName, f.errorString());
	throw LogicError("Unknown component kind %1", kind);
*/
class Exception:
	public std::runtime_error
{
public:

	/** Formats the message, writes it into aLogger and creates the exception. */
	template <typename... Args>
	Exception(Logger & aLogger, const QString & aFormatString, const Args &... aArgs):
		Exception(logged(aLogger, StringFormatter::format(aFormatString, aArgs...)))
	{
	}


	/** Formats the message and creates the exception, without logging. */
	template <typename... Args>
	Exception(const QString & aFormatString, const Args &... aArgs):
		Exception(PreformattedTag(), StringFormatter::format(aFormatString, aArgs...))
	{
	}


	/** Returns the message as a QString, without the round-trip through std::string. */
	const QString & message() const { return mMessage; }


protected:

	/** The formatted message. */
	QString mMessage;


	/** Distinguishes the actual constructor from the variadic formatting one. */
	struct PreformattedTag {};

	/** The actual constructor that all the public ones delegate to. */
	Exception(PreformattedTag, const QString & aMessage):
		std::runtime_error(aMessage.toStdString()),
		mMessage(aMessage)
	{
	}


	/** Wraps an already logged message so that it can be passed to the actual constructor. */
	struct LoggedMessage
	{
		QString mMessage;
	};

	Exception(LoggedMessage && aLogged):
		Exception(PreformattedTag(), aLogged.mMessage)
	{
	}


	/** Writes the message into the logger and returns it wrapped. */
	static LoggedMessage logged(Logger & aLogger, const QString & aMessage)
	{
		aLogger.log("Error: %1", aMessage);
		return LoggedMessage{aMessage};
	}
};





/** Errors caused by the environment: files, settings, remote peers. */
class RuntimeError: public Exception
{
public:
	using Exception::Exception;
};





/** Errors that indicate a bug in the calling code. */
class LogicError: public Exception
{
public:
	using Exception::Exception;
};
