#include "StringFormatter.hpp"





namespace StringFormatter
{





QString formatList(const QString & aFormatString, const QStringList & aArgs)
{
	QString res;
	res.reserve(aFormatString.size());
	const auto len = aFormatString.size();
	for (int idx = 0; idx < len; ++idx)
	{
		auto ch = aFormatString[idx];
		if ((ch != '%') || (idx + 1 >= len) || !aFormatString[idx + 1].isDigit())
		{
			res.append(ch);
			continue;
		}

		// Parse up to two digits of the placeholder number:
		int argNum = aFormatString[idx + 1].digitValue();
		int numDigits = 1;
		if ((idx + 2 < len) && aFormatString[idx + 2].isDigit())
		{
			auto twoDigitNum = argNum * 10 + aFormatString[idx + 2].digitValue();
			if (twoDigitNum <= aArgs.size())
			{
				argNum = twoDigitNum;
				numDigits = 2;
			}
		}
		if ((argNum < 1) || (argNum > aArgs.size()))
		{
			// No such argument, keep the placeholder verbatim:
			res.append(aFormatString.mid(idx, numDigits + 1));
		}
		else
		{
			res.append(aArgs[argNum - 1]);
		}
		idx += numDigits;
	}
	return res;
}

}  // namespace StringFormatter
