#include "queryeventclassifier.h"
#include "queryresponse.h"

QueryEventClassifier::QueryEventClassifier()
    : eventPrefixes_{QString::fromLatin1(DefaultEventPrefix)}
{
}

void QueryEventClassifier::addEventPrefix(const QString &prefix)
{
    if (!prefix.isEmpty() && !eventPrefixes_.contains(prefix)) {
        eventPrefixes_.append(prefix);
    }
}

QueryEventClassifier::LineKind QueryEventClassifier::classify(const QString &line,
                                                              bool responseInFlight) const
{
    const QString token = QueryResponseParser::leadingToken(line);

    for (const QString &prefix : eventPrefixes_) {
        if (token.startsWith(prefix)) {
            return LineKind::Event;
        }
    }

    if (token == QLatin1String(StatusToken)) {
        return LineKind::Status;
    }

    return responseInFlight ? LineKind::ResponseData : LineKind::Event;
}
