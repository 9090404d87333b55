#include "querycommand.h"
#include "queryescape.h"

#include <algorithm>

namespace {

// Parameter keys whose values never appear in logs
bool isCredentialKey(const QString &key)
{
    return key == QLatin1String("client_login_password")
           || key == QLatin1String("cpw")
           || key == QLatin1String("apikey")
           || key == QLatin1String("password");
}

} // namespace

QueryCommand::QueryCommand(const QString &verb)
    : verb_(verb)
{
}

QueryCommand &QueryCommand::withOption(const QString &option)
{
    if (!options_.contains(option)) {
        options_.append(option);
    }
    return *this;
}

QueryCommand &QueryCommand::withParam(const QString &key, const QString &value)
{
    return setParam(key, QStringList{value}, false);
}

QueryCommand &QueryCommand::withParam(const QString &key, const char *value)
{
    return setParam(key, QStringList{QString::fromUtf8(value)}, false);
}

QueryCommand &QueryCommand::withParam(const QString &key, int value)
{
    return setParam(key, QStringList{QString::number(value)}, false);
}

QueryCommand &QueryCommand::withParam(const QString &key, qint64 value)
{
    return setParam(key, QStringList{QString::number(value)}, false);
}

QueryCommand &QueryCommand::withParam(const QString &key, const QStringList &values)
{
    return setParam(key, values, true);
}

QueryCommand &QueryCommand::withParam(const QString &key, const QList<int> &values)
{
    QStringList strings;
    strings.reserve(values.size());
    for (int value : values) {
        strings.append(QString::number(value));
    }
    return setParam(key, strings, true);
}

QueryCommand &QueryCommand::withFlag(const QString &key, bool value)
{
    return setParam(key, QStringList{value ? QStringLiteral("1") : QStringLiteral("0")}, false);
}

QueryCommand &QueryCommand::setParam(const QString &key, const QStringList &values, bool sequence)
{
    for (Param &param : params_) {
        if (param.key == key) {
            param.values = values;
            param.sequence = sequence;
            return *this;
        }
    }
    params_.append(Param{key, values, sequence});
    return *this;
}

QStringList QueryCommand::paramKeys() const
{
    QStringList keys;
    for (const Param &param : params_) {
        keys.append(param.key);
    }
    return keys;
}

bool QueryCommand::hasParam(const QString &key) const
{
    return std::any_of(params_.cbegin(), params_.cend(),
                       [&key](const Param &param) { return param.key == key; });
}

QStringList QueryCommand::paramValues(const QString &key) const
{
    for (const Param &param : params_) {
        if (param.key == key) {
            return param.values;
        }
    }
    return {};
}

int QueryCommand::segmentCount() const
{
    int count = 1;
    for (const Param &param : params_) {
        if (param.sequence) {
            count = std::max(count, static_cast<int>(param.values.size()));
        }
    }
    return count;
}

bool QueryCommand::isValid() const
{
    if (!QueryEscape::isValidIdentifier(verb_)) {
        return false;
    }
    for (const QString &option : options_) {
        if (!QueryEscape::isValidIdentifier(option)) {
            return false;
        }
    }
    for (const Param &param : params_) {
        if (!QueryEscape::isValidIdentifier(param.key)) {
            return false;
        }
    }
    return true;
}

QString QueryCommand::encode() const
{
    return encodeWith(false);
}

QString QueryCommand::traceString() const
{
    return encodeWith(true);
}

QString QueryCommand::encodeWith(bool maskCredentials) const
{
    QString line = verb_;
    for (const QString &option : options_) {
        line += QStringLiteral(" -") + option;
    }

    const int segments = segmentCount();
    QStringList encodedSegments;

    for (int i = 0; i < segments; ++i) {
        QStringList fields;
        for (const Param &param : params_) {
            QString value;
            if (param.sequence) {
                if (i >= param.values.size()) {
                    continue;  // Shorter sequence: key omitted from later segments
                }
                value = param.values.at(i);
            } else if (!param.values.isEmpty()) {
                value = param.values.first();
            }

            if (maskCredentials && isCredentialKey(param.key)) {
                fields.append(param.key + QStringLiteral("=****"));
            } else {
                fields.append(param.key + QLatin1Char('=') + QueryEscape::escape(value));
            }
        }
        encodedSegments.append(fields.join(QLatin1Char(' ')));
    }

    QString body = encodedSegments.join(QLatin1Char('|'));
    if (!body.isEmpty()) {
        line += QLatin1Char(' ') + body;
    }
    return line;
}

QueryCommand QueryCommand::fromArguments(const QStringList &tokens)
{
    QueryCommand command;
    if (tokens.isEmpty()) {
        return command;
    }

    command.verb_ = tokens.first();

    for (int i = 1; i < tokens.size(); ++i) {
        const QString &token = tokens.at(i);
        if (token.startsWith(QLatin1Char('-'))) {
            command.withOption(token.mid(1));
            continue;
        }

        int eq = token.indexOf(QLatin1Char('='));
        QString key = eq < 0 ? token : token.left(eq);
        QString value = eq < 0 ? QString() : token.mid(eq + 1);

        if (!command.hasParam(key)) {
            command.withParam(key, value);
        } else {
            // Second occurrence turns the key into a pipelined parameter
            QStringList values = command.paramValues(key);
            values.append(value);
            command.withParam(key, values);
        }
    }
    return command;
}

bool QueryCommand::operator==(const QueryCommand &other) const
{
    return verb_ == other.verb_ && options_ == other.options_ && params_ == other.params_;
}
