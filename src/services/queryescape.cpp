#include "queryescape.h"

namespace {

// Returns the mnemonic letter for a character that must be escaped, or a
// null QChar if it passes through unchanged.
QChar mnemonicFor(QChar c)
{
    switch (c.unicode()) {
    case '\\': return QLatin1Char('\\');
    case '/':  return QLatin1Char('/');
    case ' ':  return QLatin1Char('s');
    case '|':  return QLatin1Char('p');
    case '\a': return QLatin1Char('a');
    case '\b': return QLatin1Char('b');
    case '\f': return QLatin1Char('f');
    case '\n': return QLatin1Char('n');
    case '\r': return QLatin1Char('r');
    case '\t': return QLatin1Char('t');
    case '\v': return QLatin1Char('v');
    default:   return QChar();
    }
}

QChar characterFor(QChar mnemonic)
{
    switch (mnemonic.unicode()) {
    case '\\': return QLatin1Char('\\');
    case '/':  return QLatin1Char('/');
    case 's':  return QLatin1Char(' ');
    case 'p':  return QLatin1Char('|');
    case 'a':  return QLatin1Char('\a');
    case 'b':  return QLatin1Char('\b');
    case 'f':  return QLatin1Char('\f');
    case 'n':  return QLatin1Char('\n');
    case 'r':  return QLatin1Char('\r');
    case 't':  return QLatin1Char('\t');
    case 'v':  return QLatin1Char('\v');
    default:   return QChar();
    }
}

} // namespace

QString QueryEscape::escape(const QString &raw)
{
    QString wire;
    wire.reserve(raw.size() + raw.size() / 4);

    for (QChar c : raw) {
        QChar mnemonic = mnemonicFor(c);
        if (mnemonic.isNull()) {
            wire.append(c);
        } else {
            wire.append(QLatin1Char('\\'));
            wire.append(mnemonic);
        }
    }
    return wire;
}

bool QueryEscape::unescape(const QString &wire, QString &raw)
{
    QString result;
    result.reserve(wire.size());

    for (int i = 0; i < wire.size(); ++i) {
        QChar c = wire.at(i);
        if (c != QLatin1Char('\\')) {
            result.append(c);
            continue;
        }
        if (i + 1 >= wire.size()) {
            return false;  // Trailing lone backslash
        }
        QChar decoded = characterFor(wire.at(i + 1));
        if (decoded.isNull()) {
            return false;
        }
        result.append(decoded);
        ++i;
    }

    raw = result;
    return true;
}

bool QueryEscape::isValidIdentifier(const QString &name)
{
    if (name.isEmpty()) {
        return false;
    }
    for (QChar c : name) {
        const char16_t u = c.unicode();
        bool ok = (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z')
                  || (u >= '0' && u <= '9') || u == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}
