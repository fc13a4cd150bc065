#include "core/ValueCoercion.h"

#include "core/JsonCodec.h"

#include <QDebug>
#include <QRegularExpression>
#include <cmath>
#include <limits>

namespace ValueCoercion {
namespace {
using Attempt = bool (*)(const QString &raw, const QString &trimmed, JsonValue *out);

bool parseJson(const QString &raw, const QString &, JsonValue *out)
{
    return JsonCodec::parse(raw.toUtf8(), out);
}

bool parseQuotedString(const QString &, const QString &trimmed, JsonValue *out)
{
    if (!trimmed.startsWith('"') || !trimmed.endsWith('"')) {
        return false;
    }
    JsonValue parsed;
    if (!JsonCodec::parse(trimmed.toUtf8(), &parsed) || !parsed.isString()) {
        return false;
    }
    *out = parsed;
    return true;
}

bool parseNull(const QString &, const QString &trimmed, JsonValue *out)
{
    if (trimmed != QLatin1String("null")) {
        return false;
    }
    *out = JsonValue();
    return true;
}

bool parseBoolean(const QString &, const QString &trimmed, JsonValue *out)
{
    if (trimmed == QLatin1String("true")) {
        *out = JsonValue(true);
        return true;
    }
    if (trimmed == QLatin1String("false")) {
        *out = JsonValue(false);
        return true;
    }
    return false;
}

bool parsePrefixedInteger(const QString &trimmed, JsonValue *out)
{
    static const QRegularExpression prefixed(QStringLiteral("^0([xXoObB])([0-9a-fA-F]+)$"));
    QRegularExpressionMatch match = prefixed.match(trimmed);
    if (!match.hasMatch()) {
        return false;
    }
    const QChar radixChar = match.captured(1).at(0).toLower();
    int base = radixChar == 'x' ? 16 : (radixChar == 'o' ? 8 : 2);
    bool ok = false;
    qint64 value = match.captured(2).toLongLong(&ok, base);
    if (!ok) {
        return false;
    }
    *out = JsonValue(value);
    return true;
}

// A well-formed decimal that toDouble() still rejects is out of range; it is an
// underflow when its leading significant digit sits below the units place.
bool isUnderflow(const QString &whole, const QString &fraction, const QString &exponent)
{
    qint64 scale = 0;
    if (!exponent.isEmpty()) {
        bool ok = false;
        scale = exponent.mid(1).toLongLong(&ok);
        if (!ok) {
            scale = exponent.at(1) == '-' ? -std::numeric_limits<int>::max()
                                          : std::numeric_limits<int>::max();
        }
    }
    int firstDigit = 0;
    while (firstDigit < whole.size() && whole.at(firstDigit) == '0') {
        ++firstDigit;
    }
    if (firstDigit < whole.size()) {
        return scale + (whole.size() - firstDigit) - 1 < 0;
    }
    int leadingZeros = 0;
    while (leadingZeros < fraction.size() && fraction.at(leadingZeros) == '0') {
        ++leadingZeros;
    }
    if (leadingZeros == fraction.size()) {
        return false;
    }
    return scale - leadingZeros - 1 < 0;
}

bool parseNumber(const QString &, const QString &trimmed, JsonValue *out)
{
    if (trimmed.isEmpty()) {
        return false;
    }
    if (parsePrefixedInteger(trimmed, out)) {
        return true;
    }

    static const QRegularExpression decimal(
        QStringLiteral("^([+-]?)([0-9]*)(?:\\.([0-9]*))?([eE][+-]?[0-9]+)?$"));
    QRegularExpressionMatch match = decimal.match(trimmed);
    if (!match.hasMatch()) {
        return false;
    }
    const QString sign = match.captured(1) == QLatin1String("-") ? QStringLiteral("-") : QString();
    const QString whole = match.captured(2);
    const QString fraction = match.captured(3);
    const QString exponent = match.captured(4);
    const bool hasPoint = trimmed.contains('.');
    if (whole.isEmpty() && fraction.isEmpty()) {
        return false;
    }

    bool ok = false;
    if (!hasPoint && exponent.isEmpty()) {
        qint64 value = (sign + whole).toLongLong(&ok);
        if (ok) {
            *out = JsonValue(value);
            return true;
        }
    }

    // Spell out the forms JSON leaves out (".5", "5.") before converting.
    QString canonical = sign + (whole.isEmpty() ? QStringLiteral("0") : whole) + '.'
                        + (fraction.isEmpty() ? QStringLiteral("0") : fraction) + exponent;
    double value = canonical.toDouble(&ok);
    if (!ok) {
        if (!isUnderflow(whole, fraction, exponent)) {
            return false;
        }
        value = sign.isEmpty() ? 0.0 : -0.0;
    }
    if (!std::isfinite(value)) {
        return false;
    }
    *out = JsonValue(value);
    return true;
}

bool keepBareString(const QString &, const QString &trimmed, JsonValue *out)
{
    *out = JsonValue(trimmed);
    return true;
}

struct Step {
    Interpretation interpretation;
    Attempt attempt;
};

const Step kSteps[] = {
    {Interpretation::Json, parseJson},
    {Interpretation::QuotedString, parseQuotedString},
    {Interpretation::Null, parseNull},
    {Interpretation::Boolean, parseBoolean},
    {Interpretation::Number, parseNumber},
    {Interpretation::BareString, keepBareString},
};
}

Result interpret(const QString &text)
{
    const QString trimmed = text.trimmed();
    Result result;
    for (const Step &step : kSteps) {
        JsonValue value;
        if (step.attempt(text, trimmed, &value)) {
            result.value = value;
            result.interpretation = step.interpretation;
            break;
        }
    }
    qDebug() << "ValueCoercion::interpret" << interpretationName(result.interpretation)
             << JsonValue::typeName(result.value.type());
    return result;
}

JsonValue coerce(const QString &text)
{
    return interpret(text).value;
}

QString interpretationName(Interpretation interpretation)
{
    switch (interpretation) {
    case Interpretation::Json:
        return QStringLiteral("json");
    case Interpretation::QuotedString:
        return QStringLiteral("quoted-string");
    case Interpretation::Null:
        return QStringLiteral("null");
    case Interpretation::Boolean:
        return QStringLiteral("boolean");
    case Interpretation::Number:
        return QStringLiteral("number");
    case Interpretation::BareString:
        return QStringLiteral("bare-string");
    }
    return QString();
}
}
