#include "valuecodec.h"

#include <QMetaType>

#include <cmath>
#include <optional>

namespace {

using namespace hmbridge;

bool isIntegralType(const QVariant &value)
{
    switch (value.typeId()) {
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
        return true;
    default:
        return false;
    }
}

std::optional<double> numericValue(const QVariant &value)
{
    if (isIntegralType(value) || value.typeId() == QMetaType::Double)
        return value.toDouble();
    if (value.typeId() == QMetaType::QString || value.typeId() == QMetaType::QByteArray) {
        bool ok = false;
        const double parsed = value.toString().trimmed().toDouble(&ok);
        if (ok)
            return parsed;
    }
    return std::nullopt;
}

std::optional<qint64> integralCode(const QVariant &value)
{
    if (isIntegralType(value))
        return value.toLongLong();
    if (value.typeId() == QMetaType::Double) {
        const double raw = value.toDouble();
        if (std::isfinite(raw) && std::floor(raw) == raw)
            return static_cast<qint64>(raw);
        return std::nullopt;
    }
    if (value.typeId() == QMetaType::QString || value.typeId() == QMetaType::QByteArray) {
        bool ok = false;
        const qint64 parsed = value.toString().trimmed().toLongLong(&ok);
        if (ok)
            return parsed;
    }
    return std::nullopt;
}

std::optional<bool> boolFromText(const QString &text)
{
    const QString key = text.trimmed().toLower();
    if (key == QStringLiteral("on") || key == QStringLiteral("true") || key == QStringLiteral("1"))
        return true;
    if (key == QStringLiteral("off") || key == QStringLiteral("false") || key == QStringLiteral("0"))
        return false;
    return std::nullopt;
}

bool withinRange(const ValueDomain &domain, double value)
{
    const double span = std::fabs(domain.maxValue - domain.minValue);
    const double epsilon = 1e-9 * (span > 1.0 ? span : 1.0);
    return value >= domain.minValue - epsilon && value <= domain.maxValue + epsilon;
}

QString rangeText(const ValueDomain &domain)
{
    return QStringLiteral("%1..%2").arg(domain.minValue).arg(domain.maxValue);
}

}

namespace hmbridge {

bool normalizeRawValue(const DatapointSpec &spec,
                       const QVariant &raw,
                       QVariant &normalized,
                       QString &errorString)
{
    errorString.clear();
    const ValueDomain &domain = spec.domain;

    switch (domain.kind) {
    case ValueKind::Bool: {
        if (raw.typeId() == QMetaType::Bool) {
            normalized = raw.toBool();
            return true;
        }
        if (raw.typeId() == QMetaType::QString) {
            const std::optional<bool> parsed = boolFromText(raw.toString());
            if (parsed) {
                normalized = *parsed;
                return true;
            }
        } else {
            const std::optional<qint64> code = integralCode(raw);
            if (code && (*code == 0 || *code == 1)) {
                normalized = (*code == 1);
                return true;
            }
        }
        errorString = QStringLiteral("%1: expected boolean, got %2").arg(spec.key, raw.toString());
        return false;
    }
    case ValueKind::Enum: {
        const std::optional<qint64> code = integralCode(raw);
        if (!code || *code < 0 || *code >= domain.enumLabels.size()) {
            errorString = QStringLiteral("%1: unexpected enumeration code %2").arg(spec.key, raw.toString());
            return false;
        }
        normalized = domain.enumLabels.at(static_cast<qsizetype>(*code));
        return true;
    }
    case ValueKind::Number: {
        const std::optional<double> value = numericValue(raw);
        if (!value || !std::isfinite(*value)) {
            errorString = QStringLiteral("%1: expected number, got %2").arg(spec.key, raw.toString());
            return false;
        }
        const double scaled = *value * domain.rawScale;
        if (!withinRange(domain, scaled)) {
            errorString = QStringLiteral("%1: %2 outside %3").arg(spec.key).arg(scaled).arg(rangeText(domain));
            return false;
        }
        if (domain.decimals <= 0) {
            normalized = static_cast<qint64>(std::llround(scaled));
        } else {
            const double factor = std::pow(10.0, domain.decimals);
            normalized = std::round(scaled * factor) / factor;
        }
        return true;
    }
    }

    errorString = QStringLiteral("%1: unsupported value domain").arg(spec.key);
    return false;
}

QByteArray encodeStatePayload(const DatapointSpec &spec, const QVariant &normalized)
{
    switch (spec.domain.kind) {
    case ValueKind::Bool:
        return normalized.toBool() ? QByteArrayLiteral("ON") : QByteArrayLiteral("OFF");
    case ValueKind::Enum:
        return normalized.toString().toUtf8();
    case ValueKind::Number:
        if (spec.domain.decimals <= 0)
            return QByteArray::number(normalized.toLongLong());
        return QByteArray::number(normalized.toDouble(), 'g', 15);
    }
    return QByteArray();
}

bool decodeCommandPayload(const DatapointSpec &spec,
                          const QByteArray &payload,
                          QString &key,
                          QVariant &rawValue,
                          QString &errorString)
{
    errorString.clear();
    const QString text = QString::fromUtf8(payload).trimmed();

    if (!spec.commands.isEmpty()) {
        for (const CommandMapping &mapping : spec.commands) {
            if (mapping.label.compare(text, Qt::CaseInsensitive) != 0)
                continue;
            key = mapping.key;
            rawValue = mapping.rawValue;
            return true;
        }
        errorString = QStringLiteral("%1: invalid action '%2'").arg(spec.id, text);
        return false;
    }

    key = spec.key;
    const ValueDomain &domain = spec.domain;
    switch (domain.kind) {
    case ValueKind::Bool: {
        const std::optional<bool> parsed = boolFromText(text);
        if (!parsed) {
            errorString = QStringLiteral("%1: expected ON/OFF, got '%2'").arg(spec.id, text);
            return false;
        }
        rawValue = *parsed;
        return true;
    }
    case ValueKind::Enum: {
        for (int i = 0; i < domain.enumLabels.size(); ++i) {
            if (domain.enumLabels.at(i).compare(text, Qt::CaseInsensitive) == 0) {
                rawValue = i;
                return true;
            }
        }
        errorString = QStringLiteral("%1: unknown value '%2'").arg(spec.id, text);
        return false;
    }
    case ValueKind::Number: {
        bool ok = false;
        const double value = text.toDouble(&ok);
        if (!ok || !std::isfinite(value)) {
            errorString = QStringLiteral("%1: invalid number '%2'").arg(spec.id, text);
            return false;
        }
        if (!withinRange(domain, value)) {
            errorString = QStringLiteral("%1: %2 outside %3").arg(spec.id).arg(value).arg(rangeText(domain));
            return false;
        }
        const double scale = domain.rawScale != 0.0 ? domain.rawScale : 1.0;
        rawValue = value / scale;
        return true;
    }
    }

    errorString = QStringLiteral("%1: unsupported value domain").arg(spec.id);
    return false;
}

} // namespace hmbridge
