#include "xmlrpc.h"

#include <QDateTime>
#include <QStringList>
#include <QVariantMap>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

#include <limits>

namespace {

const QString kDateTimeFormat = QStringLiteral("yyyyMMdd'T'HH:mm:ss");

void writeValue(QXmlStreamWriter &xml, const QVariant &value)
{
    xml.writeStartElement(QStringLiteral("value"));
    switch (value.typeId()) {
    case QMetaType::Bool:
        xml.writeTextElement(QStringLiteral("boolean"), value.toBool() ? QStringLiteral("1") : QStringLiteral("0"));
        break;
    case QMetaType::Int:
    case QMetaType::Short:
    case QMetaType::UShort:
    case QMetaType::Char:
    case QMetaType::SChar:
    case QMetaType::UChar:
        xml.writeTextElement(QStringLiteral("i4"), QString::number(value.toInt()));
        break;
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::ULong:
    case QMetaType::LongLong:
    case QMetaType::ULongLong: {
        const qint64 v = value.toLongLong();
        if (v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max())
            xml.writeTextElement(QStringLiteral("i4"), QString::number(v));
        else
            xml.writeTextElement(QStringLiteral("i8"), QString::number(v));
        break;
    }
    case QMetaType::Double:
    case QMetaType::Float:
        xml.writeTextElement(QStringLiteral("double"), QString::number(value.toDouble(), 'g', 15));
        break;
    case QMetaType::QByteArray:
        xml.writeTextElement(QStringLiteral("base64"), QString::fromLatin1(value.toByteArray().toBase64()));
        break;
    case QMetaType::QDateTime:
        xml.writeTextElement(QStringLiteral("dateTime.iso8601"), value.toDateTime().toString(kDateTimeFormat));
        break;
    case QMetaType::QVariantList:
    case QMetaType::QStringList: {
        xml.writeStartElement(QStringLiteral("array"));
        xml.writeStartElement(QStringLiteral("data"));
        const QVariantList list = value.toList();
        for (const QVariant &item : list)
            writeValue(xml, item);
        xml.writeEndElement();
        xml.writeEndElement();
        break;
    }
    case QMetaType::QVariantMap:
    case QMetaType::QVariantHash: {
        xml.writeStartElement(QStringLiteral("struct"));
        const QVariantMap map = value.toMap();
        for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
            xml.writeStartElement(QStringLiteral("member"));
            xml.writeTextElement(QStringLiteral("name"), it.key());
            writeValue(xml, it.value());
            xml.writeEndElement();
        }
        xml.writeEndElement();
        break;
    }
    case QMetaType::UnknownType:
        xml.writeEmptyElement(QStringLiteral("nil"));
        break;
    default:
        xml.writeTextElement(QStringLiteral("string"), value.toString());
        break;
    }
    xml.writeEndElement();
}

bool fail(QXmlStreamReader &xml, QString &errorString, const QString &message)
{
    if (xml.hasError())
        errorString = QStringLiteral("XML error at line %1: %2").arg(xml.lineNumber()).arg(xml.errorString());
    else
        errorString = QStringLiteral("%1 at line %2").arg(message).arg(xml.lineNumber());
    return false;
}

bool readValue(QXmlStreamReader &xml, QVariant &out, QString &errorString);

bool readArray(QXmlStreamReader &xml, QVariant &out, QString &errorString)
{
    if (!xml.readNextStartElement() || xml.name() != QLatin1String("data"))
        return fail(xml, errorString, QStringLiteral("array without data"));

    QVariantList list;
    while (xml.readNextStartElement()) {
        if (xml.name() != QLatin1String("value"))
            return fail(xml, errorString, QStringLiteral("unexpected <%1> in array").arg(xml.name().toString()));
        QVariant item;
        if (!readValue(xml, item, errorString))
            return false;
        list.append(item);
    }
    if (xml.hasError())
        return fail(xml, errorString, QString());
    // </data> consumed; the next end element closes the array.
    if (xml.readNextStartElement())
        return fail(xml, errorString, QStringLiteral("unexpected <%1> after array data").arg(xml.name().toString()));
    out = list;
    return !xml.hasError() || fail(xml, errorString, QString());
}

bool readStruct(QXmlStreamReader &xml, QVariant &out, QString &errorString)
{
    QVariantMap map;
    while (xml.readNextStartElement()) {
        if (xml.name() != QLatin1String("member"))
            return fail(xml, errorString, QStringLiteral("unexpected <%1> in struct").arg(xml.name().toString()));
        QString name;
        QVariant value;
        bool hasName = false;
        bool hasValue = false;
        while (xml.readNextStartElement()) {
            if (xml.name() == QLatin1String("name")) {
                name = xml.readElementText();
                hasName = true;
            } else if (xml.name() == QLatin1String("value")) {
                if (!readValue(xml, value, errorString))
                    return false;
                hasValue = true;
            } else {
                return fail(xml, errorString, QStringLiteral("unexpected <%1> in member").arg(xml.name().toString()));
            }
        }
        if (!hasName || !hasValue)
            return fail(xml, errorString, QStringLiteral("incomplete struct member"));
        map.insert(name, value);
    }
    if (xml.hasError())
        return fail(xml, errorString, QString());
    out = map;
    return true;
}

bool readScalar(QXmlStreamReader &xml, QVariant &out, QString &errorString)
{
    const QString type = xml.name().toString();
    const QString text = xml.readElementText();
    if (xml.hasError())
        return fail(xml, errorString, QString());

    bool ok = true;
    if (type == QLatin1String("i4") || type == QLatin1String("int")) {
        out = text.trimmed().toInt(&ok);
    } else if (type == QLatin1String("i8")) {
        out = text.trimmed().toLongLong(&ok);
    } else if (type == QLatin1String("boolean")) {
        const QString t = text.trimmed();
        ok = t == QLatin1String("0") || t == QLatin1String("1");
        out = t == QLatin1String("1");
    } else if (type == QLatin1String("double")) {
        out = text.trimmed().toDouble(&ok);
    } else if (type == QLatin1String("string")) {
        out = text;
    } else if (type == QLatin1String("base64")) {
        out = QByteArray::fromBase64(text.trimmed().toLatin1());
    } else if (type == QLatin1String("dateTime.iso8601")) {
        QDateTime dt = QDateTime::fromString(text.trimmed(), kDateTimeFormat);
        if (!dt.isValid())
            dt = QDateTime::fromString(text.trimmed(), Qt::ISODate);
        ok = dt.isValid();
        out = dt;
    } else {
        return fail(xml, errorString, QStringLiteral("unsupported value type <%1>").arg(type));
    }
    if (!ok)
        return fail(xml, errorString, QStringLiteral("invalid <%1> value '%2'").arg(type, text));
    return true;
}

// Expects the reader on <value>; leaves it on </value>.
bool readValue(QXmlStreamReader &xml, QVariant &out, QString &errorString)
{
    QString text;
    while (!xml.atEnd()) {
        const QXmlStreamReader::TokenType token = xml.readNext();
        if (token == QXmlStreamReader::Characters) {
            text += xml.text();
            continue;
        }
        if (token == QXmlStreamReader::EndElement) {
            // Untyped values are strings.
            out = text;
            return true;
        }
        if (token != QXmlStreamReader::StartElement)
            continue;

        const QStringView type = xml.name();
        bool ok = false;
        if (type == QLatin1String("array")) {
            ok = readArray(xml, out, errorString);
        } else if (type == QLatin1String("struct")) {
            ok = readStruct(xml, out, errorString);
        } else if (type == QLatin1String("nil")) {
            xml.skipCurrentElement();
            out = QVariant();
            ok = true;
        } else {
            ok = readScalar(xml, out, errorString);
        }
        if (!ok)
            return false;
        if (xml.readNextStartElement())
            return fail(xml, errorString, QStringLiteral("more than one type in <value>"));
        return !xml.hasError() || fail(xml, errorString, QString());
    }
    return fail(xml, errorString, QStringLiteral("unterminated <value>"));
}

bool readParams(QXmlStreamReader &xml, QVariantList &params, QString &errorString)
{
    while (xml.readNextStartElement()) {
        if (xml.name() != QLatin1String("param"))
            return fail(xml, errorString, QStringLiteral("unexpected <%1> in params").arg(xml.name().toString()));
        if (!xml.readNextStartElement() || xml.name() != QLatin1String("value"))
            return fail(xml, errorString, QStringLiteral("param without value"));
        QVariant value;
        if (!readValue(xml, value, errorString))
            return false;
        params.append(value);
        if (xml.readNextStartElement())
            return fail(xml, errorString, QStringLiteral("more than one value in param"));
    }
    return !xml.hasError() || fail(xml, errorString, QString());
}

}

namespace hmbridge::xmlrpc {

QByteArray buildMethodCall(const QString &method, const QVariantList &params)
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument();
    xml.writeStartElement(QStringLiteral("methodCall"));
    xml.writeTextElement(QStringLiteral("methodName"), method);
    xml.writeStartElement(QStringLiteral("params"));
    for (const QVariant &param : params) {
        xml.writeStartElement(QStringLiteral("param"));
        writeValue(xml, param);
        xml.writeEndElement();
    }
    xml.writeEndElement();
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray buildResponse(const QVariant &value)
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument();
    xml.writeStartElement(QStringLiteral("methodResponse"));
    xml.writeStartElement(QStringLiteral("params"));
    xml.writeStartElement(QStringLiteral("param"));
    writeValue(xml, value);
    xml.writeEndElement();
    xml.writeEndElement();
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray buildFault(int code, const QString &message)
{
    QVariantMap fault;
    fault.insert(QStringLiteral("faultCode"), code);
    fault.insert(QStringLiteral("faultString"), message);

    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument();
    xml.writeStartElement(QStringLiteral("methodResponse"));
    xml.writeStartElement(QStringLiteral("fault"));
    writeValue(xml, fault);
    xml.writeEndElement();
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

bool parseMethodCall(const QByteArray &data, MethodCall &call, QString &errorString)
{
    call = MethodCall();
    QXmlStreamReader xml(data);
    if (!xml.readNextStartElement() || xml.name() != QLatin1String("methodCall"))
        return fail(xml, errorString, QStringLiteral("missing <methodCall>"));

    bool hasName = false;
    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("methodName")) {
            call.method = xml.readElementText().trimmed();
            hasName = true;
        } else if (xml.name() == QLatin1String("params")) {
            if (!readParams(xml, call.params, errorString))
                return false;
        } else {
            return fail(xml, errorString, QStringLiteral("unexpected <%1> in methodCall").arg(xml.name().toString()));
        }
    }
    if (xml.hasError())
        return fail(xml, errorString, QString());
    if (!hasName || call.method.isEmpty())
        return fail(xml, errorString, QStringLiteral("missing <methodName>"));
    return true;
}

bool parseResponse(const QByteArray &data, Response &response, QString &errorString)
{
    response = Response();
    QXmlStreamReader xml(data);
    if (!xml.readNextStartElement() || xml.name() != QLatin1String("methodResponse"))
        return fail(xml, errorString, QStringLiteral("missing <methodResponse>"));
    if (!xml.readNextStartElement())
        return fail(xml, errorString, QStringLiteral("empty <methodResponse>"));

    if (xml.name() == QLatin1String("params")) {
        QVariantList params;
        if (!readParams(xml, params, errorString))
            return false;
        if (params.size() != 1)
            return fail(xml, errorString, QStringLiteral("response carries %1 params").arg(params.size()));
        response.value = params.first();
        return true;
    }

    if (xml.name() == QLatin1String("fault")) {
        if (!xml.readNextStartElement() || xml.name() != QLatin1String("value"))
            return fail(xml, errorString, QStringLiteral("fault without value"));
        QVariant value;
        if (!readValue(xml, value, errorString))
            return false;
        const QVariantMap fault = value.toMap();
        response.fault = true;
        response.faultCode = fault.value(QStringLiteral("faultCode")).toInt();
        response.faultString = fault.value(QStringLiteral("faultString")).toString();
        return true;
    }

    return fail(xml, errorString, QStringLiteral("unexpected <%1> in methodResponse").arg(xml.name().toString()));
}

} // namespace hmbridge::xmlrpc
