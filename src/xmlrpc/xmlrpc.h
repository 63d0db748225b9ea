#pragma once

#include <QByteArray>
#include <QString>
#include <QVariant>
#include <QVariantList>

namespace hmbridge::xmlrpc {

// Standard fault codes of the XML-RPC introspection conventions.
inline constexpr int kFaultParseError = -32700;
inline constexpr int kFaultMethodNotFound = -32601;
inline constexpr int kFaultInvalidParams = -32602;
inline constexpr int kFaultInternalError = -32603;

struct MethodCall {
    QString      method;
    QVariantList params;
};

struct Response {
    bool     fault = false;
    int      faultCode = 0;
    QString  faultString;
    QVariant value;
};

// QVariant mapping: int/i4 <-> int, i8 <-> qint64, boolean <-> bool,
// double <-> double, string <-> QString, base64 <-> QByteArray,
// dateTime.iso8601 <-> QDateTime, array <-> QVariantList,
// struct <-> QVariantMap, nil <-> invalid QVariant.
QByteArray buildMethodCall(const QString &method, const QVariantList &params);
QByteArray buildResponse(const QVariant &value);
QByteArray buildFault(int code, const QString &message);

bool parseMethodCall(const QByteArray &xml, MethodCall &call, QString &errorString);
bool parseResponse(const QByteArray &xml, Response &response, QString &errorString);

} // namespace hmbridge::xmlrpc
