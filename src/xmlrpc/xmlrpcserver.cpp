#include "xmlrpcserver.h"

#include <QLoggingCategory>
#include <QTcpServer>
#include <QTcpSocket>
#include <QVariantMap>

#include <algorithm>

#include "xmlrpc.h"

Q_LOGGING_CATEGORY(xmlrpcLog, "hmbridge.xmlrpc")

namespace {

const QByteArray kHeaderEnd = QByteArrayLiteral("\r\n\r\n");

QVariantMap faultStruct(int code, const QString &message)
{
    QVariantMap fault;
    fault.insert(QStringLiteral("faultCode"), code);
    fault.insert(QStringLiteral("faultString"), message);
    return fault;
}

}

namespace hmbridge {

XmlRpcServer::XmlRpcServer(QObject *parent)
    : QObject(parent)
    , m_server(new QTcpServer(this))
{
    connect(m_server, &QTcpServer::newConnection, this, &XmlRpcServer::handleNewConnection);
}

XmlRpcServer::~XmlRpcServer()
{
    close();
}

void XmlRpcServer::registerMethod(const QString &name, Handler handler)
{
    m_handlers.insert(name, std::move(handler));
}

QStringList XmlRpcServer::methods() const
{
    QStringList names = m_handlers.keys();
    names << QStringLiteral("system.listMethods") << QStringLiteral("system.multicall");
    std::sort(names.begin(), names.end());
    return names;
}

bool XmlRpcServer::listen(const QHostAddress &address, quint16 port, QString &errorString)
{
    if (m_server->isListening())
        return true;
    if (!m_server->listen(address, port)) {
        errorString = QStringLiteral("Cannot listen on %1:%2: %3")
                          .arg(address.toString())
                          .arg(port)
                          .arg(m_server->errorString());
        return false;
    }
    qCInfo(xmlrpcLog).noquote() << "Listening on" << address.toString() << "port" << m_server->serverPort();
    return true;
}

void XmlRpcServer::close()
{
    if (m_server->isListening()) {
        m_server->close();
        qCInfo(xmlrpcLog) << "Stopped listening";
    }
    const QList<QTcpSocket *> sockets = m_connections.keys();
    m_connections.clear();
    for (QTcpSocket *socket : sockets) {
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
    }
}

bool XmlRpcServer::isListening() const
{
    return m_server->isListening();
}

quint16 XmlRpcServer::serverPort() const
{
    return m_server->serverPort();
}

QByteArray XmlRpcServer::dispatch(const QByteArray &body)
{
    xmlrpc::MethodCall call;
    QString errorString;
    if (!xmlrpc::parseMethodCall(body, call, errorString)) {
        qCWarning(xmlrpcLog).noquote() << "Malformed request:" << errorString;
        emit requestFailed(errorString);
        return xmlrpc::buildFault(xmlrpc::kFaultParseError, errorString);
    }

    bool fault = false;
    int faultCode = 0;
    QString faultString;
    const QVariant result = invoke(call.method, call.params, fault, faultCode, faultString);
    if (fault) {
        emit requestFailed(QStringLiteral("%1: %2").arg(call.method, faultString));
        return xmlrpc::buildFault(faultCode, faultString);
    }
    return xmlrpc::buildResponse(result);
}

QVariant XmlRpcServer::invoke(const QString &method,
                              const QVariantList &params,
                              bool &fault,
                              int &faultCode,
                              QString &faultString)
{
    fault = false;
    qCDebug(xmlrpcLog).noquote() << "Call" << method << "with" << params.size() << "params";

    if (method == QLatin1String("system.listMethods"))
        return methods();
    if (method == QLatin1String("system.multicall"))
        return multicall(params);

    const auto it = m_handlers.constFind(method);
    if (it == m_handlers.constEnd()) {
        fault = true;
        faultCode = xmlrpc::kFaultMethodNotFound;
        faultString = QStringLiteral("Method %1 not supported").arg(method);
        qCWarning(xmlrpcLog).noquote() << faultString;
        return QVariant();
    }

    QVariant result;
    QString errorString;
    if (!it.value()(params, result, errorString)) {
        fault = true;
        faultCode = xmlrpc::kFaultInvalidParams;
        faultString = errorString;
        return QVariant();
    }
    // XML-RPC has no void; the controller expects an empty string.
    if (!result.isValid())
        result = QString();
    return result;
}

QVariant XmlRpcServer::multicall(const QVariantList &params)
{
    QVariantList results;
    const QVariantList calls = params.value(0).toList();
    for (const QVariant &entry : calls) {
        const QVariantMap call = entry.toMap();
        const QString method = call.value(QStringLiteral("methodName")).toString();
        if (method.isEmpty() || method == QLatin1String("system.multicall")) {
            results.append(faultStruct(xmlrpc::kFaultInvalidParams,
                                       QStringLiteral("Invalid multicall entry '%1'").arg(method)));
            continue;
        }
        bool fault = false;
        int faultCode = 0;
        QString faultString;
        const QVariant value = invoke(method, call.value(QStringLiteral("params")).toList(), fault, faultCode, faultString);
        if (fault)
            results.append(faultStruct(faultCode, faultString));
        else
            results.append(QVariant(QVariantList{ value }));
    }
    return results;
}

void XmlRpcServer::handleNewConnection()
{
    while (QTcpSocket *socket = m_server->nextPendingConnection()) {
        m_connections.insert(socket, Connection());
        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
            handleReadyRead(socket);
        });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            m_connections.remove(socket);
            socket->deleteLater();
        });
    }
}

void XmlRpcServer::handleReadyRead(QTcpSocket *socket)
{
    auto it = m_connections.find(socket);
    if (it == m_connections.end())
        return;
    Connection &conn = it.value();
    conn.buffer.append(socket->readAll());

    if (conn.contentLength < 0) {
        const int headerEnd = conn.buffer.indexOf(kHeaderEnd);
        if (headerEnd < 0) {
            if (conn.buffer.size() > 64 * 1024)
                sendHttpResponse(socket, 431, QByteArrayLiteral("Request Header Fields Too Large"), QByteArray());
            return;
        }

        const QList<QByteArray> lines = conn.buffer.left(headerEnd).split('\n');
        const QList<QByteArray> requestLine = lines.value(0).trimmed().split(' ');
        if (requestLine.size() < 2 || requestLine.first() != "POST") {
            sendHttpResponse(socket, 405, QByteArrayLiteral("Method Not Allowed"), QByteArray());
            return;
        }
        qint64 length = -1;
        for (int i = 1; i < lines.size(); ++i) {
            const QByteArray line = lines.at(i).trimmed();
            const int colon = line.indexOf(':');
            if (colon <= 0)
                continue;
            if (line.left(colon).trimmed().toLower() == "content-length") {
                bool ok = false;
                length = line.mid(colon + 1).trimmed().toLongLong(&ok);
                if (!ok)
                    length = -1;
            }
        }
        if (length < 0) {
            sendHttpResponse(socket, 411, QByteArrayLiteral("Length Required"), QByteArray());
            return;
        }
        if (length > MaxRequestSize) {
            sendHttpResponse(socket, 413, QByteArrayLiteral("Payload Too Large"), QByteArray());
            return;
        }
        conn.contentLength = length;
        conn.headerLength = headerEnd + kHeaderEnd.size();
    }

    if (conn.buffer.size() - conn.headerLength < conn.contentLength)
        return;

    const QByteArray body = conn.buffer.mid(conn.headerLength, conn.contentLength);
    conn.buffer.clear();
    conn.contentLength = -1;
    conn.headerLength = 0;
    sendHttpResponse(socket, 200, QByteArrayLiteral("OK"), dispatch(body));
}

void XmlRpcServer::sendHttpResponse(QTcpSocket *socket, int status, const QByteArray &reason, const QByteArray &body)
{
    QByteArray response;
    response += "HTTP/1.1 " + QByteArray::number(status) + ' ' + reason + "\r\n";
    response += "Server: hm-mqtt-bridge\r\n";
    response += "Content-Type: text/xml\r\n";
    response += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    response += "Connection: close\r\n\r\n";
    response += body;
    socket->write(response);
    socket->disconnectFromHost();
    if (status != 200)
        qCWarning(xmlrpcLog) << "Rejected request from" << socket->peerAddress().toString() << "with" << status;
}

} // namespace hmbridge
