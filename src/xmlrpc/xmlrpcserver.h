#pragma once

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QObject>
#include <QString>
#include <QVariant>

#include <functional>

class QTcpServer;
class QTcpSocket;

namespace hmbridge {

// Minimal HTTP/1.x XML-RPC endpoint for controller callbacks. Requests are
// answered on the thread that owns the server.
class XmlRpcServer : public QObject
{
    Q_OBJECT

public:
    using Handler = std::function<bool(const QVariantList &params, QVariant &result, QString &errorString)>;

    static constexpr qint64 MaxRequestSize = 16 * 1024 * 1024;

    explicit XmlRpcServer(QObject *parent = nullptr);
    ~XmlRpcServer() override;

    void registerMethod(const QString &name, Handler handler);
    QStringList methods() const;

    bool listen(const QHostAddress &address, quint16 port, QString &errorString);
    void close();
    bool isListening() const;
    quint16 serverPort() const;

    // Decodes one request body and encodes the response, including
    // system.multicall and system.listMethods.
    QByteArray dispatch(const QByteArray &body);

signals:
    void requestFailed(const QString &errorString);

private:
    struct Connection {
        QByteArray buffer;
        qint64 contentLength = -1;
        int headerLength = 0;
    };

    void handleNewConnection();
    void handleReadyRead(QTcpSocket *socket);
    void sendHttpResponse(QTcpSocket *socket, int status, const QByteArray &reason, const QByteArray &body);

    QVariant invoke(const QString &method, const QVariantList &params, bool &fault, int &faultCode, QString &faultString);
    QVariant multicall(const QVariantList &params);

    QTcpServer *m_server = nullptr;
    QHash<QString, Handler> m_handlers;
    QHash<QTcpSocket *, Connection> m_connections;
};

} // namespace hmbridge
