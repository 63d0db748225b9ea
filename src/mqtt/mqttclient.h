#pragma once

#include <QByteArray>
#include <QThread>

#include "transports.h"

namespace hmbridge {

class MqttWorker;

// libmosquitto session driven from a dedicated worker thread. Signals are
// delivered queued to the thread that owns the client.
class MqttClient : public MessageBus
{
    Q_OBJECT

public:
    explicit MqttClient(QObject *parent = nullptr);
    ~MqttClient() override;

    void setClientId(const QString &clientId);
    void setBroker(const QString &hostname, int port);
    void setCredentials(const QString &username, const QString &password);
    // An empty CA file falls back to the system certificate directory.
    void setTls(bool enabled, const QString &caFile = QString());

    State state() const override { return m_state; }

    void connectToHost() override;
    void disconnectFromHost() override;

    int publish(const QString &topic, const QByteArray &payload, int qos = 0, bool retain = false) override;
    bool subscribe(const QString &topicFilter, int qos = 0) override;

    QList<int> pendingPublishes() const override;

private:
    void setState(State state);
    void applyConfig();

    MqttWorker *m_worker = nullptr;
    QThread *m_workerThread = nullptr;

    QString m_clientId;
    QString m_hostname;
    QString m_username;
    QString m_password;
    QString m_caFile;
    int m_port = 1883;
    bool m_tls = false;
    State m_state = State::Disconnected;
};

} // namespace hmbridge
