#include "mqttclient.h"

#include <algorithm>

#include <QLoggingCategory>
#include <QMetaObject>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>

#include <mosquitto.h>

Q_LOGGING_CATEGORY(mqttLog, "hmbridge.mqtt")

namespace {

constexpr const char *kSystemCaPath = "/etc/ssl/certs";
constexpr int kKeepAliveSeconds = 60;

QString mosquittoError(int rc)
{
    return QString::fromUtf8(mosquitto_strerror(rc));
}

}

namespace hmbridge {

// mosquitto_lib_init/cleanup are process wide; count the users.
class MosquittoLibrary
{
public:
    MosquittoLibrary()
    {
        QMutexLocker locker(&s_mutex);
        if (s_users++ == 0)
            mosquitto_lib_init();
    }

    ~MosquittoLibrary()
    {
        QMutexLocker locker(&s_mutex);
        if (--s_users == 0)
            mosquitto_lib_cleanup();
    }

    MosquittoLibrary(const MosquittoLibrary &) = delete;
    MosquittoLibrary &operator=(const MosquittoLibrary &) = delete;

private:
    static QMutex s_mutex;
    static int s_users;
};

QMutex MosquittoLibrary::s_mutex;
int MosquittoLibrary::s_users = 0;

class MqttWorker : public QObject
{
    Q_OBJECT

public:
    explicit MqttWorker(QObject *parent = nullptr)
        : QObject(parent)
    {
    }

    ~MqttWorker() override
    {
        release();
    }

    Q_INVOKABLE void setClientId(const QString &clientId) { m_clientId = clientId; }
    Q_INVOKABLE void setBroker(const QString &hostname, int port)
    {
        m_hostname = hostname;
        m_port = port;
    }
    Q_INVOKABLE void setCredentials(const QString &username, const QString &password)
    {
        m_username = username;
        m_password = password;
    }
    Q_INVOKABLE void setTls(bool enabled, const QString &caFile)
    {
        m_tls = enabled;
        m_caFile = caFile;
    }

    Q_INVOKABLE void connectToHost()
    {
        if (m_hostname.trimmed().isEmpty()) {
            emit errorOccurred(MOSQ_ERR_INVAL, QStringLiteral("MQTT hostname is empty"));
            return;
        }
        if (m_state != MessageBus::State::Disconnected)
            return;
        // Once the network loop runs, libmosquitto reconnects on its own.
        if (m_loopRunning) {
            qCDebug(mqttLog) << "Reconnect pending in network loop";
            return;
        }

        if (!m_mosq && !createSession())
            return;

        const int rc = mosquitto_connect_async(m_mosq,
                                               m_hostname.toUtf8().constData(),
                                               m_port,
                                               kKeepAliveSeconds);
        if (rc != MOSQ_ERR_SUCCESS) {
            emit errorOccurred(rc, QStringLiteral("MQTT connect to %1:%2 failed: %3")
                                       .arg(m_hostname)
                                       .arg(m_port)
                                       .arg(mosquittoError(rc)));
            return;
        }

        qCInfo(mqttLog).noquote() << "Connecting to" << m_hostname << "port" << m_port
                                  << (m_tls ? "(TLS)" : "");
        setState(MessageBus::State::Connecting);
        startLoop();
    }

    Q_INVOKABLE void disconnectFromHost()
    {
        if (!m_mosq || m_state == MessageBus::State::Disconnected)
            return;
        const int rc = mosquitto_disconnect(m_mosq);
        if (rc != MOSQ_ERR_SUCCESS)
            emit errorOccurred(rc, QStringLiteral("MQTT disconnect failed: %1").arg(mosquittoError(rc)));
    }

    Q_INVOKABLE bool subscribe(const QString &topicFilter, int qos)
    {
        if (!m_mosq)
            return false;
        const int rc = mosquitto_subscribe(m_mosq, nullptr, topicFilter.toUtf8().constData(), qos);
        if (rc != MOSQ_ERR_SUCCESS) {
            emit errorOccurred(rc, QStringLiteral("MQTT subscribe to %1 failed: %2")
                                       .arg(topicFilter, mosquittoError(rc)));
            return false;
        }
        qCDebug(mqttLog).noquote() << "Subscribed" << topicFilter << "qos" << qos;
        return true;
    }

    Q_INVOKABLE int publish(const QString &topic, const QByteArray &payload, int qos, bool retain)
    {
        if (!m_mosq)
            return -1;
        int mid = 0;
        const int rc = mosquitto_publish(m_mosq,
                                         &mid,
                                         topic.toUtf8().constData(),
                                         payload.size(),
                                         payload.isEmpty() ? nullptr : payload.constData(),
                                         qos,
                                         retain);
        if (rc != MOSQ_ERR_SUCCESS) {
            emit errorOccurred(rc, QStringLiteral("MQTT publish to %1 failed: %2")
                                       .arg(topic, mosquittoError(rc)));
            return -1;
        }
        // The network thread may confirm the mid before we get here.
        QMutexLocker locker(&m_inFlightMutex);
        if (!m_confirmedEarly.remove(mid))
            m_inFlight.insert(mid);
        return mid;
    }

    QList<int> pendingPublishes() const
    {
        QMutexLocker locker(&m_inFlightMutex);
        QList<int> mids = m_inFlight.values();
        std::sort(mids.begin(), mids.end());
        return mids;
    }

    Q_INVOKABLE void shutdown()
    {
        release();
    }

signals:
    void connected();
    void disconnected();
    void messageReceived(const QString &topic, const QByteArray &payload, int messageId);
    void published(int messageId);
    void errorOccurred(int code, const QString &message);
    void stateChanged(hmbridge::MessageBus::State state);

private:
    bool createSession()
    {
        const QByteArray clientIdBytes = m_clientId.toUtf8();
        const char *clientId = clientIdBytes.isEmpty() ? nullptr : clientIdBytes.constData();
        m_mosq = mosquitto_new(clientId, true, this);
        if (!m_mosq) {
            emit errorOccurred(MOSQ_ERR_NOMEM, QStringLiteral("Failed to allocate mosquitto client"));
            return false;
        }
        mosquitto_connect_callback_set(m_mosq, &MqttWorker::onConnect);
        mosquitto_disconnect_callback_set(m_mosq, &MqttWorker::onDisconnect);
        mosquitto_message_callback_set(m_mosq, &MqttWorker::onMessage);
        mosquitto_publish_callback_set(m_mosq, &MqttWorker::onPublish);
        mosquitto_log_callback_set(m_mosq, &MqttWorker::onLog);
        mosquitto_reconnect_delay_set(m_mosq, 2, 60, true);

        const QByteArray userBytes = m_username.toUtf8();
        const QByteArray passBytes = m_password.toUtf8();
        int rc = mosquitto_username_pw_set(m_mosq,
                                           userBytes.isEmpty() ? nullptr : userBytes.constData(),
                                           passBytes.isEmpty() ? nullptr : passBytes.constData());
        if (rc != MOSQ_ERR_SUCCESS) {
            emit errorOccurred(rc, QStringLiteral("Failed to set MQTT credentials: %1").arg(mosquittoError(rc)));
            release();
            return false;
        }

        if (m_tls) {
            const QByteArray caFile = m_caFile.toUtf8();
            rc = mosquitto_tls_set(m_mosq,
                                   caFile.isEmpty() ? nullptr : caFile.constData(),
                                   caFile.isEmpty() ? kSystemCaPath : nullptr,
                                   nullptr,
                                   nullptr,
                                   nullptr);
            if (rc != MOSQ_ERR_SUCCESS) {
                emit errorOccurred(rc, QStringLiteral("Failed to configure MQTT TLS: %1").arg(mosquittoError(rc)));
                release();
                return false;
            }
        }
        return true;
    }

    static void onConnect(struct mosquitto *, void *userdata, int rc)
    {
        auto *worker = static_cast<MqttWorker *>(userdata);
        if (!worker)
            return;
        if (rc == 0) {
            worker->setState(MessageBus::State::Connected);
            emit worker->connected();
            return;
        }
        worker->setState(MessageBus::State::Disconnected);
        emit worker->errorOccurred(rc, QStringLiteral("MQTT connect refused: %1")
                                           .arg(QString::fromUtf8(mosquitto_connack_string(rc))));
    }

    static void onDisconnect(struct mosquitto *, void *userdata, int rc)
    {
        auto *worker = static_cast<MqttWorker *>(userdata);
        if (!worker)
            return;
        if (rc != 0)
            qCWarning(mqttLog).noquote() << "Connection lost:" << mosquittoError(rc);
        worker->setState(MessageBus::State::Disconnected);
        emit worker->disconnected();
    }

    static void onMessage(struct mosquitto *, void *userdata, const struct mosquitto_message *msg)
    {
        auto *worker = static_cast<MqttWorker *>(userdata);
        if (!worker || !msg || !msg->topic)
            return;
        const QByteArray payload(static_cast<const char *>(msg->payload), msg->payloadlen);
        emit worker->messageReceived(QString::fromUtf8(msg->topic), payload, msg->mid);
    }

    // QoS 0: written to the socket. QoS 1: PUBACK. QoS 2: PUBCOMP.
    static void onPublish(struct mosquitto *, void *userdata, int mid)
    {
        auto *worker = static_cast<MqttWorker *>(userdata);
        if (!worker)
            return;
        {
            QMutexLocker locker(&worker->m_inFlightMutex);
            if (!worker->m_inFlight.remove(mid))
                worker->m_confirmedEarly.insert(mid);
        }
        emit worker->published(mid);
    }

    static void onLog(struct mosquitto *, void *, int level, const char *str)
    {
        if (!str)
            return;
        if (level & (MOSQ_LOG_ERR | MOSQ_LOG_WARNING))
            qCWarning(mqttLog) << str;
        else if (level & MOSQ_LOG_DEBUG)
            qCDebug(mqttLog) << str;
    }

    // The network loop keeps running across disconnects and is stopped
    // only on release().
    void startLoop()
    {
        if (!m_mosq || m_loopRunning)
            return;
        const int rc = mosquitto_loop_start(m_mosq);
        if (rc != MOSQ_ERR_SUCCESS) {
            emit errorOccurred(rc, QStringLiteral("MQTT loop_start failed: %1").arg(mosquittoError(rc)));
            return;
        }
        m_loopRunning = true;
    }

    void release()
    {
        if (!m_mosq)
            return;
        if (m_loopRunning) {
            // A connected loop exits by itself once the DISCONNECT is out;
            // one stuck reconnecting has to be forced.
            const bool connected = m_state == MessageBus::State::Connected;
            mosquitto_disconnect(m_mosq);
            mosquitto_loop_stop(m_mosq, !connected);
            m_loopRunning = false;
        }
        mosquitto_destroy(m_mosq);
        m_mosq = nullptr;

        QMutexLocker locker(&m_inFlightMutex);
        if (!m_inFlight.isEmpty())
            qCDebug(mqttLog) << "Dropped" << m_inFlight.size() << "unconfirmed publishes";
        m_inFlight.clear();
        m_confirmedEarly.clear();
        setState(MessageBus::State::Disconnected);
    }

    void setState(MessageBus::State state)
    {
        if (m_state == state)
            return;
        m_state = state;
        emit stateChanged(m_state);
    }

    MosquittoLibrary m_library;
    struct mosquitto *m_mosq = nullptr;
    bool m_loopRunning = false;

    QString m_clientId;
    QString m_hostname;
    QString m_username;
    QString m_password;
    QString m_caFile;
    int m_port = 1883;
    bool m_tls = false;
    MessageBus::State m_state = MessageBus::State::Disconnected;

    mutable QMutex m_inFlightMutex;
    QSet<int> m_inFlight;
    QSet<int> m_confirmedEarly;
};

MqttClient::MqttClient(QObject *parent)
    : MessageBus(parent)
    , m_worker(new MqttWorker())
    , m_workerThread(new QThread(this))
{
    m_workerThread->setObjectName(QStringLiteral("mqtt"));
    m_worker->moveToThread(m_workerThread);
    connect(m_workerThread, &QThread::finished, m_worker, &QObject::deleteLater);

    connect(m_worker, &MqttWorker::connected, this, &MqttClient::connected);
    connect(m_worker, &MqttWorker::disconnected, this, &MqttClient::disconnected);
    connect(m_worker, &MqttWorker::messageReceived, this, &MqttClient::messageReceived);
    connect(m_worker, &MqttWorker::published, this, &MqttClient::published);
    connect(m_worker, &MqttWorker::errorOccurred, this, &MqttClient::errorOccurred);
    connect(m_worker, &MqttWorker::stateChanged, this, [this](State state) {
        setState(state);
    });

    m_workerThread->start();
}

MqttClient::~MqttClient()
{
    if (m_workerThread && m_workerThread->isRunning()) {
        QMetaObject::invokeMethod(m_worker, "shutdown", Qt::BlockingQueuedConnection);
        m_workerThread->quit();
        m_workerThread->wait();
    }
}

void MqttClient::setClientId(const QString &clientId)
{
    m_clientId = clientId;
}

void MqttClient::setBroker(const QString &hostname, int port)
{
    m_hostname = hostname;
    m_port = port;
}

void MqttClient::setCredentials(const QString &username, const QString &password)
{
    m_username = username;
    m_password = password;
}

void MqttClient::setTls(bool enabled, const QString &caFile)
{
    m_tls = enabled;
    m_caFile = caFile;
}

void MqttClient::connectToHost()
{
    applyConfig();
    QMetaObject::invokeMethod(m_worker, "connectToHost", Qt::QueuedConnection);
}

void MqttClient::disconnectFromHost()
{
    QMetaObject::invokeMethod(m_worker, "disconnectFromHost", Qt::QueuedConnection);
}

int MqttClient::publish(const QString &topic, const QByteArray &payload, int qos, bool retain)
{
    if (QThread::currentThread() == m_workerThread)
        return m_worker->publish(topic, payload, qos, retain);
    int mid = -1;
    QMetaObject::invokeMethod(m_worker,
                              "publish",
                              Qt::BlockingQueuedConnection,
                              Q_RETURN_ARG(int, mid),
                              Q_ARG(QString, topic),
                              Q_ARG(QByteArray, payload),
                              Q_ARG(int, qos),
                              Q_ARG(bool, retain));
    return mid;
}

QList<int> MqttClient::pendingPublishes() const
{
    return m_worker->pendingPublishes();
}

bool MqttClient::subscribe(const QString &topicFilter, int qos)
{
    if (QThread::currentThread() == m_workerThread)
        return m_worker->subscribe(topicFilter, qos);
    bool ok = false;
    QMetaObject::invokeMethod(m_worker,
                              "subscribe",
                              Qt::BlockingQueuedConnection,
                              Q_RETURN_ARG(bool, ok),
                              Q_ARG(QString, topicFilter),
                              Q_ARG(int, qos));
    return ok;
}

void MqttClient::setState(State state)
{
    if (m_state == state)
        return;
    m_state = state;
    emit stateChanged(m_state);
}

// Settings are pushed to the worker in one go right before connecting.
void MqttClient::applyConfig()
{
    QMetaObject::invokeMethod(m_worker, "setClientId", Qt::QueuedConnection, Q_ARG(QString, m_clientId));
    QMetaObject::invokeMethod(m_worker, "setBroker", Qt::QueuedConnection,
                              Q_ARG(QString, m_hostname), Q_ARG(int, m_port));
    QMetaObject::invokeMethod(m_worker, "setCredentials", Qt::QueuedConnection,
                              Q_ARG(QString, m_username), Q_ARG(QString, m_password));
    QMetaObject::invokeMethod(m_worker, "setTls", Qt::QueuedConnection, Q_ARG(bool, m_tls), Q_ARG(QString, m_caFile));
}

} // namespace hmbridge

#include "mqttclient.moc"
