#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

#include "bridgeconfig.h"
#include "bridgeengine.h"

namespace hmbridge {

class ControllerLink;
class MessageBus;
class XmlRpcServer;

// Wires the engine to its transports: controller callbacks and commands over
// XML-RPC, state and discovery over MQTT.
class Bridge : public QObject
{
    Q_OBJECT

public:
    explicit Bridge(const BridgeConfig &config, QObject *parent = nullptr);
    // Uses the given links instead of creating HomematicClient and MqttClient
    // in start(). The bridge takes ownership of both.
    Bridge(const BridgeConfig &config, ControllerLink *controller, MessageBus *bus, QObject *parent = nullptr);
    ~Bridge() override;

    bool start(QString &errorString);
    // Cooperative shutdown; blocks at most shutdownTimeoutMs for controller
    // calls and unconfirmed publishes.
    void stop();

    // Keep-alive tick, driven by the ping timer. Pings the CCU, or tries to
    // register the callback again once the CCU was lost.
    void checkController();

    const BridgeEngine &engine() const { return m_engine; }
    QString callbackUrl() const { return m_callbackUrl; }
    bool isControllerLost() const { return m_controllerLost; }
    XmlRpcServer *xmlRpcServer() const { return m_server; }

signals:
    void commandFailed(const hmbridge::Command &command, const QString &errorString);
    void commandAbandoned(const hmbridge::Command &command);
    void publishAbandoned(int messageId);

private:
    void setupXmlRpcMethods();
    bool registerCallback(QString &errorString);
    QString resolveCallbackHost() const;

    void connectToBroker();
    void scheduleReconnect();
    void stopReconnectTimer();
    void handleBrokerConnected();
    void handleBrokerDisconnected();
    void handleMqttMessage(const QString &topic, const QByteArray &payload, int messageId);

    bool handleEvent(const QVariantList &params, QVariant &result, QString &errorString);
    bool handleNewDevices(const QVariantList &params, QVariant &result, QString &errorString);
    bool handleDeleteDevices(const QVariantList &params, QVariant &result, QString &errorString);
    bool handleListDevices(const QVariantList &params, QVariant &result, QString &errorString);
    bool checkInterfaceId(const QVariantList &params, QString &errorString) const;

    void handleSetValueFinished(const Command &command, bool ok, const QString &errorString);
    void handlePingFinished(bool ok, const QString &errorString);

    void connectLinks();
    bool isIdle() const;
    void waitUntilIdle();

    void republishAndResume();
    void scheduleDrain();
    void drainEvents();
    void publish(const PublishList &publishes);

    BridgeConfig m_config;
    BrokerEndpoint m_broker;
    XmlRpcEndpoint m_listen;
    XmlRpcEndpoint m_ccu;
    BridgeEngine m_engine;

    MessageBus *m_bus = nullptr;
    XmlRpcServer *m_server = nullptr;
    ControllerLink *m_controller = nullptr;
    QTimer *m_reconnectTimer = nullptr;
    QTimer *m_pingTimer = nullptr;

    QString m_callbackUrl;
    bool m_started = false;
    bool m_linksConnected = false;
    bool m_mqttConnected = false;
    bool m_controllerLost = false;
    bool m_drainScheduled = false;
    quint64 m_skippedPublishes = 0;
};

} // namespace hmbridge
