#include "bridge.h"

#include <QDateTime>
#include <QEventLoop>
#include <QHostAddress>
#include <QLoggingCategory>
#include <QNetworkInterface>
#include <QVariantMap>

#include "homematic/homematicclient.h"
#include "mqtt/mqttclient.h"
#include "transports.h"
#include "xmlrpc/xmlrpcserver.h"

Q_LOGGING_CATEGORY(bridgeLog, "hmbridge.bridge")

namespace {

bool isWildcardHost(const QString &host)
{
    const QHostAddress address(host);
    return address == QHostAddress::AnyIPv4 || address == QHostAddress::AnyIPv6 || address == QHostAddress::Any;
}

}

namespace hmbridge {

Bridge::Bridge(const BridgeConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_engine(TopicScheme(config.topicNamespace, config.discoveryPrefix), config.eventQueueCapacity)
{
}

Bridge::Bridge(const BridgeConfig &config, ControllerLink *controller, MessageBus *bus, QObject *parent)
    : Bridge(config, parent)
{
    m_controller = controller;
    m_bus = bus;
    if (m_controller)
        m_controller->setParent(this);
    if (m_bus)
        m_bus->setParent(this);
}

Bridge::~Bridge()
{
    stop();
}

bool Bridge::start(QString &errorString)
{
    errorString.clear();
    if (m_started)
        return true;

    if (!parseBrokerUrl(m_config.broker, m_broker, errorString)
        || !parseListenUrl(m_config.listen, m_listen, errorString)
        || !parseConnectUrl(m_config.connect, m_ccu, errorString)) {
        return false;
    }

    if (!m_controller) {
        auto *homematic = new HomematicClient(this);
        homematic->setEndpoint(m_ccu);
        homematic->setTimeout(m_config.requestTimeoutMs);
        m_controller = homematic;
    }
    if (!m_bus) {
        auto *client = new MqttClient(this);
        client->setClientId(QStringLiteral("hm-mqtt-bridge-%1").arg(m_config.interfaceId));
        client->setBroker(m_broker.host, m_broker.port);
        client->setCredentials(m_broker.username, m_broker.password);
        client->setTls(m_broker.tls, m_config.caFile);
        m_bus = client;
    }
    connectLinks();

    qCInfo(bridgeLog).noquote() << "Reading device inventory from" << m_ccu.host << "port" << m_ccu.port;
    Inventory inventory;
    if (!m_controller->listDevices(inventory, errorString))
        return false;
    if (!m_engine.registerInventory(inventory, errorString))
        return false;

    m_server = new XmlRpcServer(this);
    setupXmlRpcMethods();
    const QHostAddress listenAddress(m_listen.host);
    if (listenAddress.isNull()) {
        errorString = QStringLiteral("Listen address '%1' is not an IP address").arg(m_listen.host);
        return false;
    }
    if (!m_server->listen(listenAddress, static_cast<quint16>(m_listen.port), errorString))
        return false;

    // Events are held back until MQTT is up and discovery went out.
    m_engine.setPaused(true);

    if (!registerCallback(errorString))
        return false;

    if (m_config.pingIntervalMs > 0) {
        m_pingTimer = new QTimer(this);
        m_pingTimer->setInterval(m_config.pingIntervalMs);
        connect(m_pingTimer, &QTimer::timeout, this, &Bridge::checkController);
        m_pingTimer->start();
    }

    qCInfo(bridgeLog).noquote() << "Starting bridge, broker" << m_broker.host << "port" << m_broker.port
                                << "namespace" << m_engine.topics().topicNamespace()
                                << "devices" << m_engine.registry().deviceCount();
    m_started = true;
    connectToBroker();
    return true;
}

void Bridge::stop()
{
    if (!m_started)
        return;
    m_started = false;
    qCInfo(bridgeLog) << "Stopping bridge";

    if (m_pingTimer)
        m_pingTimer->stop();
    stopReconnectTimer();
    if (m_server)
        m_server->close();

    if (m_mqttConnected) {
        m_engine.setPaused(false);
        drainEvents();
    } else if (m_engine.pendingEvents() > 0) {
        qCWarning(bridgeLog) << "Discarding" << m_engine.pendingEvents() << "queued events, MQTT is down";
    }

    waitUntilIdle();

    const QList<Command> abandoned = m_controller->abandonPending();
    for (const Command &command : abandoned) {
        qCWarning(bridgeLog).noquote() << "Abandoned setValue" << command.address << command.channel
                                       << command.key << "from mid" << command.messageId;
        emit commandAbandoned(command);
    }
    const QList<int> unconfirmed = m_bus->pendingPublishes();
    for (int mid : unconfirmed) {
        qCWarning(bridgeLog) << "Abandoned publish mid" << mid;
        emit publishAbandoned(mid);
    }

    if (!m_callbackUrl.isEmpty() && !m_controllerLost) {
        QString errorString;
        if (!m_controller->deinit(m_callbackUrl, errorString))
            qCWarning(bridgeLog).noquote() << errorString;
    }

    m_bus->disconnectFromHost();
    m_mqttConnected = false;

    const EngineStats stats = m_engine.stats();
    qCInfo(bridgeLog) << "Processed" << stats.eventsProcessed << "events," << stats.eventsRejected << "rejected,"
                      << stats.eventsOverflowed << "overflowed," << stats.commandsAccepted << "commands,"
                      << stats.commandsRejected << "rejected," << m_skippedPublishes << "publishes skipped";
}

void Bridge::connectLinks()
{
    if (m_linksConnected)
        return;
    m_linksConnected = true;
    connect(m_controller, &ControllerLink::setValueFinished, this, &Bridge::handleSetValueFinished);
    connect(m_controller, &ControllerLink::pingFinished, this, &Bridge::handlePingFinished);

    connect(m_bus, &MessageBus::connected, this, &Bridge::handleBrokerConnected);
    connect(m_bus, &MessageBus::disconnected, this, &Bridge::handleBrokerDisconnected);
    connect(m_bus, &MessageBus::messageReceived, this, &Bridge::handleMqttMessage);
    connect(m_bus, &MessageBus::errorOccurred, this, [this](int code, const QString &message) {
        if (m_bus->state() == MessageBus::State::Connected)
            qCDebug(bridgeLog) << "MQTT error:" << code << message;
        else
            qCWarning(bridgeLog) << "MQTT error:" << code << message;
        if (m_bus->state() == MessageBus::State::Disconnected)
            scheduleReconnect();
    });
}

// Nothing left to wait for: no setValue outstanding and, while the broker
// is reachable, every publish confirmed.
bool Bridge::isIdle() const
{
    if (m_controller->pendingCalls() > 0)
        return false;
    return m_bus->state() != MessageBus::State::Connected || m_bus->pendingPublishes().isEmpty();
}

void Bridge::waitUntilIdle()
{
    if (isIdle() || m_config.shutdownTimeoutMs <= 0)
        return;

    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);
    const auto check = [this, &loop]() {
        if (isIdle())
            loop.quit();
    };
    connect(m_controller, &ControllerLink::setValueFinished, &loop, check);
    connect(m_bus, &MessageBus::published, &loop, check);
    connect(m_bus, &MessageBus::disconnected, &loop, check);
    deadline.start(m_config.shutdownTimeoutMs);
    loop.exec();
}

void Bridge::setupXmlRpcMethods()
{
    m_server->registerMethod(QStringLiteral("event"),
                             [this](const QVariantList &params, QVariant &result, QString &errorString) {
        return handleEvent(params, result, errorString);
    });
    m_server->registerMethod(QStringLiteral("newDevices"),
                             [this](const QVariantList &params, QVariant &result, QString &errorString) {
        return handleNewDevices(params, result, errorString);
    });
    m_server->registerMethod(QStringLiteral("deleteDevices"),
                             [this](const QVariantList &params, QVariant &result, QString &errorString) {
        return handleDeleteDevices(params, result, errorString);
    });
    m_server->registerMethod(QStringLiteral("listDevices"),
                             [this](const QVariantList &params, QVariant &result, QString &errorString) {
        return handleListDevices(params, result, errorString);
    });
}

QString Bridge::resolveCallbackHost() const
{
    if (!m_config.callbackHost.isEmpty())
        return m_config.callbackHost;
    if (!isWildcardHost(m_listen.host))
        return m_listen.host;
    const QList<QHostAddress> addresses = QNetworkInterface::allAddresses();
    for (const QHostAddress &address : addresses) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback())
            return address.toString();
    }
    return QStringLiteral("127.0.0.1");
}

bool Bridge::registerCallback(QString &errorString)
{
    m_callbackUrl = QStringLiteral("http://%1:%2").arg(resolveCallbackHost()).arg(m_server->serverPort());
    return m_controller->init(m_callbackUrl, m_config.interfaceId, errorString);
}

void Bridge::connectToBroker()
{
    if (!m_bus || !m_started)
        return;
    if (m_bus->state() != MessageBus::State::Disconnected)
        return;
    m_bus->connectToHost();
}

void Bridge::scheduleReconnect()
{
    if (!m_started || m_config.retryIntervalMs <= 0)
        return;
    if (!m_reconnectTimer) {
        m_reconnectTimer = new QTimer(this);
        m_reconnectTimer->setSingleShot(false);
        connect(m_reconnectTimer, &QTimer::timeout, this, [this]() {
            connectToBroker();
        });
    }
    m_reconnectTimer->setInterval(m_config.retryIntervalMs);
    if (!m_reconnectTimer->isActive())
        m_reconnectTimer->start();
}

void Bridge::stopReconnectTimer()
{
    if (m_reconnectTimer)
        m_reconnectTimer->stop();
}

void Bridge::handleBrokerConnected()
{
    qCInfo(bridgeLog) << "MQTT connected, subscribing";
    m_mqttConnected = true;
    stopReconnectTimer();
    if (!m_bus->subscribe(m_engine.topics().commandSubscription(), m_config.qos))
        qCWarning(bridgeLog) << "Subscribing to command topics failed";
    republishAndResume();
}

void Bridge::handleBrokerDisconnected()
{
    if (!m_mqttConnected)
        return;
    qCWarning(bridgeLog) << "MQTT disconnected";
    m_mqttConnected = false;
    m_engine.setPaused(true);
    scheduleReconnect();
}

void Bridge::handleMqttMessage(const QString &topic, const QByteArray &payload, int messageId)
{
    const CommandTranslation translation = m_engine.translateCommand({ topic, payload, messageId });
    if (!translation.ok())
        return;

    QString errorString;
    if (!m_controller->setValue(translation.command, errorString)) {
        qCWarning(bridgeLog).noquote() << errorKindName(ErrorKind::ControllerCallFailure) << errorString;
        emit commandFailed(translation.command, errorString);
    }
}

bool Bridge::checkInterfaceId(const QVariantList &params, QString &errorString) const
{
    const QString interfaceId = params.value(0).toString();
    if (interfaceId != m_config.interfaceId) {
        errorString = QStringLiteral("Unknown interface id '%1'").arg(interfaceId);
        qCWarning(bridgeLog).noquote() << errorString;
        return false;
    }
    return true;
}

bool Bridge::handleEvent(const QVariantList &params, QVariant &result, QString &errorString)
{
    if (params.size() != 4) {
        errorString = QStringLiteral("event expects 4 params, got %1").arg(params.size());
        return false;
    }
    if (!checkInterfaceId(params, errorString))
        return false;

    const QString channelAddress = params.at(1).toString();
    const QString key = params.at(2).toString();
    const int colon = channelAddress.lastIndexOf(QLatin1Char(':'));
    bool ok = false;
    const int channel = colon > 0 ? channelAddress.mid(colon + 1).toInt(&ok) : -1;
    if (!ok) {
        // Device level notifications such as CENTRAL/PONG.
        qCDebug(bridgeLog).noquote() << "Ignoring event" << channelAddress << key;
        result = QString();
        return true;
    }

    RawEvent event;
    event.address = channelAddress.left(colon);
    event.channel = channel;
    event.key = key;
    event.rawValue = params.at(3);
    event.tsMs = QDateTime::currentMSecsSinceEpoch();

    QString overflow;
    if (m_engine.enqueueEvent(event, overflow))
        scheduleDrain();
    result = QString();
    return true;
}

bool Bridge::handleNewDevices(const QVariantList &params, QVariant &result, QString &errorString)
{
    if (params.size() != 2) {
        errorString = QStringLiteral("newDevices expects 2 params, got %1").arg(params.size());
        return false;
    }
    if (!checkInterfaceId(params, errorString))
        return false;

    Inventory inventory;
    if (!inventoryFromDescriptions(params.at(1).toList(), inventory, errorString)) {
        qCWarning(bridgeLog).noquote() << errorKindName(ErrorKind::MalformedInventory) << errorString;
        return false;
    }
    publish(m_engine.addDevices(inventory));
    result = QString();
    return true;
}

bool Bridge::handleDeleteDevices(const QVariantList &params, QVariant &result, QString &errorString)
{
    if (params.size() != 2) {
        errorString = QStringLiteral("deleteDevices expects 2 params, got %1").arg(params.size());
        return false;
    }
    if (!checkInterfaceId(params, errorString))
        return false;

    // Channel addresses are dropped; removing the parent removes its channels.
    QStringList addresses;
    const QStringList reported = params.at(1).toStringList();
    for (const QString &address : reported) {
        if (!address.contains(QLatin1Char(':')))
            addresses.push_back(address);
    }
    publish(m_engine.removeDevices(addresses));
    result = QString();
    return true;
}

bool Bridge::handleListDevices(const QVariantList &params, QVariant &result, QString &errorString)
{
    if (!checkInterfaceId(params, errorString))
        return false;

    QVariantList known;
    const QList<RegisteredDevice> devices = m_engine.registry().devices();
    for (const RegisteredDevice &device : devices) {
        known.append(QVariantMap{ { QStringLiteral("ADDRESS"), device.address },
                                  { QStringLiteral("VERSION"), 1 } });
        for (const Channel &channel : device.channels) {
            known.append(QVariantMap{
                { QStringLiteral("ADDRESS"), QStringLiteral("%1:%2").arg(device.address).arg(channel.index) },
                { QStringLiteral("VERSION"), 1 } });
        }
    }
    result = known;
    return true;
}

void Bridge::handleSetValueFinished(const Command &command, bool ok, const QString &errorString)
{
    if (ok)
        return;
    qCWarning(bridgeLog).noquote() << errorKindName(ErrorKind::ControllerCallFailure)
                                   << command.address << command.channel << command.key << errorString;
    emit commandFailed(command, errorString);
}

void Bridge::checkController()
{
    if (!m_started)
        return;
    QString errorString;
    if (!m_controllerLost) {
        if (!m_controller->ping(m_config.interfaceId, errorString))
            qCDebug(bridgeLog).noquote() << "Ping skipped:" << errorString;
        return;
    }

    if (!registerCallback(errorString)) {
        qCWarning(bridgeLog).noquote() << "CCU still unreachable:" << errorString;
        return;
    }
    qCInfo(bridgeLog) << "CCU connection restored";
    m_controllerLost = false;
    if (m_mqttConnected)
        republishAndResume();
}

void Bridge::handlePingFinished(bool ok, const QString &errorString)
{
    if (ok || m_controllerLost)
        return;
    qCWarning(bridgeLog).noquote() << errorKindName(ErrorKind::TransportLoss) << "CCU ping failed:" << errorString;
    m_controllerLost = true;
    // Anything arriving before the re-init goes out after the republish.
    m_engine.setPaused(true);
}

void Bridge::republishAndResume()
{
    publish(m_engine.republish());
    if (m_controllerLost)
        return;
    m_engine.setPaused(false);
    scheduleDrain();
}

void Bridge::scheduleDrain()
{
    if (m_drainScheduled || m_engine.isPaused())
        return;
    m_drainScheduled = true;
    QTimer::singleShot(0, this, [this]() {
        drainEvents();
    });
}

void Bridge::drainEvents()
{
    m_drainScheduled = false;
    publish(m_engine.processPendingEvents());
}

void Bridge::publish(const PublishList &publishes)
{
    if (publishes.isEmpty())
        return;
    if (!m_mqttConnected || !m_bus) {
        m_skippedPublishes += publishes.size();
        qCDebug(bridgeLog) << "MQTT down, skipping" << publishes.size() << "publishes";
        return;
    }
    for (const PublishAction &action : publishes) {
        if (m_bus->publish(action.topic, action.payload, m_config.qos, action.retained) < 0)
            qCWarning(bridgeLog).noquote() << "Publish to" << action.topic << "failed";
    }
}

} // namespace hmbridge
