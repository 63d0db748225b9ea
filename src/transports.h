#pragma once

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QString>

#include "bridgetypes.h"

namespace hmbridge {

// Broker side of the bridge. MqttClient is the production implementation.
class MessageBus : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Disconnected = 0,
        Connecting,
        Connected
    };
    Q_ENUM(State)

    using QObject::QObject;

    virtual State state() const = 0;

    virtual void connectToHost() = 0;
    virtual void disconnectFromHost() = 0;

    // Returns the message id, or -1 when the publish was not queued.
    virtual int publish(const QString &topic, const QByteArray &payload, int qos, bool retain) = 0;
    virtual bool subscribe(const QString &topicFilter, int qos) = 0;

    // Message ids handed to the broker session whose delivery is not yet
    // confirmed. QoS 0 publishes are confirmed once written to the socket.
    virtual QList<int> pendingPublishes() const = 0;

signals:
    void connected();
    void disconnected();
    void messageReceived(const QString &topic, const QByteArray &payload, int messageId);
    void published(int messageId);
    void errorOccurred(int code, const QString &message);
    void stateChanged(hmbridge::MessageBus::State state);
};

// Controller side: the XML-RPC calls the bridge makes to the CCU.
// HomematicClient is the production implementation.
class ControllerLink : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;

    virtual bool listDevices(Inventory &inventory, QString &errorString) = 0;
    virtual bool init(const QString &callbackUrl, const QString &interfaceId, QString &errorString) = 0;
    virtual bool deinit(const QString &callbackUrl, QString &errorString) = 0;

    // Asynchronous; completion is reported through the signals below.
    virtual bool setValue(const Command &command, QString &errorString) = 0;
    virtual bool ping(const QString &interfaceId, QString &errorString) = 0;

    virtual int pendingCalls() const = 0;
    // Aborts all outstanding asynchronous calls and returns their commands.
    virtual QList<Command> abandonPending() = 0;

signals:
    void setValueFinished(const hmbridge::Command &command, bool ok, const QString &errorString);
    void pingFinished(bool ok, const QString &errorString);
};

} // namespace hmbridge
