#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <QVariant>

namespace hmbridge {

// ============================================================================
// ERRORS
// ============================================================================
enum class ErrorKind : quint8 {
    None                  = 0,
    UnknownChannel        = 1,    // Address + channel is not registered
    UnknownDatapoint      = 2,    // Channel does not declare the parameter
    DomainViolation       = 3,    // Value outside the declared range / enumeration
    UnresolvedTopic       = 4,    // Command topic has no reverse mapping
    NotWritable           = 5,    // Command addressed to a read-only datapoint
    ControllerCallFailure = 6,    // setValue rejected or transport error
    TransportLoss         = 7,    // Controller or broker connection dropped
    MalformedInventory    = 8,    // Empty or inconsistent device inventory
    RegistrationConflict  = 9,    // Device would collide with an existing mapping
    QueueOverflow         = 10    // Bounded event queue is full
};

const char *errorKindName(ErrorKind kind);

// ============================================================================
// CONTROLLER SIDE
// ============================================================================

// One physical device as reported by the controller's inventory.
struct InventoryEntry {
    QString address;
    QString model;
    int     channelCount = 0;
    QString firmware;
};

using Inventory = QList<InventoryEntry>;

// Parameter-change notification as delivered by the controller.
struct RawEvent {
    QString  address;
    int      channel = 0;
    QString  key;               // Controller parameter name, e.g. "LEVEL"
    QVariant rawValue;
    qint64   tsMs = 0;
};

// Normalized domain event. `trigger` marks the synthetic one-shot copy.
struct Event {
    QString  address;
    int      channel = 0;
    QString  datapoint;         // Normalized id, e.g. "level"
    QVariant value;
    qint64   tsMs = 0;
    bool     trigger = false;
};

// Validated set-value call for the controller collaborator.
struct Command {
    QString  address;
    int      channel = 0;
    QString  key;               // Controller parameter name
    QVariant value;             // Controller encoding
    int      messageId = 0;     // Originating MQTT message id
};

// ============================================================================
// MESSAGING SIDE
// ============================================================================
struct InboundMessage {
    QString    topic;
    QByteArray payload;
    int        messageId = 0;
};

struct PublishAction {
    QString    topic;
    QByteArray payload;
    bool       retained = true;
};

using PublishList = QList<PublishAction>;

// Fully qualified datapoint reference used by the reverse lookup.
struct DatapointRef {
    QString address;
    int     channel = -1;
    QString datapoint;

    bool isValid() const { return !address.isEmpty() && channel >= 0 && !datapoint.isEmpty(); }
    bool operator==(const DatapointRef &other) const
    {
        return address == other.address && channel == other.channel && datapoint == other.datapoint;
    }
    bool operator!=(const DatapointRef &other) const { return !(*this == other); }
};

// ============================================================================
// TRANSLATION RESULTS
// ============================================================================
struct EventTranslation {
    ErrorKind   error = ErrorKind::None;
    QString     errorString;
    QList<Event> events;
    PublishList publishes;      // May hold an attributes update on UnknownDatapoint

    bool ok() const { return error == ErrorKind::None; }
};

struct CommandTranslation {
    ErrorKind error = ErrorKind::None;
    QString   errorString;
    Command   command;

    bool ok() const { return error == ErrorKind::None; }
};

} // namespace hmbridge
