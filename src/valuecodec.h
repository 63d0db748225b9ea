#pragma once

#include <QByteArray>
#include <QString>
#include <QVariant>

#include "devicetypes.h"

namespace hmbridge {

// Validates a controller value against the datapoint domain and converts it to
// the normalized representation (bool, enum label, qint64 or double).
bool normalizeRawValue(const DatapointSpec &spec,
                       const QVariant &raw,
                       QVariant &normalized,
                       QString &errorString);

QByteArray encodeStatePayload(const DatapointSpec &spec, const QVariant &normalized);

// Decodes an MQTT command payload into the controller key + raw value to write.
bool decodeCommandPayload(const DatapointSpec &spec,
                          const QByteArray &payload,
                          QString &key,
                          QVariant &rawValue,
                          QString &errorString);

} // namespace hmbridge
