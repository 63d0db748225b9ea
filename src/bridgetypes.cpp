#include "bridgetypes.h"

namespace hmbridge {

const char *errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::UnknownChannel:
        return "UnknownChannel";
    case ErrorKind::UnknownDatapoint:
        return "UnknownDatapoint";
    case ErrorKind::DomainViolation:
        return "DomainViolation";
    case ErrorKind::UnresolvedTopic:
        return "UnresolvedTopic";
    case ErrorKind::NotWritable:
        return "NotWritable";
    case ErrorKind::ControllerCallFailure:
        return "ControllerCallFailure";
    case ErrorKind::TransportLoss:
        return "TransportLoss";
    case ErrorKind::MalformedInventory:
        return "MalformedInventory";
    case ErrorKind::RegistrationConflict:
        return "RegistrationConflict";
    case ErrorKind::QueueOverflow:
        return "QueueOverflow";
    }
    return "Unknown";
}

} // namespace hmbridge
