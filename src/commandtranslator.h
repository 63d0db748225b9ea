#pragma once

#include "bridgetypes.h"
#include "deviceregistry.h"

namespace hmbridge {

class CommandTranslator
{
public:
    explicit CommandTranslator(const DeviceRegistry &registry);

    CommandTranslation translate(const InboundMessage &message) const;

private:
    const DeviceRegistry &m_registry;
};

} // namespace hmbridge
