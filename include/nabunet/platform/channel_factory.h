#pragma once

#include <memory>

#include "nabunet/config/adaptor_config.h"
#include "nabunet/io/core/channel.h"

namespace nabunet::platform {

// TTY or PTY channel as configured. nullptr when the device cannot be
// opened or configured.
std::unique_ptr<nabunet::io::Channel>
create_channel(const config::SerialConfig& config);

} // namespace nabunet::platform
