#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/transport/transport.hpp"

namespace meshdispatch::transport {

std::shared_ptr<Transport> BuildTransport(const meshdispatch::runtime::config::RadioConfig& config);

}
