#pragma once

#include <memory>

namespace meshdispatch::core {
class DispatchCoordinator;
}

namespace meshdispatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<meshdispatch::core::DispatchCoordinator> coordinator;
};

} // namespace meshdispatch::service
