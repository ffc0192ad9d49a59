#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/dispatch_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/inbound/inbound_queue.hpp"
#include "internal/inbound/inbound_worker.hpp"
#include "internal/reliable/reliable_outbound.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/transport/transport.hpp"
#include "internal/util/time.hpp"

namespace meshdispatch::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.

  Start order: inbound worker, radio link, background tasks.
  Stop runs in reverse and is safe to call twice.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<transport::Transport>       transport;
  std::shared_ptr<inbound::InboundQueue>      inbound_queue;
  std::shared_ptr<inbound::InboundWorker>     inbound_worker;
  std::shared_ptr<reliable::ReliableOutbound> outbound;
  std::shared_ptr<core::DispatchCoordinator>  coordinator;

  std::vector<std::shared_ptr<runtime::PeriodicTask>> background_tasks;
  std::vector<std::unique_ptr<::grpc::Service>>       grpc_services;

  void Start();
  void Stop();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and link types.
*/
Application Build(const meshdispatch::runtime::config::RuntimeConfig& config, const util::Clock& clock = util::SystemClock::Instance());

} // namespace meshdispatch::factory
