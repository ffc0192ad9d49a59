#include "inbound_worker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace meshdispatch::inbound {

InboundWorker::InboundWorker(std::shared_ptr<InboundQueue> queue, FrameHandler handler)
    : queue_(std::move(queue)),
      handler_(std::move(handler)) {}

InboundWorker::~InboundWorker() {
  Stop();
}

void InboundWorker::Start() {
  thread_ = std::thread(&InboundWorker::Run, this);
}

void InboundWorker::Stop() {
  queue_->Shutdown();
  if (thread_.joinable())
    thread_.join();
}

void InboundWorker::Run() {
  // Drains what is already queued even after Stop() so no received frame
  // is silently lost on shutdown.
  while (true) {
    auto frame = queue_->Dequeue();
    if (!frame)
      break;

    try {
      handler_(*frame);
    }
    catch (const std::exception& e) {
      MESHDISPATCH_LOG_ERROR("inbound frame handling failed", {observability::StringField("error", e.what())});
    }
  }
}

}
