#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/inbound/inbound_queue.hpp"
#include "internal/inbound/inbound_worker.hpp"

namespace {

using meshdispatch::inbound::InboundQueue;
using meshdispatch::inbound::InboundWorker;

void TestFifoOrder() {
  InboundQueue queue(4);
  queue.Push("a");
  queue.Push("b");
  queue.Push("c");
  assert(queue.Size() == 3);
  assert(*queue.Dequeue() == "a");
  assert(*queue.Dequeue() == "b");
  assert(*queue.Dequeue() == "c");
}

void TestOverflowDropsOldest() {
  InboundQueue queue(3);
  for (int i = 0; i < 5; ++i) {
    queue.Push("f" + std::to_string(i));
  }
  assert(queue.Size() == 3);
  assert(queue.Dropped() == 2);
  assert(*queue.Dequeue() == "f2");
  assert(*queue.Dequeue() == "f3");
  assert(*queue.Dequeue() == "f4");
}

void TestShutdownDrainsThenEnds() {
  InboundQueue queue(2);
  queue.Push("last");
  queue.Shutdown();
  queue.Push("ignored");
  assert(*queue.Dequeue() == "last");
  assert(!queue.Dequeue().has_value());
}

void TestZeroCapacityRejected() {
  bool threw = false;
  try {
    InboundQueue queue(0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestWorkerSurvivesHandlerFailures() {
  auto queue = std::make_shared<InboundQueue>(16);

  std::mutex               mutex;
  std::vector<std::string> seen;
  InboundWorker            worker(queue, [&](const std::string& frame) {
    if (frame == "boom") {
      throw std::runtime_error("handler failed");
    }
    std::lock_guard lock(mutex);
    seen.push_back(frame);
  });
  worker.Start();

  queue->Push("one");
  queue->Push("boom");
  queue->Push("two");
  worker.Stop();

  assert(seen.size() == 2);
  assert(seen[0] == "one");
  assert(seen[1] == "two");
}

void TestSingleConsumerNeverOverlaps() {
  auto queue = std::make_shared<InboundQueue>(256);

  std::atomic<int> in_handler{0};
  std::atomic<int> handled{0};
  std::atomic<bool> overlapped{false};
  InboundWorker    worker(queue, [&](const std::string&) {
    if (in_handler.fetch_add(1) != 0) {
      overlapped = true;
    }
    std::this_thread::sleep_for(std::chrono::microseconds(50));
    in_handler.fetch_sub(1);
    handled.fetch_add(1);
  });
  worker.Start();

  std::vector<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&queue, p] {
      for (int i = 0; i < 25; ++i) {
        queue->Push(std::to_string(p) + ":" + std::to_string(i));
      }
    });
  }
  for (auto& t : producers) {
    t.join();
  }
  worker.Stop();

  assert(!overlapped);
  assert(handled.load() == 100);
}

} // namespace

int main() {
  TestFifoOrder();
  TestOverflowDropsOldest();
  TestShutdownDrainsThenEnds();
  TestZeroCapacityRejected();
  TestWorkerSurvivesHandlerFailures();
  TestSingleConsumerNeverOverlaps();

  std::cout << "meshdispatch_unit_inbound_queue: pass\n";
  return 0;
}
