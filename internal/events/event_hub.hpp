#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/events/events.hpp"

namespace coolrouter::events {

class EventHub;

/*
  Bounded per-subscriber queue. Closing the hub or destroying the
  subscription wakes any waiter.
*/
class Subscription {
 public:
  ~Subscription();

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  // nullopt on timeout or once the hub is closed and the queue drained.
  std::optional<EventEnvelope> Next(std::chrono::milliseconds timeout);

  uint64_t Dropped() const;

  // True once the hub closed and the queue is drained.
  bool Closed() const;

 private:
  friend class EventHub;

  struct Queue {
    std::mutex                mutex;
    std::condition_variable   cv;
    std::deque<EventEnvelope> events;
    std::size_t               capacity = 0;
    uint64_t                  dropped  = 0;
    bool                      closed   = false;
  };

  Subscription(std::weak_ptr<EventHub> hub, std::shared_ptr<Queue> queue) : hub_(std::move(hub)), queue_(std::move(queue)) {
  }

  std::weak_ptr<EventHub> hub_;
  std::shared_ptr<Queue>  queue_;
};

class EventHub final : public EventSink, public std::enable_shared_from_this<EventHub> {
 public:
  explicit EventHub(std::size_t queue_depth = 1024);

  void Publish(Event event) override;

  std::unique_ptr<Subscription> Subscribe();

  // Wakes all subscribers; later Publish calls are ignored.
  void Close();

  uint64_t LastSequence() const;

 private:
  friend class Subscription;

  void Remove(const std::shared_ptr<Subscription::Queue>& queue);

  const std::size_t queue_depth_;

  mutable std::mutex                             mutex_;
  std::list<std::shared_ptr<Subscription::Queue>> queues_;
  uint64_t                                       sequence_ = 0;
  bool                                           closed_   = false;
};

} // namespace coolrouter::events
