#include "event_hub.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace coolrouter::events {

Subscription::~Subscription() {
  if (auto hub = hub_.lock()) {
    hub->Remove(queue_);
  }
}

std::optional<EventEnvelope> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(queue_->mutex);
  queue_->cv.wait_for(lock, timeout, [&] { return !queue_->events.empty() || queue_->closed; });
  if (queue_->events.empty()) {
    return std::nullopt;
  }
  auto envelope = std::move(queue_->events.front());
  queue_->events.pop_front();
  return envelope;
}

uint64_t Subscription::Dropped() const {
  std::scoped_lock lock(queue_->mutex);
  return queue_->dropped;
}

bool Subscription::Closed() const {
  std::scoped_lock lock(queue_->mutex);
  return queue_->closed && queue_->events.empty();
}

EventHub::EventHub(std::size_t queue_depth) : queue_depth_(queue_depth == 0 ? 1 : queue_depth) {
}

void EventHub::Publish(Event event) {
  std::scoped_lock lock(mutex_);
  if (closed_) {
    return;
  }

  EventEnvelope envelope{++sequence_, util::NowMillis(), std::move(event)};
  for (const auto& queue : queues_) {
    {
      std::scoped_lock queue_lock(queue->mutex);
      if (queue->events.size() >= queue->capacity) {
        queue->events.pop_front();
        if (queue->dropped++ == 0) {
          COOLROUTER_LOG_WARN("Event subscriber is falling behind; dropping oldest events",
                              {observability::IntField("queue_depth", static_cast<int64_t>(queue->capacity))});
        }
      }
      queue->events.push_back(envelope);
    }
    queue->cv.notify_one();
  }
}

std::unique_ptr<Subscription> EventHub::Subscribe() {
  auto queue      = std::make_shared<Subscription::Queue>();
  queue->capacity = queue_depth_;

  std::scoped_lock lock(mutex_);
  queue->closed = closed_;
  queues_.push_back(queue);
  return std::unique_ptr<Subscription>(new Subscription(weak_from_this(), std::move(queue)));
}

void EventHub::Close() {
  std::scoped_lock lock(mutex_);
  closed_ = true;
  for (const auto& queue : queues_) {
    {
      std::scoped_lock queue_lock(queue->mutex);
      queue->closed = true;
    }
    queue->cv.notify_all();
  }
}

uint64_t EventHub::LastSequence() const {
  std::scoped_lock lock(mutex_);
  return sequence_;
}

void EventHub::Remove(const std::shared_ptr<Subscription::Queue>& queue) {
  std::scoped_lock lock(mutex_);
  queues_.remove(queue);
}

} // namespace coolrouter::events
