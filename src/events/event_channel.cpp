#include "events/event_channel.hpp"

#include <algorithm>

namespace missionline::events {

struct EventChannel::Subscription::Registry {
  struct Entry {
    std::uint64_t id = 0;
    // Shared so an in-flight publish keeps the callable alive even if the
    // handler releases its own subscription.
    std::shared_ptr<Handler> handler;
  };

  std::vector<Entry> entries;
  std::uint64_t next_id = 1;

  bool Contains(std::uint64_t id) const {
    return std::any_of(entries.begin(), entries.end(),
                       [id](const Entry& entry) { return entry.id == id; });
  }

  void Remove(std::uint64_t id) {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [id](const Entry& entry) { return entry.id == id; }),
                  entries.end());
  }
};

EventChannel::Subscription::~Subscription() {
  Release();
}

EventChannel::Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_)), id_(other.id_) {
  other.id_ = 0;
}

EventChannel::Subscription& EventChannel::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Release();
    registry_ = std::move(other.registry_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void EventChannel::Subscription::Release() {
  if (id_ == 0) {
    return;
  }
  if (const auto registry = registry_.lock()) {
    registry->Remove(id_);
  }
  registry_.reset();
  id_ = 0;
}

bool EventChannel::Subscription::Active() const {
  if (id_ == 0) {
    return false;
  }
  const auto registry = registry_.lock();
  return registry != nullptr && registry->Contains(id_);
}

EventChannel::EventChannel() : registry_(std::make_shared<Subscription::Registry>()) {}

EventChannel::Subscription EventChannel::Subscribe(Handler handler) {
  const std::uint64_t id = registry_->next_id++;
  registry_->entries.push_back({id, std::make_shared<Handler>(std::move(handler))});
  return Subscription(registry_, id);
}

std::size_t EventChannel::Publish(const RawEvent& event) {
  // Snapshot so handlers may subscribe or release while being called.
  const std::vector<Subscription::Registry::Entry> snapshot = registry_->entries;

  std::size_t delivered = 0;
  for (const auto& entry : snapshot) {
    if (!registry_->Contains(entry.id) || !entry.handler || !*entry.handler) {
      continue;
    }
    (*entry.handler)(event);
    ++delivered;
  }
  return delivered;
}

std::size_t EventChannel::SubscriberCount() const {
  return registry_->entries.size();
}

} // namespace missionline::events
