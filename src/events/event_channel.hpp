#pragma once

#include "events/event_model.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace missionline::events {

// In-process broadcast of decoded progress records.
//
// Single-threaded by contract: Publish() delivers synchronously on the calling
// thread, and the host serializes publishes. Handler registration is owned by
// the caller through a Subscription handle; the channel never keeps a
// consumer alive on its own.
class EventChannel {
public:
  using Handler = std::function<void(const RawEvent&)>;

  // Move-only registration handle. Destroying it (or calling Release())
  // unregisters the handler. Safe to release after the channel is gone.
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    // Idempotent.
    void Release();
    bool Active() const;

  private:
    friend class EventChannel;
    struct Registry;

    Subscription(std::weak_ptr<Registry> registry, std::uint64_t id)
        : registry_(std::move(registry)), id_(id) {}

    std::weak_ptr<Registry> registry_;
    std::uint64_t id_ = 0;
  };

  EventChannel();

  [[nodiscard]] Subscription Subscribe(Handler handler);

  // Delivers `event` to every handler registered when the call starts, in
  // subscription order. Handlers released mid-publish are skipped. Returns
  // the number of handlers invoked.
  std::size_t Publish(const RawEvent& event);

  std::size_t SubscriberCount() const;

private:
  std::shared_ptr<Subscription::Registry> registry_;
};

} // namespace missionline::events
