#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace gw {

using Json = nlohmann::json;

struct Event {
  std::string type;   // e.g. "unitMoved", "turnEnded"
  Json        data;   // payload object, see the event catalog
};

using EventHandler = std::function<void(const Event&)>;
using HandlerId    = uint64_t;

// Synchronous publish/subscribe. Handlers for one event run in registration
// order; a handler added or removed during emit() takes effect on the next emit.
class EventBus {
public:
  HandlerId on(const std::string& event, EventHandler fn);
  bool      off(const std::string& event, HandlerId id);
  void      emit(const std::string& event, Json data = Json::object()) const;
  void      remove_all_listeners(const std::string& event);
  void      remove_all_listeners();

  std::size_t listener_count(const std::string& event) const;

private:
  struct Slot { HandlerId id; EventHandler fn; };
  std::map<std::string, std::vector<Slot>> slots_;
  HandlerId next_id_{1};
};

// Unsubscribes on destruction. Move-only.
class Subscription {
public:
  Subscription() = default;
  Subscription(EventBus& bus, std::string event, HandlerId id)
    : bus_(&bus), event_(std::move(event)), id_(id) {}
  ~Subscription(){ reset(); }

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;
  Subscription(Subscription&& o) noexcept;
  Subscription& operator=(Subscription&& o) noexcept;

  void reset();
  bool active() const { return bus_ != nullptr; }
  HandlerId id() const { return id_; }

private:
  EventBus*   bus_{nullptr};
  std::string event_;
  HandlerId   id_{0};
};

inline Subscription subscribe(EventBus& bus, const std::string& event, EventHandler fn){
  HandlerId id = bus.on(event, std::move(fn));
  return Subscription(bus, event, id);
}

} // namespace gw
