#include "gw/events.hpp"
#include <algorithm>
#include <stdexcept>

namespace gw {

HandlerId EventBus::on(const std::string& event, EventHandler fn){
  if (!fn) throw std::invalid_argument("EventBus::on: empty handler for " + event);
  HandlerId id = next_id_++;
  slots_[event].push_back(Slot{id, std::move(fn)});
  return id;
}

bool EventBus::off(const std::string& event, HandlerId id){
  auto it = slots_.find(event);
  if (it == slots_.end()) return false;
  auto& v = it->second;
  auto s = std::find_if(v.begin(), v.end(), [id](const Slot& x){ return x.id==id; });
  if (s == v.end()) return false;
  v.erase(s);
  if (v.empty()) slots_.erase(it);
  return true;
}

void EventBus::emit(const std::string& event, Json data) const {
  auto it = slots_.find(event);
  if (it == slots_.end()) return;
  // Dispatch over a copy: handlers may subscribe or unsubscribe re-entrantly.
  std::vector<Slot> snapshot = it->second;
  Event ev{event, std::move(data)};
  for (auto& s: snapshot) s.fn(ev);
}

void EventBus::remove_all_listeners(const std::string& event){
  slots_.erase(event);
}

void EventBus::remove_all_listeners(){
  slots_.clear();
}

std::size_t EventBus::listener_count(const std::string& event) const {
  auto it = slots_.find(event);
  return it==slots_.end() ? 0 : it->second.size();
}

// ------- Subscription -------

Subscription::Subscription(Subscription&& o) noexcept
  : bus_(o.bus_), event_(std::move(o.event_)), id_(o.id_) {
  o.bus_ = nullptr;
  o.id_  = 0;
}

Subscription& Subscription::operator=(Subscription&& o) noexcept {
  if (this != &o){
    reset();
    bus_   = o.bus_;
    event_ = std::move(o.event_);
    id_    = o.id_;
    o.bus_ = nullptr;
    o.id_  = 0;
  }
  return *this;
}

void Subscription::reset(){
  if (bus_) bus_->off(event_, id_);
  bus_ = nullptr;
  id_  = 0;
}

} // namespace gw
