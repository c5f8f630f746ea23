#pragma once
#include <stdint.h>
#include <functional>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <utility>
#include "pixsync_state.h"

// Events raised by the owner of the visual state.
struct gui_state_changed {
  gui_state state;
};

// Typed subscription hub: handlers register for gui_state_changed only, so
// every subscriber is dispatched through the same checked signature.
// Handlers run on the publishing thread, outside the hub lock. Once
// unsubscribe() returns the handler is not running and will not run again,
// except when a handler unsubscribes itself.
class visual_state_events {
public:
  typedef uint64_t subscription_id;
  typedef std::function<void(const gui_state_changed &)> gui_state_handler;

  visual_state_events() {}
  visual_state_events(const visual_state_events&) = delete;
  visual_state_events& operator=(const visual_state_events&) = delete;

  subscription_id subscribe(gui_state_handler handler);
  bool unsubscribe(subscription_id id);
  void publish(const gui_state_changed &ev);
  size_t subscriber_count() const;

private:
  mutable std::mutex mtx;
  subscription_id next_id = 1;
  std::map<subscription_id, gui_state_handler> gui_handlers;
  std::multiset<std::pair<subscription_id, std::thread::id>> dispatching;
  std::condition_variable dispatch_cv;

  bool dispatching_elsewhere(subscription_id id) const;
};
