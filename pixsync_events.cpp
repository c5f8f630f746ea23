#include "pixsync_events.h"
#include <exception>
#include <vector>
#include "pixsync_log.h"

visual_state_events::subscription_id visual_state_events::subscribe(gui_state_handler handler) {
  std::lock_guard<std::mutex> lk(mtx);
  subscription_id id = next_id++;
  gui_handlers[id] = std::move(handler);
  return id;
}

bool visual_state_events::dispatching_elsewhere(subscription_id id) const {
  std::thread::id self = std::this_thread::get_id();
  for (const auto &d : dispatching) {
    if (d.first == id && d.second != self) return true;
  }
  return false;
}

bool visual_state_events::unsubscribe(subscription_id id) {
  std::unique_lock<std::mutex> lk(mtx);
  if (gui_handlers.erase(id) == 0) return false;
  dispatch_cv.wait(lk, [&]() { return !dispatching_elsewhere(id); });
  return true;
}

namespace {

// Marks one handler call as running until the call returns or throws.
struct dispatch_mark {
  std::mutex &mtx;
  std::condition_variable &cv;
  std::multiset<std::pair<visual_state_events::subscription_id, std::thread::id>> &running;
  std::multiset<std::pair<visual_state_events::subscription_id, std::thread::id>>::iterator it;

  ~dispatch_mark() {
    {
      std::lock_guard<std::mutex> lk(mtx);
      running.erase(it);
    }
    cv.notify_all();
  }
};

}  // namespace

void visual_state_events::publish(const gui_state_changed &ev) {
  std::vector<subscription_id> ids;
  {
    std::lock_guard<std::mutex> lk(mtx);
    ids.reserve(gui_handlers.size());
    for (const auto &kv : gui_handlers) ids.push_back(kv.first);
  }
  for (subscription_id id : ids) {
    gui_state_handler h;
    std::multiset<std::pair<subscription_id, std::thread::id>>::iterator it;
    {
      std::lock_guard<std::mutex> lk(mtx);
      auto found = gui_handlers.find(id);
      if (found == gui_handlers.end()) continue;   // removed by an earlier handler
      h = found->second;
      it = dispatching.insert(std::make_pair(id, std::this_thread::get_id()));
    }
    dispatch_mark mark{mtx, dispatch_cv, dispatching, it};
    try {
      h(ev);
    } catch (const std::exception &e) {
      sync_log(LOG_LVL_ERROR, "events", "gui state subscriber failed: %s", e.what());
    }
  }
}

size_t visual_state_events::subscriber_count() const {
  std::lock_guard<std::mutex> lk(mtx);
  return gui_handlers.size();
}
