#include "watch/watch_event.hpp"

bool CreateModifyFilter::should_dispatch(const WatchEvent& event, Clock::time_point now) {
    switch (event.kind) {
        case WatchEventKind::kCreated:
            recently_created_[event.path] = now;
            return true;

        case WatchEventKind::kModified: {
            const auto it = recently_created_.find(event.path);
            if (it == recently_created_.end()) {
                return true;
            }
            if (now - it->second > window_) {
                recently_created_.erase(it);
                return true;
            }
            return false;
        }

        case WatchEventKind::kOther:
            return true;
    }
    return true;
}

void CreateModifyFilter::prune(Clock::time_point now) {
    for (auto it = recently_created_.begin(); it != recently_created_.end();) {
        if (now - it->second > window_) {
            it = recently_created_.erase(it);
        } else {
            ++it;
        }
    }
}
