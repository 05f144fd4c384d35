#include "richedit/core/post_layout_queue.h"

#include <algorithm>
#include <utility>

namespace richedit {

PostLayoutQueue::~PostLayoutQueue() {
    cancelAll();
}

PostLayoutQueue::Handle PostLayoutQueue::schedule(Callback callback) {
    const Handle handle = nextHandle_++;
    pending_.push_back(Entry{handle, std::move(callback)});
    return handle;
}

bool PostLayoutQueue::cancel(Handle handle) {
    auto it = std::find_if(pending_.begin(), pending_.end(),
        [handle](const Entry& e) { return e.handle == handle; });
    if (it == pending_.end()) {
        if (flushing_ && handle < nextHandle_) {
            cancelledInFlight_.push_back(handle);
            return true;
        }
        return false;
    }
    pending_.erase(it);
    return true;
}

void PostLayoutQueue::cancelAll() {
    pending_.clear();
    if (flushing_) {
        // Everything handed out so far is dead, including the running batch.
        cancelledBelow_ = nextHandle_;
    }
}

std::size_t PostLayoutQueue::flush() {
    // Swap out first so callbacks may schedule follow-ups for the next flush.
    std::vector<Entry> batch;
    batch.swap(pending_);
    flushing_ = true;
    std::size_t ran = 0;
    for (Entry& entry : batch) {
        const bool cancelled = entry.handle < cancelledBelow_ || std::find(cancelledInFlight_.begin(), cancelledInFlight_.end(), entry.handle)
            != cancelledInFlight_.end();
        if (cancelled || !entry.callback) {
            continue;
        }
        entry.callback();
        ++ran;
    }
    flushing_ = false;
    cancelledInFlight_.clear();
    cancelledBelow_ = 0;
    return ran;
}

} // namespace richedit
