#ifndef RICHEDIT_CORE_POST_LAYOUT_QUEUE_H
#define RICHEDIT_CORE_POST_LAYOUT_QUEUE_H

#include <cstdint>
#include <functional>
#include <vector>

namespace richedit {

/**
 * PostLayoutQueue: "run once after the next layout" callbacks owned by one component.
 *
 * Callbacks run in FIFO order when the host calls flush() after a layout/paint
 * cycle. Callbacks scheduled while flushing run on the following flush.
 * Destroying the queue (or cancelAll) drops anything still pending.
 */
class PostLayoutQueue {
public:
    using Callback = std::function<void()>;
    using Handle = std::uint32_t;

    PostLayoutQueue() = default;
    ~PostLayoutQueue();

    PostLayoutQueue(const PostLayoutQueue&) = delete;
    PostLayoutQueue& operator=(const PostLayoutQueue&) = delete;

    Handle schedule(Callback callback);

    /**
     * Drop a single pending callback.
     * @return True if it was still pending
     */
    bool cancel(Handle handle);

    void cancelAll();

    /**
     * Run every callback that was pending when flush() was entered.
     * @return Number of callbacks run
     */
    std::size_t flush();

    std::size_t pendingCount() const { return pending_.size(); }
    bool empty() const { return pending_.empty(); }

private:
    struct Entry {
        Handle handle;
        Callback callback;
    };

    std::vector<Entry> pending_;
    // Handles cancelled while their batch is being flushed
    std::vector<Handle> cancelledInFlight_;
    Handle cancelledBelow_ = 0;
    bool flushing_ = false;
    Handle nextHandle_ = 1;
};

} // namespace richedit

#endif // RICHEDIT_CORE_POST_LAYOUT_QUEUE_H
