#include "../include/notification_channel.hpp"

notification_channel::notification_channel(size_t _capacity) : capacity_(_capacity), pending_(0) {
}

notification_channel::~notification_channel() {
    io_context_.stop();
}

bool
notification_channel::post(std::function<void()> _handler) {
    size_t pending = pending_.load();
    do {
        if (pending >= capacity_)
            return false;
    } while (!pending_.compare_exchange_weak(pending, pending + 1));

    boost::asio::post(io_context_, [this, _handler]() {
        pending_--;
        _handler();
    });
    return true;
}

namespace {
/**
 * @brief Restarts a polled io context on scope exit, also when a handler throws.
 */
class restart_guard {
private:
    boost::asio::io_context& io_context_;
public:
    explicit restart_guard(boost::asio::io_context& _io_context) : io_context_(_io_context) {
    }

    ~restart_guard() {
        io_context_.restart();
    }
};
}

size_t
notification_channel::drain() {
    restart_guard guard(io_context_);
    return io_context_.poll();
}

size_t
notification_channel::get_pending() const {
    return pending_.load();
}

size_t
notification_channel::get_capacity() const {
    return capacity_;
}
