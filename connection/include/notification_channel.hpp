/**
 * @file notification_channel.hpp
 * @brief Bounded channel delivering session notifications to the controller's thread.
 */
#ifndef NOTIFICATION_CHANNEL_HPP
#define NOTIFICATION_CHANNEL_HPP

#include <boost/asio.hpp>
#include <atomic>
#include <functional>

/**
 * @brief Multi producer, single consumer queue of handlers backed by an io context.
 *
 * Producers post from any thread, the consumer runs the queued handlers on its own thread
 * by draining. Handlers posted beyond the capacity are dropped.
 */
class notification_channel {
private:
    boost::asio::io_context io_context_; /**< the io context queueing the handlers. */
    size_t capacity_; /**< the maximum number of queued handlers. */
    std::atomic<size_t> pending_; /**< the number of queued handlers. */
public:
    /**
     * @brief Constructs a new notification channel object.
     * 
     * @param _capacity the maximum number of queued handlers.
     */
    explicit notification_channel(size_t _capacity);

    ~notification_channel();

    /**
     * @brief Queues a handler.
     * 
     * @param _handler the handler.
     * @return true if queued.
     * @return false if the channel is full and the handler was dropped.
     */
    bool
    post(std::function<void()> _handler);

    /**
     * @brief Runs all queued handlers, including handlers queued meanwhile, on the calling thread.
     *
     * An exception thrown by a handler propagates, the channel stays usable and the
     * remaining handlers run on the next drain.
     * @return size_t the number of handlers run.
     */
    size_t
    drain();

    size_t
    get_pending() const;

    size_t
    get_capacity() const;
};

#endif // NOTIFICATION_CHANNEL_HPP
