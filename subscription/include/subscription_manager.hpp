/**
 * @file subscription_manager.hpp
 * @brief Owner of the single subscription context of a connection.
 */
#ifndef SUBSCRIPTION_MANAGER_HPP
#define SUBSCRIPTION_MANAGER_HPP

#include <memory>
#include <string>
#include <vector>
#include "client_log.hpp"
#include "client_session.hpp"

/**
 * @brief Creates the subscription context lazily and forwards item changes to it.
 *
 * Failures of the subscription context are logged and never propagated.
 */
class subscription_manager {
private:
    session_provider& session_provider_; /**< the connection providing the session. */
    client_log& log_; /**< the log. */
    std::unique_ptr<subscription_context> context_; /**< the subscription context, null until ready. */
public:
    /**
     * @brief Constructs a new subscription manager object.
     * 
     * @param _session_provider the connection providing the session.
     * @param _log the log.
     */
    subscription_manager(session_provider& _session_provider, client_log& _log);

    ~subscription_manager();

    /**
     * @brief Makes sure a subscription context exists.
     *
     * Connects if there is no session. If the connection is operating and connected but
     * has no context, a context with the given publishing interval is created on the server.
     * The publishing interval of an existing context is left unchanged.
     * @param _publishing_interval_ms the publishing interval for a new context.
     * @return true if a context exists afterwards.
     * @return false otherwise.
     */
    bool
    ensure_ready(double _publishing_interval_ms);

    bool
    has_context() const;

    /**
     * @brief Queues a monitored item, pushed by apply_changes.
     * 
     * @param _node_reference the monitored node.
     * @param _callback the callback invoked on value changes.
     * @return true if queued.
     * @return false if there is no context.
     */
    bool
    add_monitored_item(const node_reference& _node_reference, notification_callback_t _callback);

    /**
     * @brief Queues the removal of a monitored item, pushed by apply_changes.
     * 
     * @param _node_reference the monitored node, matched by display name and node id.
     * @return true if the item was found.
     * @return false otherwise.
     */
    bool
    remove_monitored_item(const node_reference& _node_reference);

    /**
     * @brief Returns whether a live monitored item of the node exists.
     * 
     * @param _node_reference the node, matched by display name and node id.
     * @return true if monitored.
     * @return false otherwise.
     */
    bool
    is_monitored(const node_reference& _node_reference) const;

    /**
     * @brief Pushes queued additions and removals.
     * 
     * @return true if all changes were applied.
     * @return false otherwise, the failure is logged.
     */
    bool
    apply_changes();

    std::vector<node_reference>
    get_monitored_items() const;

    size_t
    get_monitored_item_count() const;

    /**
     * @brief Drops the context.
     * 
     * @param _remove_from_session true to delete the subscription on the server first.
     */
    void
    release(bool _remove_from_session);
};

#endif // SUBSCRIPTION_MANAGER_HPP
