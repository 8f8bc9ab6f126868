/**
 * @file connection_controller.hpp
 * @brief Connection lifecycle and subscription durability of one OPC UA client.
 *
 * @details
 * The controller establishes a session to its endpoint, watches the session's liveness,
 * reconnects on failure and replays every stored subscription against the recreated
 * session. Subscriptions are replayed against the current address space, so nodes that
 * disappeared on the server are dropped from the reference store instead of resubscribed.
 *
 * All operations and all notification handlers run on the thread that calls run_iterate
 * or process_notifications. The session's callbacks only post into a bounded notification
 * channel.
 */
#ifndef CONNECTION_CONTROLLER_HPP
#define CONNECTION_CONTROLLER_HPP

#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <vector>

#include "address_space_walker.hpp"
#include "client_configuration.hpp"
#include "client_log.hpp"
#include "client_session.hpp"
#include "notification_channel.hpp"
#include "reference_store.hpp"
#include "subscription_manager.hpp"
#include "types.hpp"
#include "value_io.hpp"

/**
 * @brief The connection states of a controller.
 */
enum class connection_state {
    DISCONNECTED, /**< no session. */
    CONNECTED_NO_SUBSCRIPTION, /**< a session without subscription context. */
    CONNECTED_SUBSCRIBED /**< a session with a subscription context. */
};

/**
 * @brief Returns the corresponding string for a connection state.
 * 
 * @param _state the connection state.
 * @return std::string the corresponding string.
 */
std::string
connection_state_to_string(connection_state _state);

class connection_controller : public session_provider {
private:
    client_configuration configuration_; /**< the configuration. */
    std::string endpoint_; /**< the endpoint identity. */
    std::shared_ptr<client_log> log_; /**< the log. */
    std::unique_ptr<client_session_factory> session_factory_; /**< the factory opening sessions. */
    std::unique_ptr<client_session> session_; /**< the session, null while disconnected. */
    reference_store references_; /**< the subscribed references, kept across reconnects. */
    subscription_manager subscription_manager_; /**< the owner of the subscription context. */
    address_space_walker address_space_walker_; /**< the address space browser. */
    value_io value_io_; /**< the value reader and writer. */
    notification_channel notification_channel_; /**< the channel carrying session notifications. */
    boost::asio::io_context timer_context_; /**< the io context of the retry backoff timer. */
    boost::asio::steady_timer backoff_timer_; /**< the retry backoff timer. */
    bool operating_; /**< whether the endpoint is believed reachable. */
    opcua_link::retry_count_t current_retries_; /**< the failed attempts of the current connect. */
    double current_publishing_interval_; /**< the publishing interval of the next subscription context. */
    opcua_link::interval_ms_t keep_alive_interval_; /**< the keep alive interval of the current session. */
    opcua_link::session_generation_t session_generation_; /**< incremented whenever the session is replaced or renewed. */
    keep_alive_callback_t keep_alive_handler_; /**< the caller supplied liveness handler, empty for the default handling. */
    notification_callback_t default_notification_callback_; /**< the callback used by subscribes without callback. */
    bool server_status_monitored_; /**< whether the server status is monitored. */
    notification_callback_t server_status_callback_; /**< the callback of the server status monitor. */

    /**
     * @brief Selects the endpoint and opens a session, installing the liveness callback.
     * 
     * @param _session_timeout_ms the session timeout.
     * @param _keep_alive_interval_ms the keep alive interval.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    open_session(opcua_link::timeout_ms_t _session_timeout_ms, opcua_link::interval_ms_t _keep_alive_interval_ms);

    /**
     * @brief Blocks the calling thread for the given time.
     * 
     * @param _backoff_ms the wait time.
     */
    void
    wait_backoff(opcua_link::interval_ms_t _backoff_ms);

    /**
     * @brief Creates the liveness callback of a session, posting into the notification channel.
     * 
     * @param _generation the generation of the session.
     * @return keep_alive_callback_t the callback.
     */
    keep_alive_callback_t
    make_keep_alive_callback(opcua_link::session_generation_t _generation);

    /**
     * @brief Wraps a value change callback so that it runs when the notification channel is drained.
     * 
     * @param _callback the callback.
     * @return notification_callback_t the posting callback.
     */
    notification_callback_t
    make_channel_callback(notification_callback_t _callback);

    /**
     * @brief Dispatches a liveness status, ignoring statuses of replaced sessions.
     * 
     * @param _generation the generation of the reporting session.
     * @param _status the liveness status.
     */
    void
    on_keep_alive(opcua_link::session_generation_t _generation, UA_StatusCode _status);

    /**
     * @brief Logs a value change at message level.
     * 
     * @param _node_reference the changed node.
     * @param _value the new value.
     */
    void
    log_notification(const node_reference& _node_reference, const data_value& _value);

    /**
     * @brief Returns the given callback and makes it the default, or the default if none is given.
     * 
     * @param _callback the callback or an empty function.
     * @return notification_callback_t the resolved callback.
     */
    notification_callback_t
    resolve_callback(notification_callback_t _callback);

    /**
     * @brief Stores the reference, replacing a prior entry and its monitored item, and queues its monitored item.
     * 
     * @param _node_reference the node.
     * @param _callback the callback.
     */
    void
    queue_subscription(const node_reference& _node_reference, notification_callback_t _callback);

    /**
     * @brief Queues the server status monitored item with the stored callback and applies it.
     * 
     * @return true if applied.
     * @return false otherwise.
     */
    bool
    arm_server_status();

    bool
    ensure_ready();
public:
    /**
     * @brief Constructs a controller opening open62541 sessions.
     * 
     * @param _configuration the configuration.
     * @param _log the log, a filtered logger with the configured levels if null.
     */
    explicit connection_controller(const client_configuration& _configuration, std::shared_ptr<client_log> _log = nullptr);

    /**
     * @brief Constructs a controller opening sessions with the given factory.
     * 
     * @param _configuration the configuration.
     * @param _session_factory the session factory.
     * @param _log the log, a filtered logger with the configured levels if null.
     */
    connection_controller(const client_configuration& _configuration, std::unique_ptr<client_session_factory> _session_factory,
                          std::shared_ptr<client_log> _log = nullptr);

    /**
     * @brief Disconnects and destroys the controller.
     * 
     */
    ~connection_controller();

    connection_controller(const connection_controller&) = delete;
    connection_controller& operator=(const connection_controller&) = delete;

    /**
     * @brief Connects to the endpoint, retrying up to the configured maximum.
     *
     * An existing session is torn down first, stored references are kept. A supplied liveness
     * handler replaces the default liveness handling for this and all later sessions.
     * @param _keep_alive_handler the liveness handler or an empty function.
     * @param _session_timeout_ms the session timeout, 0 for the configured one.
     * @param _keep_alive_interval_ms the keep alive interval, 0 for the configured one.
     * @return true if connected.
     * @return false if all attempts failed, the controller is no longer operating.
     */
    bool
    connect(keep_alive_callback_t _keep_alive_handler = nullptr, opcua_link::timeout_ms_t _session_timeout_ms = 0,
            opcua_link::interval_ms_t _keep_alive_interval_ms = 0);

    /**
     * @brief Releases the subscription context and closes the session. Calling it again has no effect.
     * 
     */
    void
    disconnect();

    /**
     * @brief Redirects the controller to another endpoint, dropping all stored references.
     * 
     * @param _endpoint the new endpoint.
     */
    void
    reset_endpoint(const std::string& _endpoint);

    /**
     * @brief Disconnects, connects again and resubscribes all stored references.
     * 
     * @return true if resubscribed.
     * @return false if connecting failed.
     */
    bool
    reconnect();

    /**
     * @brief Default liveness handling: in-place reconnect, then full resubscription, then shutdown.
     * 
     * @param _status the liveness status.
     */
    void
    handle_keep_alive(UA_StatusCode _status);

    /**
     * @brief Connects and resubscribes every stored reference that still exists on the server.
     *
     * References missing from the current address space are removed from the store.
     * An active server status monitor is re-armed.
     * @return true if connected and resubscribed.
     * @return false if connecting failed.
     */
    bool
    resubscribe_references();

    /**
     * @brief Subscribes to value changes of a node.
     * 
     * @param _node_reference the node.
     * @param _callback the callback, empty for the default callback. A given callback becomes the default.
     * @param _allow_class the accepted node class, unspecified for every class.
     * @param _publishing_interval_ms the publishing interval of a new subscription context, negative for the configured one.
     * @return true if the monitored item was created.
     * @return false otherwise.
     */
    bool
    subscribe(const node_reference& _node_reference, notification_callback_t _callback = nullptr, UA_NodeClass _allow_class = UA_NODECLASS_UNSPECIFIED,
              double _publishing_interval_ms = -1);

    /**
     * @brief Subscribes to value changes of nodes in one batch.
     * 
     * @param _node_references the nodes.
     * @param _callback the callback, empty for the default callback. A given callback becomes the default.
     * @param _allow_class the accepted node class, unspecified for every class.
     * @param _publishing_interval_ms the publishing interval of a new subscription context, negative for the configured one.
     * @return true if at least one node passed the class filter and all monitored items were created.
     * @return false otherwise.
     */
    bool
    subscribe(const std::vector<node_reference>& _node_references, notification_callback_t _callback = nullptr,
              UA_NodeClass _allow_class = UA_NODECLASS_UNSPECIFIED, double _publishing_interval_ms = -1);

    /**
     * @brief Cancels the subscription of a node and removes it from the reference store.
     * 
     * @param _node_reference the node, matched by display name and node id.
     * @return true if the node was subscribed.
     * @return false otherwise.
     */
    bool
    stop_subscription(const node_reference& _node_reference);

    /**
     * @brief Enables, re-arms or disables monitoring of the server's current time.
     *
     * Enabling without callback re-arms an active monitor with its callback, or logs the
     * value changes if the monitor was inactive. Disabling an inactive monitor has no effect.
     * @param _enable true to monitor.
     * @param _callback the callback or an empty function.
     * @param _publishing_interval_ms the publishing interval of a new subscription context, negative for the configured one.
     * @return true if the monitor is in the requested state.
     * @return false otherwise.
     */
    bool
    monitor(bool _enable = true, notification_callback_t _callback = nullptr, double _publishing_interval_ms = -1);

    /**
     * @brief Sets the publishing interval of subscription contexts created later.
     * 
     * @param _publishing_interval_ms the interval, negative for the configured one.
     */
    void
    set_publishing_interval(double _publishing_interval_ms);

    double
    get_publishing_interval() const;

    /**
     * @brief Drives the session's event loop once, then runs all queued notifications.
     *
     * A failing event loop is reported as bad liveness of the session.
     * @param _timeout_ms the maximum wait for network events.
     * @return UA_StatusCode the status of the event loop, BadConnectionClosed without session.
     */
    UA_StatusCode
    run_iterate(opcua_link::timeout_ms_t _timeout_ms);

    /**
     * @brief Runs all queued notifications.
     * 
     * @return size_t the number of notifications handled.
     */
    size_t
    process_notifications();

    client_session*
    acquire_session() override;

    client_session*
    get_active_session() override;

    bool
    is_operating_successfully() const override;

    const std::string&
    get_endpoint() const override;

    opcua_link::retry_count_t
    get_current_retries() const;

    connection_state
    get_connection_state() const;

    /**
     * @brief Returns the session, which may be stale.
     * 
     * @return client_session* the session or nullptr.
     */
    client_session*
    get_session() const;

    std::vector<node_reference>
    get_references() const;

    /**
     * @brief Looks up a stored reference by display name and node id.
     * 
     * @param _display_name the display name.
     * @param _node_id the node id.
     * @return const node_reference* the stored reference or nullptr.
     */
    const node_reference*
    get_reference(const std::string& _display_name, const std::string& _node_id) const;

    void
    clear_references();

    /**
     * @brief Returns the live monitored items, creating the subscription context if necessary.
     * 
     * @return std::vector<node_reference> the monitored nodes.
     */
    std::vector<node_reference>
    get_monitored_items();

    bool
    is_server_status_monitored() const;

    address_space_walker&
    get_address_space_walker();

    value_io&
    get_value_io();

    client_log&
    get_log();

    const client_configuration&
    get_configuration() const;
};

#endif // CONNECTION_CONTROLLER_HPP
