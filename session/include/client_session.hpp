/**
 * @file client_session.hpp
 * @brief Collaborator interfaces between the connection engine and the protocol stack.
 *
 * All operations report failures through status codes. The open62541 backed implementations
 * live in wrappers/, test doubles implement the same interfaces.
 */
#ifndef CLIENT_SESSION_HPP
#define CLIENT_SESSION_HPP

#include <open62541/types.h>
#include <memory>
#include <string>
#include <vector>
#include "callbacks.hpp"
#include "data_value.hpp"
#include "node_reference.hpp"
#include "types.hpp"

/**
 * @brief Transport endpoint chosen for a configured endpoint identity.
 */
struct endpoint_description {
    std::string endpoint_url_; /**< the configured endpoint identity. */
    std::string server_endpoint_url_; /**< the url announced by the server. */
    std::string security_policy_uri_; /**< the security policy uri. */
    UA_MessageSecurityMode security_mode_ = UA_MESSAGESECURITYMODE_NONE; /**< the message security mode. */
    UA_Byte security_level_ = 0; /**< the relative security level announced by the server. */
};

/**
 * @brief One entry of a batched write.
 */
struct write_entry {
    std::string node_id_; /**< the node id of the written node. */
    data_value value_; /**< the value with timestamp and status. */
    std::string index_range_; /**< the numeric range, empty for the full value. */
};

/**
 * @brief The subscription of a session with its monitored items.
 *
 * Item additions and removals are collected and pushed to the server by apply_changes.
 */
class subscription_context {
public:
    virtual ~subscription_context() = default;

    /**
     * @brief Creates the subscription on the server.
     * 
     * @return UA_StatusCode the status code.
     */
    virtual UA_StatusCode
    create() = 0;

    /**
     * @brief Deletes the subscription and all its monitored items on the server.
     * 
     * @return UA_StatusCode the status code.
     */
    virtual UA_StatusCode
    remove() = 0;

    /**
     * @brief Queues a monitored item for the given node.
     * 
     * @param _node_reference the monitored node.
     * @param _callback the callback invoked on value changes.
     */
    virtual void
    add_item(const node_reference& _node_reference, notification_callback_t _callback) = 0;

    /**
     * @brief Queues the removal of the monitored item of a node.
     * 
     * @param _node_reference the monitored node, matched by display name and node id.
     * @return true if a live or pending item was found.
     * @return false otherwise.
     */
    virtual bool
    remove_item(const node_reference& _node_reference) = 0;

    /**
     * @brief Pushes all queued additions and removals in one batch.
     * 
     * @return UA_StatusCode the status code, bad if any item failed.
     */
    virtual UA_StatusCode
    apply_changes() = 0;

    /**
     * @brief Returns the nodes of all live monitored items.
     * 
     * @return std::vector<node_reference> the monitored nodes.
     */
    virtual std::vector<node_reference>
    get_monitored_items() const = 0;

    virtual size_t
    get_monitored_item_count() const = 0;

    virtual double
    get_publishing_interval() const = 0;
};

/**
 * @brief An open session to one server endpoint.
 */
class client_session {
public:
    virtual ~client_session() = default;

    /**
     * @brief Returns whether the session is activated.
     * 
     * @return true if the session is usable.
     * @return false otherwise.
     */
    virtual bool
    is_connected() const = 0;

    /**
     * @brief Closes the session and its secure channel.
     * 
     */
    virtual void
    close() = 0;

    /**
     * @brief Reconnects the underlying channel and tries to reactivate the same session.
     * 
     * @return UA_StatusCode good if the session was recovered, bad if the server could not recover it.
     */
    virtual UA_StatusCode
    reconnect() = 0;

    /**
     * @brief Installs the liveness callback and sets the keep alive polling interval.
     * 
     * @param _callback the callback receiving the liveness status.
     * @param _interval_ms the keep alive interval.
     */
    virtual void
    set_keep_alive(keep_alive_callback_t _callback, opcua_link::interval_ms_t _interval_ms) = 0;

    /**
     * @brief Browses the hierarchical forward references of a node.
     * 
     * @param _node_id the browsed node.
     * @param _node_class_mask the accepted node classes.
     * @param _references the found references.
     * @return UA_StatusCode the status code.
     */
    virtual UA_StatusCode
    browse(const std::string& _node_id, opcua_link::node_class_mask_t _node_class_mask, std::vector<node_reference>& _references) = 0;

    /**
     * @brief Reads the values of the given nodes.
     * 
     * @param _node_ids the read nodes.
     * @param _values the read values, one per node.
     * @return UA_StatusCode the service result.
     */
    virtual UA_StatusCode
    read(const std::vector<std::string>& _node_ids, std::vector<data_value>& _values) = 0;

    /**
     * @brief Writes the given values.
     * 
     * @param _entries the write entries.
     * @param _results the per item results.
     * @return UA_StatusCode the service result.
     */
    virtual UA_StatusCode
    write(const std::vector<write_entry>& _entries, std::vector<UA_StatusCode>& _results) = 0;

    /**
     * @brief Creates a subscription context that is not yet created on the server.
     * 
     * @param _publishing_interval_ms the publishing interval.
     * @return std::unique_ptr<subscription_context> the subscription context.
     */
    virtual std::unique_ptr<subscription_context>
    create_subscription(double _publishing_interval_ms) = 0;

    /**
     * @brief Processes network events and pending callbacks once.
     * 
     * @param _timeout_ms the maximum wait time.
     * @return UA_StatusCode the status code.
     */
    virtual UA_StatusCode
    run_iterate(opcua_link::timeout_ms_t _timeout_ms) = 0;
};

/**
 * @brief Selects endpoints and opens sessions.
 */
class client_session_factory {
public:
    virtual ~client_session_factory() = default;

    /**
     * @brief Selects the transport endpoint for an endpoint identity.
     * 
     * @param _endpoint the endpoint identity.
     * @param _operation_timeout_ms the operation timeout.
     * @param _description the selected endpoint.
     * @return UA_StatusCode the status code.
     */
    virtual UA_StatusCode
    select_endpoint(const std::string& _endpoint, opcua_link::timeout_ms_t _operation_timeout_ms, endpoint_description& _description) = 0;

    /**
     * @brief Opens a session on the selected endpoint.
     * 
     * @param _description the selected endpoint.
     * @param _session_timeout_ms the requested session timeout.
     * @param _operation_timeout_ms the operation timeout.
     * @param _session the opened session, null on failure.
     * @return UA_StatusCode the status code.
     */
    virtual UA_StatusCode
    open(const endpoint_description& _description, opcua_link::timeout_ms_t _session_timeout_ms, opcua_link::timeout_ms_t _operation_timeout_ms,
         std::unique_ptr<client_session>& _session) = 0;
};

/**
 * @brief Gives the components of a connection access to its session.
 */
class session_provider {
public:
    virtual ~session_provider() = default;

    /**
     * @brief Returns the session, connecting first if none exists.
     * 
     * @return client_session* the session, nullptr if connecting failed.
     */
    virtual client_session*
    acquire_session() = 0;

    /**
     * @brief Returns the session if the connection is operating and the session is connected.
     * 
     * @return client_session* the session or nullptr.
     */
    virtual client_session*
    get_active_session() = 0;

    virtual bool
    is_operating_successfully() const = 0;

    virtual const std::string&
    get_endpoint() const = 0;
};

#endif // CLIENT_SESSION_HPP
