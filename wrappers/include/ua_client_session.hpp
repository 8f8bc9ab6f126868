/**
 * @file ua_client_session.hpp
 * @brief Client session owning an open62541 client.
 */
#ifndef UA_CLIENT_SESSION_HPP
#define UA_CLIENT_SESSION_HPP

#include <open62541/client_highlevel.h>
#include <string>
#include "client_session.hpp"

/**
 * @brief Session on a connected UA_Client.
 *
 * The liveness callback is fed by the client's state and inactivity callbacks, which
 * open62541 invokes from within UA_Client_run_iterate. Callbacks raised while the
 * session itself closes or reconnects the channel are suppressed.
 */
class ua_client_session : public client_session {
private:
    UA_Client* client_; /**< the owned client. */
    std::string endpoint_url_; /**< the endpoint the client connected to. */
    keep_alive_callback_t keep_alive_callback_; /**< the liveness callback. */
    bool suppress_callbacks_; /**< true while the session changes its own connection state. */

    /**
     * @brief Forwards bad connection states of the client.
     * 
     * @param _client the client.
     * @param _channel_state the secure channel state.
     * @param _session_state the session state.
     * @param _connect_status the connect status.
     */
    static void
    state_changed(UA_Client* _client, UA_SecureChannelState _channel_state, UA_SessionState _session_state, UA_StatusCode _connect_status);

    /**
     * @brief Forwards a failed connectivity check of the client.
     * 
     * @param _client the client.
     */
    static void
    inactivity_detected(UA_Client* _client);

    void
    notify_keep_alive(UA_StatusCode _status);
public:
    /**
     * @brief Takes ownership of a connected client.
     * 
     * @param _client the connected client.
     * @param _endpoint_url the endpoint url used for reconnecting.
     */
    ua_client_session(UA_Client* _client, std::string _endpoint_url);

    /**
     * @brief Disconnects and deletes the client.
     * 
     */
    ~ua_client_session();

    ua_client_session(const ua_client_session&) = delete;
    ua_client_session& operator=(const ua_client_session&) = delete;

    bool
    is_connected() const override;

    void
    close() override;

    /**
     * @brief Renews the secure channel and reactivates the session.
     *
     * open62541 silently creates a new session when the old one cannot be activated,
     * so the authentication tokens before and after are compared.
     * @return UA_StatusCode good if the same session is active again, BadSessionIdInvalid if a new session had to be created, or the connect failure.
     */
    UA_StatusCode
    reconnect() override;

    void
    set_keep_alive(keep_alive_callback_t _callback, opcua_link::interval_ms_t _interval_ms) override;

    UA_StatusCode
    browse(const std::string& _node_id, opcua_link::node_class_mask_t _node_class_mask, std::vector<node_reference>& _references) override;

    UA_StatusCode
    read(const std::vector<std::string>& _node_ids, std::vector<data_value>& _values) override;

    UA_StatusCode
    write(const std::vector<write_entry>& _entries, std::vector<UA_StatusCode>& _results) override;

    std::unique_ptr<subscription_context>
    create_subscription(double _publishing_interval_ms) override;

    UA_StatusCode
    run_iterate(opcua_link::timeout_ms_t _timeout_ms) override;
};

#endif // UA_CLIENT_SESSION_HPP
