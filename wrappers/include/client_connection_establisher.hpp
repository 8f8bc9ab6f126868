/**
 * @file client_connection_establisher.hpp
 * @brief Selects server endpoints and opens open62541 client sessions.
 */
#ifndef CLIENT_CONNECTION_ESTABLISHER_HPP
#define CLIENT_CONNECTION_ESTABLISHER_HPP

#include <open62541/client_highlevel.h>
#include <open62541/plugin/log.h>
#include <memory>
#include <string>
#include "client_session.hpp"

/**
 * @brief Session factory backed by open62541 clients.
 *
 * Every opened session owns a freshly allocated UA_Client whose stack logging is
 * filtered by the configured minimum level. Only endpoints without message security
 * are selected, certificates are not handled by this client.
 */
class client_connection_establisher : public client_session_factory {
private:
    std::string application_name_; /**< the application name announced to servers. */
    UA_LogLevel stack_log_level_; /**< the minimum level of the stack's own log output. */

    /**
     * @brief Allocates a new client with default configuration.
     * 
     * @param _operation_timeout_ms the operation timeout.
     * @return UA_Client* the client, nullptr if allocation failed.
     */
    UA_Client*
    create_client(opcua_link::timeout_ms_t _operation_timeout_ms);
public:
    /** 
     * @brief Constructs a connection establisher.
     *
     * @param _application_name the application name announced to servers.
     * @param _stack_log_level the minimum level of the stack's own log output.
     */
    client_connection_establisher(std::string _application_name, UA_LogLevel _stack_log_level);

    /**
     * @brief Destructor (does not close any opened session).
     */
    ~client_connection_establisher();

    /**
     * @brief Requests the endpoints of the server and picks the one with the highest security level among the unsecured ones.
     * 
     * @param _endpoint the endpoint url.
     * @param _operation_timeout_ms the operation timeout.
     * @param _description the selected endpoint.
     * @return UA_StatusCode good, the GetEndpoints failure, or BadNotFound if no unsecured endpoint is offered.
     */
    UA_StatusCode
    select_endpoint(const std::string& _endpoint, opcua_link::timeout_ms_t _operation_timeout_ms, endpoint_description& _description) override;

    UA_StatusCode
    open(const endpoint_description& _description, opcua_link::timeout_ms_t _session_timeout_ms, opcua_link::timeout_ms_t _operation_timeout_ms,
         std::unique_ptr<client_session>& _session) override;

    /**
     * @brief Tests if a connection to the given endpoint can be established.
     * 
     * @param _server_endpoint the server endpoint.
     * @return true if connection is established successfully.
     * @return false if connection could not be established.
     */
    static bool 
    test_connection(std::string _server_endpoint);
};

#endif // CLIENT_CONNECTION_ESTABLISHER_HPP
