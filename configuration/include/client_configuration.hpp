/**
 * @file client_configuration.hpp
 * @brief Settings of one connection controller.
 */
#ifndef CLIENT_CONFIGURATION_HPP
#define CLIENT_CONFIGURATION_HPP

#include <open62541/plugin/log.h>
#include <string>
#include <vector>
#include "log_level.hpp"
#include "node_ids.hpp"
#include "types.hpp"

/**
 * @brief The settings handed to a connection controller, defaults apply to every missing setting.
 */
struct client_configuration {
    std::string endpoint_ = ""; /**< the endpoint url, e.g. opc.tcp://localhost:4840. */
    std::string discovery_endpoint_ = ""; /**< the discovery server used when no endpoint is set. */
    std::string application_name_ = DEFAULT_APPLICATION_NAME; /**< the application name announced to servers. */
    opcua_link::retry_count_t max_retries_ = DEFAULT_MAX_CONNECTION_RETRIES; /**< the connect attempts before giving up, negative for unlimited. */
    opcua_link::timeout_ms_t session_timeout_ms_ = DEFAULT_SESSION_TIMEOUT_MS; /**< the requested session timeout. */
    opcua_link::timeout_ms_t operation_timeout_ms_ = DEFAULT_OPERATION_TIMEOUT_MS; /**< the timeout of a single service call. */
    opcua_link::interval_ms_t keep_alive_interval_ms_ = DEFAULT_KEEP_ALIVE_INTERVAL_MS; /**< the keep alive polling interval. */
    double publishing_interval_ms_ = DEFAULT_PUBLISHING_INTERVAL_MS; /**< the publishing interval of new subscriptions. */
    opcua_link::interval_ms_t retry_backoff_ms_ = 0; /**< the initial wait between connect attempts, 0 retries immediately. */
    opcua_link::interval_ms_t max_retry_backoff_ms_ = DEFAULT_MAX_RETRY_BACKOFF_MS; /**< the upper bound of the doubled wait. */
    size_t notification_queue_capacity_ = DEFAULT_NOTIFICATION_QUEUE_CAPACITY; /**< the capacity of the notification channel. */
    std::vector<log_level> log_levels_ = {log_level::ALL}; /**< the accepted client log levels. */
    UA_LogLevel stack_log_level_ = UA_LOGLEVEL_WARNING; /**< the minimum level of the stack's own log output. */
};

#endif // CLIENT_CONFIGURATION_HPP
