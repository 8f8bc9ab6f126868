/**
 * @file configuration_parser.hpp
 * @brief Reads client configurations from JSON documents.
 *
 * Recognized keys: endpoint, discovery_endpoint, application_name, max_retries,
 * session_timeout_ms, operation_timeout_ms, keep_alive_interval_ms, publishing_interval_ms,
 * retry_backoff_ms, max_retry_backoff_ms, notification_queue_capacity, log_levels and
 * stack_log_level. Unknown keys are ignored.
 */
#ifndef CONFIGURATION_PARSER_HPP
#define CONFIGURATION_PARSER_HPP

#include <jsoncpp/json/json.h>
#include <string>
#include "client_configuration.hpp"

class configuration_parser {
private:
    /**
     * @brief Overrides the defaults with the members of a JSON object.
     * 
     * @param _root the JSON object.
     * @return client_configuration the configuration.
     * @throws std::invalid_argument if a value has the wrong type or is out of range.
     */
    static client_configuration
    parse(const Json::Value& _root);

    static opcua_link::timeout_ms_t
    parse_positive(const Json::Value& _root, const char* _key, opcua_link::timeout_ms_t _default);
public:
    /**
     * @brief Reads the configuration file.
     * 
     * @param _config_path the path of the JSON file.
     * @return client_configuration the configuration.
     * @throws std::runtime_error if the file is unreadable or not a JSON object.
     * @throws std::invalid_argument if a value has the wrong type or is out of range.
     */
    static client_configuration
    parse_file(const std::string& _config_path);

    /**
     * @brief Reads the configuration from a JSON string.
     * 
     * @param _document the JSON document.
     * @return client_configuration the configuration.
     * @throws std::runtime_error if the document is not a JSON object.
     * @throws std::invalid_argument if a value has the wrong type or is out of range.
     */
    static client_configuration
    parse_string(const std::string& _document);

    /**
     * @brief Returns the open62541 log level for the given name.
     * 
     * @param _name one of trace, debug, info, warning, error, fatal.
     * @return UA_LogLevel the log level.
     * @throws std::invalid_argument if the name is unknown.
     */
    static UA_LogLevel
    stack_log_level_from_string(const std::string& _name);
};

#endif // CONFIGURATION_PARSER_HPP
