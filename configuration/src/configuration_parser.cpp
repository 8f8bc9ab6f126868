#include "../include/configuration_parser.hpp"

#include <fstream>
#include <stdexcept>

#define ENDPOINT_KEY "endpoint"
#define DISCOVERY_ENDPOINT_KEY "discovery_endpoint"
#define APPLICATION_NAME_KEY "application_name"
#define MAX_RETRIES_KEY "max_retries"
#define SESSION_TIMEOUT_KEY "session_timeout_ms"
#define OPERATION_TIMEOUT_KEY "operation_timeout_ms"
#define KEEP_ALIVE_INTERVAL_KEY "keep_alive_interval_ms"
#define PUBLISHING_INTERVAL_KEY "publishing_interval_ms"
#define RETRY_BACKOFF_KEY "retry_backoff_ms"
#define MAX_RETRY_BACKOFF_KEY "max_retry_backoff_ms"
#define NOTIFICATION_QUEUE_CAPACITY_KEY "notification_queue_capacity"
#define LOG_LEVELS_KEY "log_levels"
#define STACK_LOG_LEVEL_KEY "stack_log_level"

static std::string
parse_string_member(const Json::Value& _root, const char* _key, const std::string& _default) {
    if (!_root.isMember(_key))
        return _default;
    if (!_root[_key].isString())
        throw std::invalid_argument(std::string("The setting ") + _key + " must be a string");
    return _root[_key].asString();
}

static opcua_link::interval_ms_t
parse_unsigned_member(const Json::Value& _root, const char* _key, opcua_link::interval_ms_t _default) {
    if (!_root.isMember(_key))
        return _default;
    if (!_root[_key].isUInt())
        throw std::invalid_argument(std::string("The setting ") + _key + " must be a non-negative integer");
    return _root[_key].asUInt();
}

opcua_link::timeout_ms_t
configuration_parser::parse_positive(const Json::Value& _root, const char* _key, opcua_link::timeout_ms_t _default) {
    opcua_link::timeout_ms_t value = parse_unsigned_member(_root, _key, _default);
    if (value == 0)
        throw std::invalid_argument(std::string("The setting ") + _key + " must be greater than 0");
    return value;
}

client_configuration
configuration_parser::parse(const Json::Value& _root) {
    client_configuration configuration;
    configuration.endpoint_ = parse_string_member(_root, ENDPOINT_KEY, configuration.endpoint_);
    configuration.discovery_endpoint_ = parse_string_member(_root, DISCOVERY_ENDPOINT_KEY, configuration.discovery_endpoint_);
    configuration.application_name_ = parse_string_member(_root, APPLICATION_NAME_KEY, configuration.application_name_);

    if (_root.isMember(MAX_RETRIES_KEY)) {
        if (!_root[MAX_RETRIES_KEY].isInt())
            throw std::invalid_argument("The setting " MAX_RETRIES_KEY " must be an integer");
        configuration.max_retries_ = _root[MAX_RETRIES_KEY].asInt();
    }

    configuration.session_timeout_ms_ = parse_positive(_root, SESSION_TIMEOUT_KEY, configuration.session_timeout_ms_);
    configuration.operation_timeout_ms_ = parse_positive(_root, OPERATION_TIMEOUT_KEY, configuration.operation_timeout_ms_);
    configuration.keep_alive_interval_ms_ = parse_positive(_root, KEEP_ALIVE_INTERVAL_KEY, configuration.keep_alive_interval_ms_);

    if (_root.isMember(PUBLISHING_INTERVAL_KEY)) {
        if (!_root[PUBLISHING_INTERVAL_KEY].isNumeric() || _root[PUBLISHING_INTERVAL_KEY].asDouble() <= 0)
            throw std::invalid_argument("The setting " PUBLISHING_INTERVAL_KEY " must be a number greater than 0");
        configuration.publishing_interval_ms_ = _root[PUBLISHING_INTERVAL_KEY].asDouble();
    }

    configuration.retry_backoff_ms_ = parse_unsigned_member(_root, RETRY_BACKOFF_KEY, configuration.retry_backoff_ms_);
    configuration.max_retry_backoff_ms_ = parse_unsigned_member(_root, MAX_RETRY_BACKOFF_KEY, configuration.max_retry_backoff_ms_);
    if (configuration.max_retry_backoff_ms_ < configuration.retry_backoff_ms_)
        throw std::invalid_argument("The setting " MAX_RETRY_BACKOFF_KEY " must not be smaller than " RETRY_BACKOFF_KEY);

    configuration.notification_queue_capacity_ = parse_positive(_root, NOTIFICATION_QUEUE_CAPACITY_KEY, configuration.notification_queue_capacity_);

    if (_root.isMember(LOG_LEVELS_KEY)) {
        const Json::Value& log_levels = _root[LOG_LEVELS_KEY];
        if (!log_levels.isArray())
            throw std::invalid_argument("The setting " LOG_LEVELS_KEY " must be an array of level names");
        configuration.log_levels_.clear();
        for (const Json::Value& level : log_levels) {
            if (!level.isString())
                throw std::invalid_argument("The setting " LOG_LEVELS_KEY " must be an array of level names");
            configuration.log_levels_.push_back(log_level_from_string(level.asString()));
        }
    }

    if (_root.isMember(STACK_LOG_LEVEL_KEY)) {
        if (!_root[STACK_LOG_LEVEL_KEY].isString())
            throw std::invalid_argument("The setting " STACK_LOG_LEVEL_KEY " must be a string");
        configuration.stack_log_level_ = stack_log_level_from_string(_root[STACK_LOG_LEVEL_KEY].asString());
    }
    return configuration;
}

client_configuration
configuration_parser::parse_file(const std::string& _config_path) {
    std::ifstream ifs_config(_config_path);
    if (!ifs_config.is_open())
        throw std::runtime_error("The configuration file " + _config_path + " cannot be opened");
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(ifs_config, root))
        throw std::runtime_error("The configuration file " + _config_path + " is malformed: " + reader.getFormattedErrorMessages());
    if (!root.isObject())
        throw std::runtime_error("The configuration file " + _config_path + " must contain a JSON object");
    return parse(root);
}

client_configuration
configuration_parser::parse_string(const std::string& _document) {
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(_document, root))
        throw std::runtime_error("The configuration is malformed: " + reader.getFormattedErrorMessages());
    if (!root.isObject())
        throw std::runtime_error("The configuration must be a JSON object");
    return parse(root);
}

UA_LogLevel
configuration_parser::stack_log_level_from_string(const std::string& _name) {
    if (_name == "trace") return UA_LOGLEVEL_TRACE;
    if (_name == "debug") return UA_LOGLEVEL_DEBUG;
    if (_name == "info") return UA_LOGLEVEL_INFO;
    if (_name == "warning") return UA_LOGLEVEL_WARNING;
    if (_name == "error") return UA_LOGLEVEL_ERROR;
    if (_name == "fatal") return UA_LOGLEVEL_FATAL;
    throw std::invalid_argument(_name + " is not a valid stack log level");
}
