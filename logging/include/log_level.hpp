/**
 * @file log_level.hpp
 * @brief Defines the severity tags accepted by the client log.
 */
#ifndef LOG_LEVEL_HPP
#define LOG_LEVEL_HPP

#include <open62541/plugin/log.h>
#include <string>
#include <stdexcept>

/**
 * @brief The severity tags of a log message.
 *
 * ALL and NONE are only meaningful in a filter set, they accept or refuse every tag.
 */
enum class log_level {
    ALL,
    NONE,
    DEBUG,
    MESSAGE,
    INFO,
    WARN,
    ERROR,
    FATAL
};

/**
 * @brief Returns the corresponding string for a log level.
 * 
 * @param _level the log level.
 * @return std::string the corresponding string.
 */
static std::string
log_level_to_string(log_level _level) {
    switch (_level) {
        case log_level::ALL: return "all";
        case log_level::NONE: return "none";
        case log_level::DEBUG: return "debug";
        case log_level::MESSAGE: return "message";
        case log_level::INFO: return "info";
        case log_level::WARN: return "warn";
        case log_level::ERROR: return "error";
        case log_level::FATAL: return "fatal";
        default: return "Unimplemented item";
    }
}

/**
 * @brief Returns the log level for the given name.
 * 
 * @param _name the name, e.g. "warn".
 * @return log_level the log level.
 * @throws std::invalid_argument if the name is unknown.
 */
static log_level
log_level_from_string(const std::string& _name) {
    if (_name == "all") return log_level::ALL;
    if (_name == "none") return log_level::NONE;
    if (_name == "debug") return log_level::DEBUG;
    if (_name == "message") return log_level::MESSAGE;
    if (_name == "info") return log_level::INFO;
    if (_name == "warn") return log_level::WARN;
    if (_name == "error") return log_level::ERROR;
    if (_name == "fatal") return log_level::FATAL;
    throw std::invalid_argument(_name + " is not a valid log level");
}

/**
 * @brief Maps a log level onto the open62541 log level used for printing.
 * 
 * @param _level the log level.
 * @return UA_LogLevel the open62541 log level.
 */
static UA_LogLevel
log_level_to_ua_log_level(log_level _level) {
    switch (_level) {
        case log_level::DEBUG: return UA_LOGLEVEL_DEBUG;
        case log_level::WARN: return UA_LOGLEVEL_WARNING;
        case log_level::ERROR: return UA_LOGLEVEL_ERROR;
        case log_level::FATAL: return UA_LOGLEVEL_FATAL;
        default: return UA_LOGLEVEL_INFO;
    }
}

#endif // LOG_LEVEL_HPP
