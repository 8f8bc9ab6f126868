/**
 * @file client_log.hpp
 * @brief Log collaborator used by the connection controller and its components.
 */
#ifndef CLIENT_LOG_HPP
#define CLIENT_LOG_HPP

#include <string>
#include <vector>
#include "log_level.hpp"

/**
 * @brief Abstract log sink. Filtering by severity is the responsibility of the implementation.
 */
class client_log {
public:
    virtual ~client_log() {
    }

    /**
     * @brief Sets the accepted log levels.
     * 
     * @param _log_levels the accepted levels, ALL accepts every level, NONE refuses every level.
     */
    virtual void
    set_log_levels(const std::vector<log_level>& _log_levels) = 0;

    /**
     * @brief Logs a message.
     * 
     * @param _level the severity tag.
     * @param _message the message.
     */
    virtual void
    log(log_level _level, const std::string& _message) = 0;
};

#endif // CLIENT_LOG_HPP
