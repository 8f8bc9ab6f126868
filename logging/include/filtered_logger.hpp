/**
 * @file filtered_logger.hpp
 * @brief Default client log and open62541 logger instances filtered by level.
 */
#ifndef FILTERED_LOGGER_HPP
#define FILTERED_LOGGER_HPP

#include <open62541/plugin/log.h>
#include <stdarg.h>
#include <mutex>
#include <vector>
#include "client_log.hpp"

/**
 * @brief Context object specifying the minimal log level forwarded by a stack logger.
 */
typedef struct {
    UA_LogLevel min_level_; /**< minimum log level accepted. */
} custom_log_context;

/**
 * @brief Client log printing accepted messages through the open62541 stdout logger.
 *
 * Also a factory for level filtered UA_Logger objects handed to the client configuration.
 */
class filtered_logger : public client_log {
private:
    std::vector<log_level> log_levels_; /**< the accepted log levels. */
    mutable std::mutex log_levels_mutex_; /**< the mutex guarding the accepted log levels. */

    /**
     * @brief Filters the print function.
     * 
     * @param _log_context the log context.
     * @param _level the log level.
     * @param _category the log category.
     * @param _msg the message.
     * @param _args the message format args.
     */
    static void 
    print_log(void* _log_context, UA_LogLevel _level, UA_LogCategory _category, const char* _msg, va_list _args);

    /**
     * @brief Cleanup hook releasing the allocated context and the logger itself.
     * 
     * @param _logger the logger to be cleared.
     */
    static void
    clear_logger(struct UA_Logger* _logger);
public:
    /**
     * @brief Constructs a new filtered logger accepting all levels.
     * 
     */
    filtered_logger();

    /**
     * @brief Constructs a new filtered logger accepting the given levels.
     * 
     * @param _log_levels the accepted log levels.
     */
    explicit filtered_logger(const std::vector<log_level>& _log_levels);

    /**
     * @brief Destroys the filtered logger object.
     * 
     */
    ~filtered_logger();

    void
    set_log_levels(const std::vector<log_level>& _log_levels) override;

    void
    log(log_level _level, const std::string& _message) override;

    /**
     * @brief Returns whether a message with the given level passes the filter.
     * 
     * @param _level the log level.
     * @return true if the level is accepted and NONE is not set.
     * @return false otherwise.
     */
    bool
    accepts(log_level _level) const;

    /**
     * @brief Creates a heap allocated stack logger forwarding messages at or above the given level to stdout.
     *
     * The returned logger is released by its own clear callback, which the client config calls on deletion.
     * @param _min_level minimum log level.
     * @return UA_Logger* logger suitable for UA_ClientConfig::logging, nullptr if out of memory.
     */
    static UA_Logger*
    create_filtered_logger(UA_LogLevel _min_level);
};

#endif // FILTERED_LOGGER_HPP
