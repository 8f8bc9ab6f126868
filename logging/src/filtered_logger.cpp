#include "../include/filtered_logger.hpp"
#include <open62541/plugin/log_stdout.h>
#include <open62541/types.h>
#include <algorithm>
#include <stdio.h>

static const char* const ua_log_level_names[6] = {"trace", "debug", "info", "warn", "error", "fatal"};

filtered_logger::filtered_logger() : log_levels_({log_level::ALL}) {
}

filtered_logger::filtered_logger(const std::vector<log_level>& _log_levels) : log_levels_(_log_levels) {
}

filtered_logger::~filtered_logger() {
}

void
filtered_logger::set_log_levels(const std::vector<log_level>& _log_levels) {
    std::lock_guard<std::mutex> lock(log_levels_mutex_);
    log_levels_ = _log_levels;
}

bool
filtered_logger::accepts(log_level _level) const {
    std::lock_guard<std::mutex> lock(log_levels_mutex_);
    auto contains = [this](log_level _candidate) {
        return std::find(log_levels_.begin(), log_levels_.end(), _candidate) != log_levels_.end();
    };
    return (contains(_level) || contains(log_level::ALL)) && !contains(log_level::NONE);
}

void
filtered_logger::log(log_level _level, const std::string& _message) {
    if (!accepts(_level))
        return;
    switch (log_level_to_ua_log_level(_level)) {
        case UA_LOGLEVEL_DEBUG:
            UA_LOG_DEBUG(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s", _message.c_str());
            break;
        case UA_LOGLEVEL_WARNING:
            UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s", _message.c_str());
            break;
        case UA_LOGLEVEL_ERROR:
            UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s", _message.c_str());
            break;
        case UA_LOGLEVEL_FATAL:
            UA_LOG_FATAL(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s", _message.c_str());
            break;
        default:
            UA_LOG_INFO(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s", _message.c_str());
            break;
    }
}

void
filtered_logger::print_log(void* _log_context, UA_LogLevel _level, UA_LogCategory _category,
                    const char* _msg, va_list _args) {
    custom_log_context* ctx = (custom_log_context *)_log_context;

    if (ctx == NULL || _level < ctx->min_level_)
        return;
    int level_index = (int)_level / 100 - 1;
    if (level_index < 0 || level_index > 5)
        level_index = 2;
    fprintf(stdout, "[stack/%s] ", ua_log_level_names[level_index]);
    vfprintf(stdout, _msg, _args);
    fprintf(stdout, "\n");
    fflush(stdout);
}

void
filtered_logger::clear_logger(struct UA_Logger* _logger) {
    UA_free(_logger->context);
    _logger->context = NULL;
    UA_free(_logger);
}

UA_Logger*
filtered_logger::create_filtered_logger(UA_LogLevel _min_level) {
    UA_Logger* logger = (UA_Logger*)UA_malloc(sizeof(UA_Logger));
    if (logger == NULL)
        return NULL;
    custom_log_context* ctx = (custom_log_context *)UA_malloc(sizeof(custom_log_context));
    if (ctx == NULL) {
        UA_free(logger);
        return NULL;
    }
    ctx->min_level_ = _min_level;

    logger->log = print_log;
    logger->context = ctx;
    logger->clear = clear_logger;
    return logger;
}
