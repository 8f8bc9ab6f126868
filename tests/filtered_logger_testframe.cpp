#include <iostream>
// uncomment to disable assert()
// #define NDEBUG
#include <cassert>
#include <stdexcept>
#include "filtered_logger.hpp"

// Use (void) to silence unused warnings.
#define assertm(exp, msg) assert((void(msg), exp))

static void
test_filter() {
    filtered_logger all;
    assertm(all.accepts(log_level::DEBUG) && all.accepts(log_level::FATAL), "ALL must accept every level");

    filtered_logger selected({log_level::WARN, log_level::ERROR});
    assertm(selected.accepts(log_level::WARN), "A listed level must be accepted");
    assertm(!selected.accepts(log_level::INFO), "An unlisted level must be refused");

    selected.set_log_levels({log_level::ALL, log_level::NONE});
    assertm(!selected.accepts(log_level::FATAL), "NONE must refuse every level");

    selected.set_log_levels({log_level::MESSAGE});
    assertm(selected.accepts(log_level::MESSAGE) && !selected.accepts(log_level::WARN), "Replaced levels must be effective");
    selected.log(log_level::MESSAGE, "filtered_logger_testframe message");
    selected.log(log_level::WARN, "must not be printed");
}

static void
test_level_names() {
    assertm(log_level_from_string("warn") == log_level::WARN, "Level names must be parsed");
    assertm(log_level_to_string(log_level::MESSAGE) == "message", "Levels must be named");
    bool rejected = false;
    try {
        log_level_from_string("verbose");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assertm(rejected, "Unknown level names must be rejected");
    assertm(log_level_to_ua_log_level(log_level::FATAL) == UA_LOGLEVEL_FATAL, "Fatal must map onto the stack's fatal level");
    assertm(log_level_to_ua_log_level(log_level::MESSAGE) == UA_LOGLEVEL_INFO, "Message must be printed at info level");
}

static void
test_stack_logger() {
    UA_Logger* logger = filtered_logger::create_filtered_logger(UA_LOGLEVEL_WARNING);
    assertm(logger != nullptr, "The stack logger must be created");
    assertm(logger->log != nullptr && logger->clear != nullptr, "The stack logger must be callable and clearable");
    UA_LOG_WARNING(logger, UA_LOGCATEGORY_USERLAND, "filtered_logger_testframe warning %d", 1);
    UA_LOG_INFO(logger, UA_LOGCATEGORY_USERLAND, "must not be printed");
    logger->clear(logger);
}

int main(int argc, char* argv[]) {
    test_filter();
    test_level_names();
    test_stack_logger();
    std::cout << "filtered_logger_testframe passed" << std::endl;
    return 0;
}
