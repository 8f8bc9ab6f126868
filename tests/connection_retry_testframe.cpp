#include <iostream>
// uncomment to disable assert()
// #define NDEBUG
#include <cassert>
#include "connection_controller.hpp"
#include "mock_session.hpp"

// Use (void) to silence unused warnings.
#define assertm(exp, msg) assert((void(msg), exp))

static client_configuration
make_configuration(opcua_link::retry_count_t _max_retries) {
    client_configuration configuration;
    configuration.endpoint_ = "opc.tcp://mock:4840";
    configuration.max_retries_ = _max_retries;
    return configuration;
}

static void
test_retry_bound() {
    mock_server server;
    server.reachable_ = false;
    std::shared_ptr<recording_log> log = std::make_shared<recording_log>();
    connection_controller controller(make_configuration(3), std::make_unique<mock_session_factory>(server), log);

    assertm(!controller.connect(), "Connecting to an unreachable endpoint must fail");
    assertm(server.select_attempts_ == 3, "Exactly max_retries attempts must be made");
    assertm(controller.get_current_retries() == 3, "The retry counter must hold the failed attempts");
    assertm(!controller.is_operating_successfully(), "The controller must no longer be operating");
    assertm(controller.get_connection_state() == connection_state::DISCONNECTED, "No session must exist");
    assertm(log->count(log_level::FATAL) == 1, "Giving up must be logged as fatal");

    server.reachable_ = true;
    assertm(controller.connect(), "Connecting to a reachable endpoint must succeed");
    assertm(controller.get_current_retries() == 0, "The retry counter must be reset on success");
    assertm(controller.is_operating_successfully(), "The controller must be operating again");
    assertm(controller.get_connection_state() == connection_state::CONNECTED_NO_SUBSCRIPTION, "A session without subscription must exist");
}

static void
test_unlimited_retries_with_backoff() {
    mock_server server;
    server.failing_attempts_ = 5;
    client_configuration configuration = make_configuration(-1);
    configuration.retry_backoff_ms_ = 1;
    configuration.max_retry_backoff_ms_ = 4;
    connection_controller controller(configuration, std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    assertm(controller.connect(), "Unlimited retries must outlast transient failures");
    assertm(server.select_attempts_ == 6, "Five failed attempts must precede the successful one");
    assertm(controller.get_current_retries() == 0, "The retry counter must be reset on success");
}

static void
test_idempotent_disconnect() {
    mock_server server;
    connection_controller controller(make_configuration(3), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    controller.disconnect();
    controller.disconnect();
    assertm(controller.get_session() == nullptr, "A never connected controller has no session");

    assertm(controller.connect(), "Connecting must succeed");
    assertm(controller.subscribe(variable_node("Temperature")), "Subscribing must succeed");
    assertm(controller.get_connection_state() == connection_state::CONNECTED_SUBSCRIBED, "A subscription context must exist");

    controller.disconnect();
    assertm(controller.get_session() == nullptr, "Disconnect must clear the session");
    assertm(controller.get_connection_state() == connection_state::DISCONNECTED, "Disconnect must clear the subscription context");
    assertm(server.removed_contexts_ == 1, "The subscription must be removed from a connected session");
    assertm(server.closed_sessions_ == 1, "The session must be closed");
    controller.disconnect();
    assertm(server.closed_sessions_ == 1, "A second disconnect must have no effect");
    assertm(controller.get_references().size() == 1, "Disconnect must keep the stored references");
}

static void
test_connect_replaces_session() {
    mock_server server;
    connection_controller controller(make_configuration(3), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    assertm(controller.connect(), "Connecting must succeed");
    assertm(controller.connect(), "Connecting again must succeed");
    assertm(server.opened_sessions_ == 2 && server.closed_sessions_ == 1, "The previous session must be closed");
}

static void
test_reset_endpoint() {
    mock_server server;
    connection_controller controller(make_configuration(3), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    assertm(controller.subscribe(variable_node("Temperature")), "Subscribing connects and must succeed");
    assertm(controller.monitor(true), "Monitoring must succeed");
    controller.reset_endpoint("opc.tcp://other:4840");
    assertm(controller.get_endpoint() == "opc.tcp://other:4840", "The endpoint must be reassigned");
    assertm(controller.get_references().empty(), "The stored references must be cleared");
    assertm(!controller.is_server_status_monitored(), "The server status monitor must be cleared");
    assertm(controller.get_session() == nullptr, "The stale session must be closed");
    assertm(controller.is_operating_successfully() && controller.get_current_retries() == 0, "The controller must be reset");
}

int main(int argc, char* argv[]) {
    test_retry_bound();
    test_unlimited_retries_with_backoff();
    test_idempotent_disconnect();
    test_connect_replaces_session();
    test_reset_endpoint();
    std::cout << "connection_retry_testframe passed" << std::endl;
    return 0;
}
