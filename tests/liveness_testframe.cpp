#include <iostream>
// uncomment to disable assert()
// #define NDEBUG
#include <cassert>
#include <stdexcept>
#include "connection_controller.hpp"
#include "mock_session.hpp"

// Use (void) to silence unused warnings.
#define assertm(exp, msg) assert((void(msg), exp))

static client_configuration
make_configuration() {
    client_configuration configuration;
    configuration.endpoint_ = "opc.tcp://mock:4840";
    configuration.max_retries_ = 2;
    return configuration;
}

static void
populate(mock_server& _server) {
    _server.add_child(OBJECTS_FOLDER_NODE_ID, variable_node("A"));
}

static void
test_in_place_reconnect() {
    mock_server server;
    populate(server);
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());
    assertm(controller.subscribe(variable_node("A")), "Subscribing must succeed");

    server.keep_alive_callbacks_[0](UA_STATUSCODE_GOOD);
    controller.process_notifications();
    assertm(server.reconnect_calls_ == 0, "Good liveness must not trigger a reconnect");

    keep_alive_callback_t previous = server.keep_alive_callbacks_[0];
    previous(UA_STATUSCODE_BADCONNECTIONCLOSED);
    assertm(controller.process_notifications() == 1, "The liveness status must be handled on drain");
    assertm(server.reconnect_calls_ == 1, "The session must be reconnected in place");
    assertm(server.opened_sessions_ == 1, "No new session must be opened");
    assertm(controller.get_connection_state() == connection_state::CONNECTED_SUBSCRIBED, "The subscription must be kept");

    // the renewed session reports with a new generation
    previous(UA_STATUSCODE_BADCONNECTIONCLOSED);
    controller.process_notifications();
    assertm(server.reconnect_calls_ == 1, "A status of the replaced generation must be ignored");
}

static void
test_session_replaced() {
    mock_server server;
    populate(server);
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());
    assertm(controller.subscribe(variable_node("A")), "Subscribing must succeed");

    server.reconnect_status_ = UA_STATUSCODE_BADSESSIONIDINVALID;
    server.keep_alive_callbacks_[0](UA_STATUSCODE_BADSESSIONCLOSED);
    controller.process_notifications();
    assertm(server.opened_sessions_ == 2, "A new session must be opened");
    assertm(server.closed_sessions_ == 1, "The old session must be closed");
    assertm(server.added_items_["A"] == 2, "The stored reference must be resubscribed");
    assertm(controller.get_references().size() == 1, "The store must be kept");
    assertm(controller.is_operating_successfully(), "The controller must still be operating");
}

static void
test_endpoint_gone() {
    mock_server server;
    populate(server);
    std::shared_ptr<recording_log> log = std::make_shared<recording_log>();
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), log);
    assertm(controller.subscribe(variable_node("A")), "Subscribing must succeed");

    server.reachable_ = false;
    server.reconnect_status_ = UA_STATUSCODE_BADCONNECTIONREJECTED;
    server.keep_alive_callbacks_[0](UA_STATUSCODE_BADCONNECTIONCLOSED);
    controller.process_notifications();
    assertm(!controller.is_operating_successfully(), "The controller must no longer be operating");
    assertm(controller.get_connection_state() == connection_state::DISCONNECTED, "No session must be left");
    assertm(controller.get_references().size() == 1, "The store must be kept for a later reconnect");
    assertm(log->count(log_level::FATAL) >= 1, "Giving up must be logged as fatal");
    assertm(server.select_attempts_ == 3, "The reconnect must be bounded by the retry limit");

    server.reachable_ = true;
    assertm(controller.reconnect(), "Reconnecting must succeed once the endpoint is back");
    assertm(server.added_items_["A"] == 2, "The stored reference must be resubscribed");
}

static void
test_stale_session_ignored() {
    mock_server server;
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());
    assertm(controller.connect(), "Connecting must succeed");
    assertm(controller.connect(), "Connecting again must succeed");
    assertm(server.closed_sessions_ == 1, "The first session must be closed");

    server.keep_alive_callbacks_[0](UA_STATUSCODE_BADCONNECTIONCLOSED);
    controller.process_notifications();
    assertm(server.reconnect_calls_ == 0, "A status of a replaced session must be ignored");
    assertm(server.opened_sessions_ == 2, "A status of a replaced session must not open a session");
}

static void
test_user_handler() {
    mock_server server;
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    std::vector<UA_StatusCode> statuses;
    assertm(controller.connect([&statuses](UA_StatusCode _status) { statuses.push_back(_status); }), "Connecting must succeed");
    server.keep_alive_callbacks_[0](UA_STATUSCODE_BADTIMEOUT);
    controller.process_notifications();
    assertm(statuses.size() == 1 && statuses[0] == UA_STATUSCODE_BADTIMEOUT, "The handler must receive the status");
    assertm(server.reconnect_calls_ == 0, "The handler must replace the default handling");

    assertm(controller.connect(), "Connecting without handler must succeed");
    server.keep_alive_callbacks_[1](UA_STATUSCODE_BADTIMEOUT);
    controller.process_notifications();
    assertm(statuses.size() == 2, "The handler must stay installed for later sessions");

    assertm(controller.connect([](UA_StatusCode) { throw std::runtime_error("handler failure"); }), "Connecting must succeed");
    server.keep_alive_callbacks_[2](UA_STATUSCODE_BADTIMEOUT);
    assertm(controller.process_notifications() == 1, "A throwing handler must not escape the drain");
}

static void
test_event_loop_failure() {
    mock_server server;
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());
    assertm(controller.run_iterate(10) == UA_STATUSCODE_BADCONNECTIONCLOSED, "Iterating without session must report a closed connection");
    assertm(controller.connect(), "Connecting must succeed");

    assertm(controller.run_iterate(10) == UA_STATUSCODE_GOOD, "A good iteration must be reported");
    assertm(server.reconnect_calls_ == 0, "A good iteration must not reconnect");

    server.iterate_status_ = UA_STATUSCODE_BADCONNECTIONCLOSED;
    assertm(controller.run_iterate(10) == UA_STATUSCODE_BADCONNECTIONCLOSED, "The failed iteration must be reported");
    assertm(server.reconnect_calls_ == 1, "A failed iteration must be handled as bad liveness");
}

int main(int argc, char* argv[]) {
    test_in_place_reconnect();
    test_session_replaced();
    test_endpoint_gone();
    test_stale_session_ignored();
    test_user_handler();
    test_event_loop_failure();
    std::cout << "liveness_testframe passed" << std::endl;
    return 0;
}
