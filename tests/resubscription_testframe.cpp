#include <iostream>
// uncomment to disable assert()
// #define NDEBUG
#include <cassert>
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

static data_value
int32_value(UA_Int32 _value) {
    return data_value::from_scalar(&_value, &UA_TYPES[UA_TYPES_INT32]);
}

static void
test_resubscription_fidelity() {
    mock_server server;
    server.add_child(OBJECTS_FOLDER_NODE_ID, object_node("Line"));
    server.add_child("ns=1;s=Line", variable_node("A"));
    server.add_child("ns=1;s=Line", variable_node("B"));
    server.add_child("ns=1;s=Line", variable_node("C"));
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    int a_calls = 0, b_calls = 0, c_calls = 0;
    assertm(controller.subscribe(variable_node("A"), [&a_calls](const node_reference&, const data_value&) { a_calls++; }), "Subscribing A must succeed");
    assertm(controller.subscribe(variable_node("B"), [&b_calls](const node_reference&, const data_value&) { b_calls++; }), "Subscribing B must succeed");
    assertm(controller.subscribe(variable_node("C"), [&c_calls](const node_reference&, const data_value&) { c_calls++; }), "Subscribing C must succeed");
    assertm(controller.monitor(true), "Monitoring the server status must succeed");

    server.remove_child("ns=1;s=Line", "B");
    assertm(controller.reconnect(), "Reconnecting must succeed");

    std::vector<std::string> names = address_space_walker::get_display_names(controller.get_references());
    assertm(names.size() == 2 && names[0] == "A" && names[1] == "C", "The store must hold A and C in order");
    assertm(server.added_items_["A"] == 2 && server.added_items_["C"] == 2, "A and C must be resubscribed exactly once");
    assertm(server.added_items_["B"] == 1, "B must not be resubscribed");
    assertm(server.added_items_[SERVER_STATUS_CURRENT_TIME] == 2, "The server status monitor must be re-armed");
    assertm(server.opened_sessions_ == 2, "Reconnecting must open a new session");

    server.emit("A", int32_value(1));
    server.emit("C", int32_value(2));
    controller.process_notifications();
    assertm(a_calls == 1 && c_calls == 1 && b_calls == 0, "The stored callbacks must receive the value changes");
    assertm(controller.get_monitored_items().size() == 3, "A, C and the server status must be monitored");
}

static void
test_replace_not_duplicate() {
    mock_server server;
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    int old_calls = 0, new_calls = 0;
    assertm(controller.subscribe(variable_node("A"), [&old_calls](const node_reference&, const data_value&) { old_calls++; }), "Subscribing must succeed");
    node_reference rebrowsed("A", UA_NODECLASS_VARIABLE, "ns=1;s=A", "");
    assertm(controller.subscribe(rebrowsed, [&new_calls](const node_reference&, const data_value&) { new_calls++; }), "Subscribing again must succeed");

    assertm(controller.get_references().size() == 1, "The store size must be unchanged");
    assertm(controller.get_monitored_items().size() == 1, "The prior monitored item must be cancelled");
    server.emit("A", int32_value(7));
    controller.process_notifications();
    assertm(old_calls == 0 && new_calls == 1, "Only the new callback must be active");
}

static void
test_same_display_name() {
    mock_server server;
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    node_reference line_one("Temp", UA_NODECLASS_VARIABLE, "ns=1;s=L1.Temp");
    node_reference line_two("Temp", UA_NODECLASS_VARIABLE, "ns=1;s=L2.Temp");
    int line_one_calls = 0, old_calls = 0, new_calls = 0;
    assertm(controller.subscribe(line_one, [&line_one_calls](const node_reference&, const data_value&) { line_one_calls++; }), "Subscribing line one must succeed");
    assertm(controller.subscribe(line_two, [&old_calls](const node_reference&, const data_value&) { old_calls++; }), "Subscribing line two must succeed");
    assertm(controller.subscribe(line_two, [&new_calls](const node_reference&, const data_value&) { new_calls++; }), "Subscribing line two again must succeed");

    assertm(controller.get_references().size() == 2, "Both nodes must stay in the store");
    assertm(controller.get_monitored_items().size() == 2, "Each node must have exactly one monitored item");
    server.emit(line_one, int32_value(1));
    server.emit(line_two, int32_value(2));
    controller.process_notifications();
    assertm(line_one_calls == 1, "The item of the same named node must survive the replacement");
    assertm(old_calls == 0 && new_calls == 1, "Only the new callback of the replaced node must be active");

    assertm(controller.stop_subscription(line_two), "Stopping line two must succeed");
    std::vector<node_reference> monitored = controller.get_monitored_items();
    assertm(monitored.size() == 1 && monitored[0].node_id_ == "ns=1;s=L1.Temp", "Stopping must cancel only the matching node");
    server.emit(line_one, int32_value(3));
    controller.process_notifications();
    assertm(line_one_calls == 2, "The remaining node must still be monitored");
}

static void
test_default_callback_and_class_filter() {
    mock_server server;
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    int calls = 0;
    std::vector<node_reference> references = {object_node("Line"), variable_node("A"), variable_node("B")};
    assertm(controller.subscribe(references, [&calls](const node_reference&, const data_value&) { calls++; }, UA_NODECLASS_VARIABLE),
            "Batch subscribing must succeed");
    assertm(controller.get_references().size() == 2, "Only variables must be subscribed");
    assertm(!controller.subscribe(object_node("Other"), nullptr, UA_NODECLASS_VARIABLE), "An object must be rejected by the class filter");

    // the last given callback became the default
    assertm(controller.subscribe(variable_node("C")), "Subscribing without callback must succeed");
    server.emit("C", int32_value(3));
    controller.process_notifications();
    assertm(calls == 1, "The default callback must be the last given one");
}

static void
test_stop_subscription() {
    mock_server server;
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    assertm(controller.subscribe(variable_node("A")), "Subscribing must succeed");
    assertm(controller.stop_subscription(node_reference("A", UA_NODECLASS_UNSPECIFIED, "ns=1;s=A")), "Stopping must find the reference by identity");
    assertm(controller.get_references().empty(), "The store entry must be removed");
    assertm(controller.get_monitored_items().empty(), "The monitored item must be removed");
    assertm(!controller.stop_subscription(variable_node("A")), "Stopping twice must fail");

    assertm(controller.subscribe(variable_node("B")), "Subscribing must succeed");
    controller.disconnect();
    assertm(controller.stop_subscription(variable_node("B")), "Stopping while disconnected must still remove the entry");
    assertm(controller.get_references().empty(), "The store entry must be removed");
}

static void
test_monitor() {
    mock_server server;
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    assertm(controller.monitor(false), "Disabling an inactive monitor must have no effect");
    assertm(!controller.is_server_status_monitored(), "The monitor must stay inactive");
    assertm(server.opened_sessions_ == 0, "Disabling an inactive monitor must not connect");

    int calls = 0;
    assertm(controller.monitor(true, [&calls](const node_reference&, const data_value&) { calls++; }), "Enabling must succeed");
    assertm(controller.monitor(true), "Re-arming must succeed");
    assertm(controller.get_monitored_items().size() == 1, "Re-arming must not duplicate the monitored item");
    server.emit(SERVER_STATUS_CURRENT_TIME, int32_value(0));
    controller.process_notifications();
    assertm(calls == 1, "Re-arming must keep the callback");

    assertm(controller.monitor(false), "Disabling must succeed");
    assertm(controller.get_monitored_items().empty(), "The monitored item must be removed");
    assertm(!controller.is_server_status_monitored(), "The monitor must be inactive");
}

int main(int argc, char* argv[]) {
    test_resubscription_fidelity();
    test_replace_not_duplicate();
    test_same_display_name();
    test_default_callback_and_class_filter();
    test_stop_subscription();
    test_monitor();
    std::cout << "resubscription_testframe passed" << std::endl;
    return 0;
}
