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
    configuration.max_retries_ = 1;
    return configuration;
}

static void
populate(mock_server& _server) {
    _server.add_child(OBJECTS_FOLDER_NODE_ID, object_node("Server"));
    _server.add_child(OBJECTS_FOLDER_NODE_ID, object_node("Plant"));
    _server.add_child("ns=1;s=Server", variable_node("ServerStatus"));
    _server.add_child("ns=1;s=Plant", variable_node("TestSensor"));
    _server.add_child("ns=1;s=Plant", object_node("Boiler"));
    _server.add_child("ns=1;s=Boiler", variable_node("Pressure"));
}

static void
test_server_subtree_filter() {
    mock_server server;
    populate(server);
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());
    assertm(controller.connect(), "Connecting must succeed");

    std::vector<std::string> names = address_space_walker::get_display_names(controller.get_address_space_walker().browse_node());
    assertm(names.size() == 1 && names[0] == "Plant", "The server subtree must be excluded by default");

    names = address_space_walker::get_display_names(controller.get_address_space_walker().browse_node(OBJECTS_FOLDER_NODE_ID, DEFAULT_BROWSE_CLASS_MASK, true));
    assertm(names.size() == 1 && names[0] == "Server", "Only the server subtree must be returned when included");

    names = address_space_walker::get_display_names(controller.get_address_space_walker().browse_objects_node());
    assertm(names.size() == 4, "The recursive browse must return every node below the objects folder");
    assertm(names[0] == "Plant" && names[1] == "TestSensor" && names[2] == "Boiler" && names[3] == "Pressure",
            "The recursive browse must expand children after their parents");

    names = address_space_walker::get_display_names(controller.get_address_space_walker().browse_server_node());
    // nested nodes are filtered by the default exclusion
    assertm(names.size() == 1 && names[0] == "Server", "The server browse must return the server object");

    std::vector<node_reference> variables = controller.get_address_space_walker().browse_node("ns=1;s=Plant", UA_NODECLASS_VARIABLE);
    assertm(variables.size() == 1 && variables[0].display_name_ == "TestSensor", "The class mask must be honored");
}

static void
test_mixed_children() {
    mock_server server;
    server.add_child("ns=1;s=Mixed", variable_node("ServerStatus"));
    server.add_child("ns=1;s=Mixed", variable_node("TestSensor"));
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());
    assertm(controller.connect(), "Connecting must succeed");

    std::vector<node_reference> references = controller.get_address_space_walker().browse_node("ns=1;s=Mixed");
    assertm(references.size() == 1 && references[0].display_name_ == "TestSensor", "Only TestSensor must be returned");
    references = controller.get_address_space_walker().browse_node("ns=1;s=Mixed", DEFAULT_BROWSE_CLASS_MASK, true);
    assertm(references.size() == 1 && references[0].display_name_ == "ServerStatus", "Only ServerStatus must be returned");
}

static void
test_disconnected_browse() {
    mock_server server;
    populate(server);
    std::shared_ptr<recording_log> log = std::make_shared<recording_log>();
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), log);

    assertm(controller.get_address_space_walker().browse_objects_node().empty(), "Browsing without session must return nothing");
    assertm(server.opened_sessions_ == 0, "Browsing must not connect");
    assertm(log->count(log_level::INFO) == 1, "The bad connection must be logged");
}

static void
test_cycle_guard() {
    mock_server server;
    server.add_child(OBJECTS_FOLDER_NODE_ID, object_node("Loop"));
    server.add_child("ns=1;s=Loop", object_node("Inner"));
    server.add_child("ns=1;s=Inner", object_node("Loop"));
    server.add_child("ns=1;s=Inner", variable_node("Value"));
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());
    assertm(controller.connect(), "Connecting must succeed");

    std::vector<std::string> names = address_space_walker::get_display_names(controller.get_address_space_walker().browse_objects_node());
    assertm(names.size() == 3, "Every node must be returned exactly once");
    assertm(names[0] == "Loop" && names[1] == "Inner" && names[2] == "Value", "The cycle must not be followed");
}

static void
test_browse_failure() {
    mock_server server;
    populate(server);
    std::shared_ptr<recording_log> log = std::make_shared<recording_log>();
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), log);
    assertm(controller.connect(), "Connecting must succeed");

    server.browse_status_ = UA_STATUSCODE_BADTIMEOUT;
    assertm(controller.get_address_space_walker().browse_objects_node().empty(), "A failed browse must return nothing");
    assertm(log->count(log_level::WARN) == 1, "The failure must be logged as warning");
    assertm(controller.is_operating_successfully(), "A failed browse must not change the connection");
}

int main(int argc, char* argv[]) {
    test_server_subtree_filter();
    test_mixed_children();
    test_disconnected_browse();
    test_cycle_guard();
    test_browse_failure();
    std::cout << "browse_filter_testframe passed" << std::endl;
    return 0;
}
