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

static UA_Variant
int32_array(const std::vector<UA_Int32>& _values) {
    UA_Variant variant;
    UA_Variant_init(&variant);
    UA_Variant_setArrayCopy(&variant, _values.data(), _values.size(), &UA_TYPES[UA_TYPES_INT32]);
    return variant;
}

static void
test_write_results() {
    mock_server server;
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());
    assertm(controller.connect(), "Connecting must succeed");

    UA_Double setpoint = 21.5;
    UA_Variant value;
    UA_Variant_setScalar(&value, &setpoint, &UA_TYPES[UA_TYPES_DOUBLE]);
    std::vector<node_reference> references = {variable_node("A"), variable_node("B"), variable_node("C")};

    assertm(controller.get_value_io().write_to_nodes(references, value), "Writing must succeed when all results are good");
    assertm(server.last_write_.size() == 3, "One write entry per node must be sent");
    assertm(server.last_write_[1].node_id_ == "ns=1;s=B", "The entries must follow the node order");
    assertm(server.last_write_[0].index_range_.empty(), "No index range must be sent");

    server.write_results_ = {UA_STATUSCODE_GOOD, UA_STATUSCODE_BADNOTWRITABLE, UA_STATUSCODE_GOOD};
    assertm(!controller.get_value_io().write_to_nodes(references, value), "One bad result must fail the write");
    server.write_results_ = {UA_STATUSCODE_GOOD, UA_STATUSCODE_GOODCLAMPED, UA_STATUSCODE_UNCERTAININITIALVALUE};
    assertm(controller.get_value_io().write_to_nodes(references, value), "Good subcodes and uncertain results must not fail the write");
    server.write_results_.clear();
    assertm(controller.get_value_io().write_to_node(variable_node("A"), value), "Writing a single node must succeed");
}

static void
test_index_range() {
    mock_server server;
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());
    assertm(controller.connect(), "Connecting must succeed");

    UA_Variant array = int32_array({1, 2, 3, 4});
    assertm(controller.get_value_io().write_to_node(variable_node("Array"), array, "1:2"), "Writing with an index range must succeed");
    assertm(server.last_write_.size() == 1, "One write entry must be sent");
    const UA_Variant& written = server.last_write_[0].value_.get_variant();
    assertm(written.arrayLength == 2, "The value must be narrowed to the range");
    assertm(((UA_Int32*) written.data)[0] == 2 && ((UA_Int32*) written.data)[1] == 3, "The narrowed value must hold the ranged elements");
    assertm(server.last_write_[0].index_range_ == "1:2", "The index range must be sent with the narrowed value");

    assertm(controller.get_value_io().write_to_node(variable_node("Array"), array, "not a range"), "An invalid range must not fail the write");
    assertm(server.last_write_[0].value_.get_variant().arrayLength == 4, "An invalid range must send the full value");
    assertm(server.last_write_[0].index_range_.empty(), "An invalid range must not be sent");
    UA_Variant_clear(&array);
}

static void
test_read() {
    mock_server server;
    UA_Int32 temperature = 42;
    server.values_["ns=1;s=Temperature"] = data_value::from_scalar(&temperature, &UA_TYPES[UA_TYPES_INT32]);
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), std::make_shared<recording_log>());

    assertm(controller.get_value_io().read_node(variable_node("Temperature")).empty(), "Reading without session must return nothing");
    assertm(server.opened_sessions_ == 0, "Reading must not connect");

    assertm(controller.connect(), "Connecting must succeed");
    std::vector<data_value> values = controller.get_value_io().read_nodes({variable_node("Temperature"), variable_node("Missing")});
    assertm(values.size() == 2, "One value per node must be returned");
    assertm(values[0].has_scalar_type(&UA_TYPES[UA_TYPES_INT32]), "The value must be an Int32 scalar");
    assertm(*(UA_Int32*) values[0].get_variant().data == 42, "The value must be the server's value");
    assertm(values[1].get_status() == UA_STATUSCODE_BADNODEIDUNKNOWN, "An unknown node must carry its bad status");
}

static void
test_disconnected_write() {
    mock_server server;
    std::shared_ptr<recording_log> log = std::make_shared<recording_log>();
    connection_controller controller(make_configuration(), std::make_unique<mock_session_factory>(server), log);

    UA_Boolean on = true;
    UA_Variant value;
    UA_Variant_setScalar(&value, &on, &UA_TYPES[UA_TYPES_BOOLEAN]);
    assertm(!controller.get_value_io().write_to_node(variable_node("Switch"), value), "Writing without session must fail");
    assertm(server.last_write_.empty(), "Nothing must be sent");
    assertm(log->count(log_level::ERROR) == 1, "The failure must be logged");
}

int main(int argc, char* argv[]) {
    test_write_results();
    test_index_range();
    test_read();
    test_disconnected_write();
    std::cout << "value_io_testframe passed" << std::endl;
    return 0;
}
