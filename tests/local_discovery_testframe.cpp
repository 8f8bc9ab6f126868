#include <iostream>
// uncomment to disable assert()
// #define NDEBUG
#include <cassert>
#include "local_discovery_client.hpp"

// Use (void) to silence unused warnings.
#define assertm(exp, msg) assert((void(msg), exp))

// nothing listens on this port
#define UNREACHABLE_DISCOVERY_ENDPOINT "opc.tcp://127.0.0.1:1"

static void
test_unreachable_discovery_server() {
    local_discovery_client discovery_client(UNREACHABLE_DISCOVERY_ENDPOINT);
    assertm(!discovery_client.is_reachable(), "The endpoint must not be reachable");
    assertm(discovery_client.find_servers_url().empty(), "No urls must be found");
    assertm(discovery_client.find_servers_app_name().empty(), "No application names must be found");
    assertm(discovery_client.map_find_servers().empty(), "No servers must be mapped");
    assertm(discovery_client.find_servers_on_network().empty(), "No network servers must be found");
}

static void
test_application_types() {
    assertm(local_discovery_client::application_type_to_string(UA_APPLICATIONTYPE_SERVER) == "Server", "Servers must be named");
    assertm(local_discovery_client::application_type_to_string(UA_APPLICATIONTYPE_DISCOVERYSERVER) == "DiscoveryServer", "Discovery servers must be named");
}

int main(int argc, char* argv[]) {
    test_unreachable_discovery_server();
    test_application_types();
    std::cout << "local_discovery_testframe passed" << std::endl;
    return 0;
}
