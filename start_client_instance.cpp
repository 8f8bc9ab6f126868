#include <signal.h>
#include <atomic>
#include <exception>
#include <iostream>

#include "configuration_parser.hpp"
#include "connection_controller.hpp"
#include "local_discovery_client.hpp"

#define ITERATE_TIMEOUT_MS 100

std::atomic<bool> running_(true);

static void stop_handler(int sig) {
    std::cout << "received ctrl-c" << std::endl;
    running_ = false;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, stop_handler);
    signal(SIGTERM, stop_handler);

    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <config_file_name>" << std::endl;
        return 0;
    }

    client_configuration configuration;
    try {
        configuration = configuration_parser::parse_file(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    if (configuration.endpoint_.empty()) {
        if (configuration.discovery_endpoint_.empty()) {
            std::cerr << "Neither endpoint nor discovery_endpoint is configured" << std::endl;
            return 1;
        }
        std::vector<std::string> urls = local_discovery_client(configuration.discovery_endpoint_).find_servers_url();
        if (urls.empty()) {
            std::cerr << "No server registered on " << configuration.discovery_endpoint_ << std::endl;
            return 1;
        }
        configuration.endpoint_ = urls.front();
    }

    connection_controller controller(configuration);
    if (!controller.connect())
        return 1;

    std::vector<node_reference> references = controller.get_address_space_walker().browse_objects_node();
    controller.subscribe(references, nullptr, UA_NODECLASS_VARIABLE);
    controller.monitor(true);

    while (running_ && controller.is_operating_successfully())
        controller.run_iterate(ITERATE_TIMEOUT_MS);

    controller.disconnect();
    return controller.is_operating_successfully() ? 0 : 1;
}
