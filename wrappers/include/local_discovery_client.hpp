#ifndef LOCAL_DISCOVERY_CLIENT_HPP
#define LOCAL_DISCOVERY_CLIENT_HPP

#include <open62541/client.h>
#include <map>
#include <string>
#include <vector>

/**
 * @brief A server announced on the network of a discovery server.
 */
struct network_server {
    UA_UInt32 record_id_; /**< the record id on the discovery server. */
    std::string server_name_; /**< the announced server name. */
    std::string discovery_url_; /**< the discovery url of the server. */
    std::vector<std::string> capabilities_; /**< the announced server capabilities. */
};

/**
 * @brief Looks up servers registered on a local discovery server.
 *
 * Every lookup opens a short lived client, failures are logged and yield empty results.
 */
class local_discovery_client {
private:
    std::string discovery_endpoint_; /**< the endpoint of the discovery server. */

    /**
     * @brief Calls the FindServers service.
     * 
     * @param _application_descriptions stores the registered servers.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    find_servers(std::vector<UA_ApplicationDescription>& _application_descriptions);

    static void
    clear_descriptions(std::vector<UA_ApplicationDescription>& _application_descriptions);
public:
    /**
     * @brief Constructs a lookup against the given discovery server.
     * 
     * @param _discovery_endpoint the endpoint of the discovery server.
     */
    explicit local_discovery_client(std::string _discovery_endpoint);

    ~local_discovery_client();

    /**
     * @brief Returns the discovery urls of all registered servers.
     * 
     * @return std::vector<std::string> the urls.
     */
    std::vector<std::string>
    find_servers_url();

    /**
     * @brief Returns the application names of all registered servers.
     * 
     * @return std::vector<std::string> the application names.
     */
    std::vector<std::string>
    find_servers_app_name();

    /**
     * @brief Maps each discovery url to application name, application type and application uri of its server.
     * 
     * @return std::map<std::string, std::vector<std::string>> the mapping.
     */
    std::map<std::string, std::vector<std::string>>
    map_find_servers();

    /**
     * @brief Returns the servers announced on the network, empty if the stack was built without discovery support.
     * 
     * @return std::vector<network_server> the servers.
     */
    std::vector<network_server>
    find_servers_on_network();

    /**
     * @brief Returns whether the discovery server accepts connections.
     * 
     * @return true if reachable.
     * @return false otherwise.
     */
    bool
    is_reachable() const;

    /**
     * @brief Returns the corresponding string for an application type.
     * 
     * @param _application_type the application type.
     * @return std::string the corresponding string.
     */
    static std::string
    application_type_to_string(UA_ApplicationType _application_type);
};

#endif // LOCAL_DISCOVERY_CLIENT_HPP
