#ifndef NODE_IDS_HPP
#define NODE_IDS_HPP

/* ADDRESS SPACE */
// well-known node ids (namespace 0)
#define OBJECTS_FOLDER_NODE_ID "i=85"
#define SERVER_STATUS_CURRENT_TIME_NODE_ID "i=2258"
// display names
#define SERVER_STATUS_CURRENT_TIME "ServerStatusCurrentTime"
// browse filter token for the server subtree
#define SERVER_SUBTREE_TOKEN "Server"

/* DEFAULTS */
#define DEFAULT_MAX_CONNECTION_RETRIES 10
#define DEFAULT_SESSION_TIMEOUT_MS 60000
#define DEFAULT_OPERATION_TIMEOUT_MS 15000
#define DEFAULT_KEEP_ALIVE_INTERVAL_MS 5000
#define DEFAULT_PUBLISHING_INTERVAL_MS 1000
#define DEFAULT_MAX_RETRY_BACKOFF_MS 30000
#define DEFAULT_NOTIFICATION_QUEUE_CAPACITY 1024
#define DEFAULT_APPLICATION_NAME "opcua-link client"

#endif // NODE_IDS_HPP
