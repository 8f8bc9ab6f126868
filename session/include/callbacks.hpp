/**
 * @file callbacks.hpp
 * @brief Callback signatures shared by the session collaborators and the controller.
 */
#ifndef CALLBACKS_HPP
#define CALLBACKS_HPP

#include <open62541/types.h>
#include <functional>
#include "node_reference.hpp"
#include "data_value.hpp"

/**
 * @brief Receives a value change of a monitored node.
 */
typedef std::function<void(const node_reference&, const data_value&)> notification_callback_t;

/**
 * @brief Receives the liveness status of a session.
 */
typedef std::function<void(UA_StatusCode)> keep_alive_callback_t;

#endif // CALLBACKS_HPP
