/**
 * @file response_checker.hpp
 * @brief Convenience wrapper for inspecting and validating UA_WriteResponse results.
 */
#ifndef RESPONSE_CHECKER_HPP
#define RESPONSE_CHECKER_HPP

#include <open62541/types_generated.h>

class response_checker {
private:
    const UA_WriteResponse& response_;
public:
    /**
     * @brief Constructs a new response checker instance.
     * 
     * @param _response the response to be checked.
     */
    response_checker(UA_WriteResponse* _response);

    /**
     * @brief Destructs the response checker instance.
     * 
     */
    ~response_checker();

    /**
     * @brief Returns the size of the results array.
     * 
     * @return size_t the size of the results array.
     */
    size_t
    get_results_size() const;

    /**
     * @brief Returns the status code of the write at the given index.
     * 
     * @param _results_index the index in the results array.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    get_result(size_t _results_index) const;

    /**
     * @brief Returns the service result of the response.
     * 
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    get_service_result() const;
};


#endif // RESPONSE_CHECKER_HPP
