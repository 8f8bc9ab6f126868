#include "../include/response_checker.hpp"
#include <stdexcept>

static const UA_WriteResponse&
checked_response(UA_WriteResponse* _response) {
    if (_response == NULL)
        throw std::invalid_argument("response must not be null");
    return *_response;
}

response_checker::response_checker(UA_WriteResponse* _response) : response_(checked_response(_response)) {
}

response_checker::~response_checker() {
}

size_t response_checker::get_results_size() const {
    return response_.resultsSize;
}

UA_StatusCode response_checker::get_result(size_t _results_index) const {
    if (_results_index >= get_results_size())
        throw std::invalid_argument("results_index is out of range");
    return response_.results[_results_index];
}

UA_StatusCode response_checker::get_service_result() const {
    return response_.responseHeader.serviceResult;
}

