#include "../include/data_value.hpp"
#include <cstdio>
#include <utility>

data_value::data_value() {
    UA_DataValue_init(&data_value_);
}

data_value::data_value(const UA_DataValue& _data_value) {
    UA_DataValue_init(&data_value_);
    UA_DataValue_copy(&_data_value, &data_value_);
}

data_value::data_value(const UA_Variant& _value) {
    UA_DataValue_init(&data_value_);
    if (UA_Variant_copy(&_value, &data_value_.value) == UA_STATUSCODE_GOOD)
        data_value_.hasValue = true;
    data_value_.sourceTimestamp = UA_DateTime_now();
    data_value_.hasSourceTimestamp = true;
    data_value_.status = UA_STATUSCODE_GOOD;
}

data_value::data_value(const data_value& _other) {
    UA_DataValue_init(&data_value_);
    UA_DataValue_copy(&_other.data_value_, &data_value_);
}

data_value::data_value(data_value&& _other) noexcept {
    data_value_ = _other.data_value_;
    UA_DataValue_init(&_other.data_value_);
}

data_value&
data_value::operator=(const data_value& _other) {
    if (this != &_other) {
        UA_DataValue_clear(&data_value_);
        UA_DataValue_copy(&_other.data_value_, &data_value_);
    }
    return *this;
}

data_value&
data_value::operator=(data_value&& _other) noexcept {
    if (this != &_other) {
        UA_DataValue_clear(&data_value_);
        data_value_ = _other.data_value_;
        UA_DataValue_init(&_other.data_value_);
    }
    return *this;
}

data_value::~data_value() {
    UA_DataValue_clear(&data_value_);
}

data_value
data_value::from_scalar(const void* _value, const UA_DataType* _type) {
    UA_Variant variant;
    UA_Variant_init(&variant);
    UA_Variant_setScalarCopy(&variant, _value, _type);
    data_value value(variant);
    UA_Variant_clear(&variant);
    return value;
}

const UA_DataValue&
data_value::get() const {
    return data_value_;
}

UA_DataValue&
data_value::get() {
    return data_value_;
}

const UA_Variant&
data_value::get_variant() const {
    return data_value_.value;
}

UA_StatusCode
data_value::set_variant(const UA_Variant& _value) {
    UA_Variant copy;
    UA_StatusCode status = UA_Variant_copy(&_value, &copy);
    if (status != UA_STATUSCODE_GOOD)
        return status;
    UA_Variant_clear(&data_value_.value);
    data_value_.value = copy;
    data_value_.hasValue = true;
    return UA_STATUSCODE_GOOD;
}

bool
data_value::has_value() const {
    return data_value_.hasValue && !UA_Variant_isEmpty(&data_value_.value);
}

bool
data_value::has_scalar_type(const UA_DataType* _type) const {
    return data_value_.hasValue && UA_Variant_hasScalarType(&data_value_.value, _type);
}

UA_StatusCode
data_value::get_status() const {
    return data_value_.hasStatus ? data_value_.status : UA_STATUSCODE_GOOD;
}

UA_DateTime
data_value::get_source_timestamp() const {
    return data_value_.hasSourceTimestamp ? data_value_.sourceTimestamp : 0;
}

std::string
data_value::value_to_string() const {
    if (!has_value())
        return "<empty>";
    UA_String printed = UA_STRING_NULL;
    if (UA_print(&data_value_.value, &UA_TYPES[UA_TYPES_VARIANT], &printed) != UA_STATUSCODE_GOOD)
        return "<unprintable>";
    std::string value_string((const char*) printed.data, printed.length);
    UA_String_clear(&printed);
    return value_string;
}

std::string
data_value::source_timestamp_to_string() const {
    if (!data_value_.hasSourceTimestamp)
        return "";
    UA_DateTimeStruct dts = UA_DateTime_toStruct(data_value_.sourceTimestamp);
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04u-%02u-%02uT%02u:%02u:%02u.%03uZ",
             dts.year, dts.month, dts.day, dts.hour, dts.min, dts.sec, dts.milliSec);
    return std::string(buffer);
}
