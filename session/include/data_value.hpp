/**
 * @file data_value.hpp
 * @brief Owning wrapper of an open62541 data value.
 */
#ifndef DATA_VALUE_HPP
#define DATA_VALUE_HPP

#include <open62541/types.h>
#include <string>

/**
 * @brief Holds a deep copy of a UA_DataValue and releases it on destruction.
 */
class data_value {
private:
    UA_DataValue data_value_; /**< the owned data value. */
public:
    /**
     * @brief Constructs an empty data value.
     * 
     */
    data_value();

    /**
     * @brief Constructs a data value holding a deep copy of the given data value.
     * 
     * @param _data_value the data value to copy.
     */
    explicit data_value(const UA_DataValue& _data_value);

    /**
     * @brief Constructs a data value for writing: a copy of the variant, source timestamp now and good status.
     * 
     * @param _value the value.
     */
    explicit data_value(const UA_Variant& _value);

    data_value(const data_value& _other);
    data_value(data_value&& _other) noexcept;
    data_value& operator=(const data_value& _other);
    data_value& operator=(data_value&& _other) noexcept;

    /**
     * @brief Destroys the data value object and its contents.
     * 
     */
    ~data_value();

    /**
     * @brief Creates a write value from a scalar.
     * 
     * @param _value pointer to the scalar.
     * @param _type the data type of the scalar.
     * @return data_value the data value.
     */
    static data_value
    from_scalar(const void* _value, const UA_DataType* _type);

    /**
     * @brief Returns the wrapped data value.
     * 
     * @return const UA_DataValue& the data value.
     */
    const UA_DataValue&
    get() const;

    /**
     * @brief Returns the wrapped data value for modification.
     * 
     * @return UA_DataValue& the data value.
     */
    UA_DataValue&
    get();

    /**
     * @brief Returns the value variant.
     * 
     * @return const UA_Variant& the variant.
     */
    const UA_Variant&
    get_variant() const;

    /**
     * @brief Replaces the value variant with a copy of the given variant.
     * 
     * @param _value the new value.
     * @return UA_StatusCode the status code of the copy.
     */
    UA_StatusCode
    set_variant(const UA_Variant& _value);

    bool
    has_value() const;

    /**
     * @brief Returns whether the value is a scalar of the given type.
     * 
     * @param _type the data type.
     * @return true if the value is a scalar of the type.
     * @return false otherwise.
     */
    bool
    has_scalar_type(const UA_DataType* _type) const;

    /**
     * @brief Returns the status code, good if the value carries none.
     * 
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    get_status() const;

    UA_DateTime
    get_source_timestamp() const;

    /**
     * @brief Returns a printable representation of the value.
     * 
     * @return std::string the value as string.
     */
    std::string
    value_to_string() const;

    /**
     * @brief Returns a printable representation of the source timestamp.
     * 
     * @return std::string the timestamp as ISO 8601 string, empty if there is none.
     */
    std::string
    source_timestamp_to_string() const;
};

#endif // DATA_VALUE_HPP
