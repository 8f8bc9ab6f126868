#ifndef TYPES_HPP
#define TYPES_HPP

#include <open62541/types.h>

namespace opcua_link {
    typedef UA_Int32 retry_count_t;
    typedef UA_UInt32 timeout_ms_t;
    typedef UA_UInt32 interval_ms_t;
    typedef UA_UInt64 session_generation_t;
    typedef UA_UInt32 node_class_mask_t;
};
#endif // TYPES_HPP
