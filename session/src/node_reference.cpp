#include "../include/node_reference.hpp"
#include <open62541/util.h>

node_reference
node_reference::from_reference_description(const UA_ReferenceDescription& _reference_description) {
    return node_reference(ua_string_to_string(_reference_description.displayName.text),
                          _reference_description.nodeClass,
                          node_id_to_string(_reference_description.nodeId.nodeId),
                          node_id_to_string(_reference_description.typeDefinition.nodeId));
}

std::string
node_id_to_string(const UA_NodeId& _node_id) {
    UA_String printed = UA_STRING_NULL;
    if (UA_NodeId_print(&_node_id, &printed) != UA_STATUSCODE_GOOD)
        return "";
    std::string node_id_string = ua_string_to_string(printed);
    UA_String_clear(&printed);
    return node_id_string;
}

UA_StatusCode
parse_node_id(const std::string& _node_id_string, UA_NodeId& _node_id) {
    UA_NodeId_init(&_node_id);
    if (_node_id_string.empty())
        return UA_STATUSCODE_BADNODEIDINVALID;
    UA_String node_id_view;
    node_id_view.length = _node_id_string.size();
    node_id_view.data = (UA_Byte*) _node_id_string.data();
    return UA_NodeId_parse(&_node_id, node_id_view);
}

std::string
ua_string_to_string(const UA_String& _string) {
    if (_string.data == NULL || _string.length == 0)
        return "";
    return std::string((const char*) _string.data, _string.length);
}

std::string
node_class_to_string(UA_NodeClass _node_class) {
    switch (_node_class) {
        case UA_NODECLASS_UNSPECIFIED: return "Unspecified";
        case UA_NODECLASS_OBJECT: return "Object";
        case UA_NODECLASS_VARIABLE: return "Variable";
        case UA_NODECLASS_METHOD: return "Method";
        case UA_NODECLASS_OBJECTTYPE: return "ObjectType";
        case UA_NODECLASS_VARIABLETYPE: return "VariableType";
        case UA_NODECLASS_REFERENCETYPE: return "ReferenceType";
        case UA_NODECLASS_DATATYPE: return "DataType";
        case UA_NODECLASS_VIEW: return "View";
        default: return "Unimplemented item";
    }
}
