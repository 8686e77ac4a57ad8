// ==============================================================================
// node.cpp - Узел кластера (Node)
// ==============================================================================

#include <mustgather/node.hpp>

#include <algorithm>
#include <cstring>

namespace mustgather::resources {

namespace {

std::vector<std::string> decode_roles(const Value& document) {
    std::vector<std::string> roles;
    const Value* labels = document.find({"metadata", "labels"});
    if (labels == nullptr || !labels->is_object()) {
        return roles;
    }

    const std::size_t prefix_len = std::strlen(NODE_ROLE_LABEL_PREFIX);
    for (const auto& [key, value] : labels->as_object()) {
        (void)value;
        if (key.size() > prefix_len && key.compare(0, prefix_len, NODE_ROLE_LABEL_PREFIX) == 0) {
            roles.push_back(key.substr(prefix_len));
        }
    }
    std::sort(roles.begin(), roles.end());
    return roles;
}

std::string decode_ready(const Value& document) {
    const Value* conditions = document.find({"status", "conditions"});
    if (conditions == nullptr || !conditions->is_array()) {
        return {};
    }
    for (const auto& condition : conditions->as_array()) {
        if (condition.find_string({"type"}) == std::optional<std::string>("Ready")) {
            return condition.find_string({"status"}).value_or("");
        }
    }
    return {};
}

}  // namespace

std::optional<Node> Node::from(const Value& document) {
    if (!document.is_object()) {
        return std::nullopt;
    }

    auto kind = document.find_string({"kind"});
    if (kind.has_value() && *kind != "Node") {
        return std::nullopt;
    }

    auto name = document.find_string({"metadata", "name"});
    if (!name.has_value() || name->empty()) {
        return std::nullopt;
    }

    Node node;
    node.name = std::move(*name);
    node.roles = decode_roles(document);
    node.kubelet_version =
        document.find_string({"status", "nodeInfo", "kubeletVersion"}).value_or("");
    node.ready = decode_ready(document);
    return node;
}

std::string Node::roles_string() const {
    std::string result;
    for (std::size_t i = 0; i < roles.size(); ++i) {
        if (i > 0) {
            result += ",";
        }
        result += roles[i];
    }
    return result;
}

Value Node::to_value() const {
    Value obj = Value::make_object();
    obj.set("name", Value(name));

    Value role_arr = Value::make_array();
    for (const auto& role : roles) {
        role_arr.push_back(Value(role));
    }
    obj.set("roles", std::move(role_arr));

    obj.set("kubelet_version", Value(kubelet_version));
    obj.set("ready", Value(ready));
    obj.set("source", Value(source));
    return obj;
}

}  // namespace mustgather::resources
