// ==============================================================================
// mustgather/node.hpp - Узел кластера (Node)
// ==============================================================================
//
// Декодирование манифеста cluster-scoped-resources/core/nodes/<name>.yaml.
// Чистое преобразование Value -> Node, без ввода-вывода.
//
// ==============================================================================

#ifndef MUSTGATHER_NODE_HPP
#define MUSTGATHER_NODE_HPP

#include <mustgather/value.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mustgather::resources {

/// Префикс меток ролей: node-role.kubernetes.io/<role>
constexpr const char* NODE_ROLE_LABEL_PREFIX = "node-role.kubernetes.io/";

struct Node {
    /// metadata.name
    std::string name;

    /// Роли из меток node-role.kubernetes.io/*, отсортированы
    std::vector<std::string> roles;

    /// status.nodeInfo.kubeletVersion (пусто если нет)
    std::string kubelet_version;

    /// status условия Ready: "True", "False", "Unknown"; пусто если условия нет
    std::string ready;

    /// Путь к исходному манифесту (заполняет вызывающий код)
    std::string source;

    /// Декодировать документ
    /// @return nullopt если документ не объект, kind задан и не "Node",
    ///         или metadata.name отсутствует / не строка
    static std::optional<Node> from(const Value& document);

    /// Роли через запятую ("master,worker")
    std::string roles_string() const;

    /// JSON представление для --json вывода
    Value to_value() const;
};

}  // namespace mustgather::resources

#endif  // MUSTGATHER_NODE_HPP
