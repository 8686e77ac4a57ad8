// ==============================================================================
// test_node_gtest.cpp - Тесты декодирования Node (GoogleTest)
// ==============================================================================

#include "mustgather/node.hpp"

#include <gtest/gtest.h>
#include <string>
#include <yaml-cpp/yaml.h>

namespace mustgather::resources::test {

namespace {

Value doc(const std::string& text) {
    return Value::from_yaml(YAML::Load(text));
}

const char* const FULL_NODE =
    "apiVersion: v1\n"
    "kind: Node\n"
    "metadata:\n"
    "  name: ip-10-0-0-1.ec2.internal\n"
    "  labels:\n"
    "    kubernetes.io/os: linux\n"
    "    node-role.kubernetes.io/worker: \"\"\n"
    "    node-role.kubernetes.io/master: \"\"\n"
    "status:\n"
    "  conditions:\n"
    "    - type: MemoryPressure\n"
    "      status: \"False\"\n"
    "    - type: Ready\n"
    "      status: \"True\"\n"
    "  nodeInfo:\n"
    "    kubeletVersion: v1.25.4+77bec7a\n";

}  // namespace

// ==============================================================================
// Node::from
// ==============================================================================

TEST(NodeTest, From_FullManifest) {
    auto node = Node::from(doc(FULL_NODE));

    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->name, "ip-10-0-0-1.ec2.internal");
    ASSERT_EQ(node->roles.size(), 2u);
    EXPECT_EQ(node->roles[0], "master");
    EXPECT_EQ(node->roles[1], "worker");
    EXPECT_EQ(node->ready, "True");
    EXPECT_EQ(node->kubelet_version, "v1.25.4+77bec7a");
    EXPECT_TRUE(node->source.empty());
}

TEST(NodeTest, From_MinimalManifest) {
    auto node = Node::from(doc("metadata:\n  name: n1\n"));

    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->name, "n1");
    EXPECT_TRUE(node->roles.empty());
    EXPECT_EQ(node->ready, "");
    EXPECT_EQ(node->kubelet_version, "");
}

TEST(NodeTest, From_OtherKind_Rejected) {
    EXPECT_FALSE(Node::from(doc("kind: Pod\nmetadata:\n  name: p\n")).has_value());
}

TEST(NodeTest, From_MissingName_Rejected) {
    EXPECT_FALSE(Node::from(doc("kind: Node\nmetadata: {}\n")).has_value());
    EXPECT_FALSE(Node::from(doc("kind: Node\nmetadata:\n  name: \"\"\n")).has_value());
}

TEST(NodeTest, From_NonStringName_Rejected) {
    EXPECT_FALSE(Node::from(doc("kind: Node\nmetadata:\n  name: 12\n")).has_value());
}

TEST(NodeTest, From_NonObject_Rejected) {
    EXPECT_FALSE(Node::from(doc("- a\n- b\n")).has_value());
    EXPECT_FALSE(Node::from(Value("text")).has_value());
}

// Метка с пустым суффиксом роли не даёт роль
TEST(NodeTest, From_BareRolePrefix_Ignored) {
    auto node = Node::from(doc("metadata:\n  name: n\n  labels:\n"
                               "    node-role.kubernetes.io/: \"\"\n"
                               "    node-role.kubernetes.io/infra: \"\"\n"));

    ASSERT_TRUE(node.has_value());
    ASSERT_EQ(node->roles.size(), 1u);
    EXPECT_EQ(node->roles[0], "infra");
}

TEST(NodeTest, From_NotReady) {
    auto node = Node::from(doc("metadata:\n  name: n\nstatus:\n  conditions:\n"
                               "    - type: Ready\n      status: \"Unknown\"\n"));

    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->ready, "Unknown");
}

// ==============================================================================
// Представления
// ==============================================================================

TEST(NodeTest, RolesString) {
    Node node;
    EXPECT_EQ(node.roles_string(), "");

    node.roles = {"master", "worker"};
    EXPECT_EQ(node.roles_string(), "master,worker");
}

TEST(NodeTest, ToValue) {
    auto node = Node::from(doc(FULL_NODE));
    ASSERT_TRUE(node.has_value());
    node->source = "/mg/node.yaml";

    Value v = node->to_value();

    EXPECT_EQ(v.find_string({"name"}), std::optional<std::string>("ip-10-0-0-1.ec2.internal"));
    EXPECT_EQ(v.find_string({"ready"}), std::optional<std::string>("True"));
    EXPECT_EQ(v.find_string({"source"}), std::optional<std::string>("/mg/node.yaml"));
    const Value* roles = v.get("roles");
    ASSERT_NE(roles, nullptr);
    EXPECT_EQ(roles->size(), 2u);
}

}  // namespace mustgather::resources::test
