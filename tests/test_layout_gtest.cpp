// ==============================================================================
// test_layout_gtest.cpp - Тесты построения путей к манифестам (GoogleTest)
// ==============================================================================

#include "mustgather/layout.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace mustgather::layout::test {

// ==============================================================================
// Cluster-scoped ресурсы
// ==============================================================================

TEST(LayoutTest, ClusterScoped_Collection) {
    EXPECT_EQ(build_manifest_path("/foo", "", "", "nodes", "core"),
              std::filesystem::path("/foo/cluster-scoped-resources/core/nodes"));
}

TEST(LayoutTest, ClusterScoped_NamedResource) {
    EXPECT_EQ(build_manifest_path("/foo", "node1", "", "nodes", "core"),
              std::filesystem::path("/foo/cluster-scoped-resources/core/nodes/node1.yaml"));
}

TEST(LayoutTest, ClusterScoped_ClusterVersionsCollection) {
    EXPECT_EQ(build_manifest_path("/mg", "", "", "clusterversions", "config.openshift.io"),
              std::filesystem::path(
                  "/mg/cluster-scoped-resources/config.openshift.io/clusterversions"));
}

// ==============================================================================
// Namespaced ресурсы
// ==============================================================================

TEST(LayoutTest, Namespaced_Collection) {
    EXPECT_EQ(build_manifest_path("/foo", "", "openshift-machine-api", "machines",
                                  "machine.openshift.io"),
              std::filesystem::path(
                  "/foo/namespaces/openshift-machine-api/machine.openshift.io/machines"));
}

TEST(LayoutTest, Namespaced_NamedResource) {
    EXPECT_EQ(build_manifest_path("/foo", "machine1", "openshift-machine-api", "machines",
                                  "machine.openshift.io"),
              std::filesystem::path("/foo/namespaces/openshift-machine-api/machine.openshift.io/"
                                    "machines/machine1.yaml"));
}

// ==============================================================================
// Пустая группа
// ==============================================================================

TEST(LayoutTest, EmptyGroup_ClusterScoped_NoEmptySegment) {
    auto path = build_manifest_path("/foo", "", "", "namespaces", "");

    EXPECT_EQ(path, std::filesystem::path("/foo/cluster-scoped-resources/namespaces"));
    EXPECT_EQ(path.string().find("//"), std::string::npos);
}

TEST(LayoutTest, EmptyGroup_Namespaced_NamedResource) {
    auto path = build_manifest_path("/foo", "pod-1", "default", "pods", "");

    EXPECT_EQ(path, std::filesystem::path("/foo/namespaces/default/pods/pod-1.yaml"));
    EXPECT_EQ(path.string().find("//"), std::string::npos);
}

// ==============================================================================
// ResourceLocator
// ==============================================================================

TEST(LayoutTest, Locator_MatchesPositionalOverload) {
    ResourceLocator locator;
    locator.name = "machine1";
    locator.namespace_ = "openshift-machine-api";
    locator.kind = "machines";
    locator.group = "machine.openshift.io";

    EXPECT_EQ(build_manifest_path("/foo", locator),
              build_manifest_path("/foo", "machine1", "openshift-machine-api", "machines",
                                  "machine.openshift.io"));
    EXPECT_FALSE(locator.is_cluster_scoped());
    EXPECT_FALSE(locator.is_collection());
}

TEST(LayoutTest, Locator_DefaultIsClusterScopedCollection) {
    ResourceLocator locator;
    locator.kind = "nodes";
    locator.group = "core";

    EXPECT_TRUE(locator.is_cluster_scoped());
    EXPECT_TRUE(locator.is_collection());
    EXPECT_EQ(build_manifest_path("/foo", locator),
              std::filesystem::path("/foo/cluster-scoped-resources/core/nodes"));
}

// Построение пути не обращается к диску: несуществующий корень допустим
TEST(LayoutTest, NonexistentRoot_StillBuildsPath) {
    std::filesystem::path root = "/definitely/not/a/real/must-gather";
    auto path = build_manifest_path(root, "x", "ns", "configmaps", "");

    EXPECT_EQ(path, root / "namespaces" / "ns" / "configmaps" / "x.yaml");
}

TEST(LayoutTest, RelativeRoot_IsPreserved) {
    EXPECT_EQ(build_manifest_path("mg", "", "", "nodes", "core"),
              std::filesystem::path("mg/cluster-scoped-resources/core/nodes"));
}

// ==============================================================================
// Имена файлов манифестов
// ==============================================================================

TEST(LayoutTest, ManifestFileName_AppendsYamlExtension) {
    EXPECT_EQ(manifest_file_name("node1"), "node1.yaml");
    EXPECT_EQ(manifest_file_name("a.b.c"), "a.b.c.yaml");
}

TEST(LayoutTest, IsManifestFile_OnlyYamlExtension) {
    EXPECT_TRUE(is_manifest_file("/x/node1.yaml"));
    EXPECT_TRUE(is_manifest_file("ip-10-0-0-1.ec2.internal.yaml"));
    EXPECT_FALSE(is_manifest_file("/x/node1.yml"));
    EXPECT_FALSE(is_manifest_file("/x/node1.yaml.bak"));
    EXPECT_FALSE(is_manifest_file("/x/node1"));
    EXPECT_FALSE(is_manifest_file("/x/node1.YAML"));
}

}  // namespace mustgather::layout::test
