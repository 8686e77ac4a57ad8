// ==============================================================================
// layout.cpp - Раскладка must-gather архива на диске
// ==============================================================================

#include "mustgather/layout.hpp"

#include "mustgather/platform.hpp"

namespace mustgather::layout {

std::filesystem::path build_manifest_path(const std::filesystem::path& root, std::string_view name,
                                          std::string_view namespace_, std::string_view kind,
                                          std::string_view group) {
    ResourceLocator locator;
    locator.name = std::string(name);
    locator.namespace_ = std::string(namespace_);
    locator.kind = std::string(kind);
    locator.group = std::string(group);
    return build_manifest_path(root, locator);
}

std::filesystem::path build_manifest_path(const std::filesystem::path& root,
                                          const ResourceLocator& locator) {
    std::filesystem::path result = root;

    if (locator.is_cluster_scoped()) {
        result /= CLUSTER_SCOPED_DIR;
    } else {
        result /= NAMESPACES_DIR;
        result /= platform::path_from_utf8(locator.namespace_);
    }

    // Пустая группа не должна давать пустой сегмент ("a//b")
    if (!locator.group.empty()) {
        result /= platform::path_from_utf8(locator.group);
    }

    result /= platform::path_from_utf8(locator.kind);

    if (!locator.is_collection()) {
        result /= platform::path_from_utf8(manifest_file_name(locator.name));
    }

    return result;
}

std::string manifest_file_name(std::string_view name) {
    std::string result(name);
    result += MANIFEST_EXTENSION;
    return result;
}

bool is_manifest_file(const std::filesystem::path& path) {
    return path.extension() == MANIFEST_EXTENSION;
}

}  // namespace mustgather::layout
