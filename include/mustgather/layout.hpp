// ==============================================================================
// mustgather/layout.hpp - Раскладка must-gather архива на диске
// ==============================================================================
//
// Назначение:
// - Константы раскладки (маркеры корня, сегменты scope, расширение манифестов)
// - ResourceLocator: (name, namespace, kind, group)
// - build_manifest_path: чистая функция (root, locator) -> путь
//
// Раскладка:
//   <root>/cluster-scoped-resources/[<group>/]<kind>/[<name>.yaml]
//   <root>/namespaces/<namespace>/[<group>/]<kind>/[<name>.yaml]
//
// Построение пути никогда не обращается к файловой системе и никогда не
// завершается ошибкой. Существование пути проверяет вызывающий код.
//
// ==============================================================================

#ifndef MUSTGATHER_LAYOUT_HPP
#define MUSTGATHER_LAYOUT_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace mustgather::layout {

// ----------------------------------------------------------------------------
// Константы раскладки
// ----------------------------------------------------------------------------

/// Файл-маркер корня архива
constexpr const char* VERSION_FILE = "version";

/// Директория namespaced ресурсов (маркер корня вместе с CLUSTER_SCOPED_DIR)
constexpr const char* NAMESPACES_DIR = "namespaces";

/// Директория cluster-scoped ресурсов
constexpr const char* CLUSTER_SCOPED_DIR = "cluster-scoped-resources";

/// Расширение файлов манифестов (с точкой)
constexpr const char* MANIFEST_EXTENSION = ".yaml";

// ----------------------------------------------------------------------------
// ResourceLocator
// ----------------------------------------------------------------------------

/// Локатор ресурса или коллекции ресурсов
///
/// Пустая строка эквивалентна отсутствию значения:
/// - пустой namespace: cluster-scoped ресурс
/// - пустой name: директория коллекции (все манифесты kind)
/// - пустой group: сегмент группы пропускается
struct ResourceLocator {
    std::string name;
    std::string namespace_;
    std::string kind;
    std::string group;

    bool is_cluster_scoped() const { return namespace_.empty(); }
    bool is_collection() const { return name.empty(); }
};

// ----------------------------------------------------------------------------
// Построение путей
// ----------------------------------------------------------------------------

/// Построить путь к манифесту, не проверяя его существование
///
/// Примеры:
/// @code
///   // все узлы
///   build_manifest_path(root, "", "", "nodes", "core");
///   // -> <root>/cluster-scoped-resources/core/nodes
///
///   // конкретная машина
///   build_manifest_path(root, "machine-1", "openshift-machine-api", "machines",
///                       "machine.openshift.io");
///   // -> <root>/namespaces/openshift-machine-api/machine.openshift.io/machines/machine-1.yaml
/// @endcode
std::filesystem::path build_manifest_path(const std::filesystem::path& root, std::string_view name,
                                          std::string_view namespace_, std::string_view kind,
                                          std::string_view group);

std::filesystem::path build_manifest_path(const std::filesystem::path& root,
                                          const ResourceLocator& locator);

/// Имя файла манифеста: "<name>.yaml"
std::string manifest_file_name(std::string_view name);

/// true если расширение файла в точности ".yaml"
bool is_manifest_file(const std::filesystem::path& path);

}  // namespace mustgather::layout

#endif  // MUSTGATHER_LAYOUT_HPP
