// ==============================================================================
// mustgather/summary.hpp - Сводка must-gather архива
// ==============================================================================
//
// Назначение:
// - Нормализация входного пути к корню (root::find_root)
// - Извлечение версии кластера (ClusterVersion status.desired.version)
// - Инвентаризация узлов (cluster-scoped-resources/core/nodes/*.yaml)
// - Сборка MustGather
//
// Политика ошибок:
// - Структурные ошибки (корень не найден, вход не читается) прерывают build()
// - Ошибки отдельных манифестов не прерывают build(): версия становится
//   "Unknown", битый манифест узла пропускается и учитывается в skipped_nodes
//
// ==============================================================================

#ifndef MUSTGATHER_SUMMARY_HPP
#define MUSTGATHER_SUMMARY_HPP

#include <mustgather/node.hpp>
#include <mustgather/root.hpp>
#include <mustgather/value.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace mustgather::output {
class Writer;
}  // namespace mustgather::output

namespace mustgather::summary {

/// Версия, если её не удалось определить
constexpr const char* UNKNOWN_VERSION = "Unknown";

/// Имя манифеста ClusterVersion (всегда буквально version.yaml)
constexpr const char* CLUSTER_VERSION_MANIFEST = "version.yaml";

// ----------------------------------------------------------------------------
// MustGather
// ----------------------------------------------------------------------------

struct MustGather {
    /// Имя директории корня
    std::string title;

    /// status.desired.version или UNKNOWN_VERSION
    std::string version;

    /// Узлы, отсортированы по имени файла манифеста
    std::vector<resources::Node> nodes;

    /// Манифесты узлов, которые не удалось загрузить или декодировать
    std::size_t skipped_nodes = 0;

    /// Канонический путь к корню
    std::filesystem::path root;
};

// ----------------------------------------------------------------------------
// Параметры и результат
// ----------------------------------------------------------------------------

struct SummaryOptions {
    root::RootOptions root;

    /// Диагностика пропущенных манифестов (debug). nullptr - без вывода
    output::Writer* writer = nullptr;
};

struct SummaryResult {
    bool ok = false;
    MustGather summary;
    root::RootError error;

    explicit operator bool() const { return ok; }
};

/// Результат сканирования коллекции узлов
struct NodeScan {
    std::vector<resources::Node> nodes;
    std::size_t skipped = 0;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Построить сводку архива от произвольного стартового пути
/// Ошибка root::find_root возвращается без изменений.
SummaryResult build(const std::filesystem::path& start, const SummaryOptions& opt = {});

/// Версия кластера для известного корня; UNKNOWN_VERSION при любой ошибке
std::string get_cluster_version(const std::filesystem::path& root,
                                output::Writer* writer = nullptr);

/// Узлы кластера для известного корня
/// Отсутствующая или нечитаемая директория nodes - пустой результат.
NodeScan get_nodes(const std::filesystem::path& root, output::Writer* writer = nullptr);

/// JSON представление сводки
Value to_value(const MustGather& mg);

}  // namespace mustgather::summary

#endif  // MUSTGATHER_SUMMARY_HPP
