// ==============================================================================
// mustgather/root.hpp - Поиск корня must-gather архива
// ==============================================================================
//
// Назначение:
// - Проверка признаков корня (is_root)
// - Поиск корня от произвольного стартового пути (find_root)
//
// Признаки корня (любой из двух):
//   (a) директория напрямую содержит файл "version"
//   (b) директория напрямую содержит директории "namespaces" и
//       "cluster-scoped-resources"
//
// Архивы часто лежат внутри одной или нескольких директорий-обёрток
// (распаковка, имя pod'а, timestamp). find_root спускается в единственную
// поддиректорию, пока не найдёт корень, и отказывается угадывать, если
// поддиректорий несколько.
//
// ==============================================================================

#ifndef MUSTGATHER_ROOT_HPP
#define MUSTGATHER_ROOT_HPP

#include <cstddef>
#include <filesystem>
#include <string>

namespace mustgather::root {

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class RootErrorKind {
    NotFound,         // Корень не определяется (нет признаков, неоднозначность, цикл)
    InputUnreadable,  // Стартовый путь не существует, не директория или нет доступа
};

struct RootError {
    RootErrorKind kind = RootErrorKind::NotFound;
    std::string message;
    std::string path;

    /// "<message> - <path>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Параметры и результат
// ----------------------------------------------------------------------------

/// Ограничение глубины спуска по директориям-обёрткам
constexpr std::size_t DEFAULT_MAX_DEPTH = 32;

struct RootOptions {
    /// Максимальное число спусков в единственную поддиректорию
    std::size_t max_depth = DEFAULT_MAX_DEPTH;
};

struct RootResult {
    bool ok = false;

    /// Канонический абсолютный путь к корню (при ok)
    std::filesystem::path root;

    /// Число пройденных директорий-обёрток
    std::size_t depth = 0;

    RootError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Проверить признаки корня для одной директории (без спуска)
/// Ошибки доступа трактуются как отсутствие признака.
bool is_root(const std::filesystem::path& dir);

/// Найти корень архива, начиная со start
///
/// Алгоритм:
/// 1. start должен существовать и быть читаемой директорией (иначе InputUnreadable)
/// 2. Если текущая директория - корень, вернуть её канонический путь
/// 3. Иначе перечислить непосредственные поддиректории (файлы и нечитаемые
///    записи игнорируются)
/// 4. Ровно одна поддиректория - спуститься в неё; ноль или несколько - NotFound
/// 5. Повторный визит канонического пути (цикл symlink'ов) или превышение
///    max_depth - NotFound
///
/// Идемпотентна: find_root(find_root(p).root).root == find_root(p).root
RootResult find_root(const std::filesystem::path& start, const RootOptions& opt = {});

/// "1 wrapper directory", "3 wrapper directories"
std::string describe_depth(std::size_t depth);

}  // namespace mustgather::root

#endif  // MUSTGATHER_ROOT_HPP
