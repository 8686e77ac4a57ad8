// ==============================================================================
// mustgather/manifest.hpp - Загрузка YAML манифестов
// ==============================================================================
//
// Назначение:
// - Manifest: распарсенный YAML файл одного ресурса
// - ManifestError: типизированные ошибки загрузки
// - Вложенный доступ к полям (status -> desired -> version)
//
// Парсинг: yaml-cpp. Исключения yaml-cpp не покидают этот модуль.
//
// ==============================================================================

#ifndef MUSTGATHER_MANIFEST_HPP
#define MUSTGATHER_MANIFEST_HPP

#include <mustgather/value.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace mustgather::manifest {

// ----------------------------------------------------------------------------
// ManifestError
// ----------------------------------------------------------------------------

enum class ManifestErrorKind {
    FileNotFound,      // Файл не существует
    PermissionDenied,  // Нет доступа
    ParseError,        // Невалидный YAML или пустой документ
    IoError,           // Ошибка чтения / не обычный файл
};

struct ManifestError {
    ManifestErrorKind kind = ManifestErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to load manifest '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Manifest
// ----------------------------------------------------------------------------

struct ManifestResult;

/// YAML манифест ресурса
///
/// Использование:
/// @code
///   auto result = Manifest::load(path);
///   if (!result) {
///       writer.debug(result.error.format());
///       return;
///   }
///   auto version = result.manifest->get_string({"status", "desired", "version"});
/// @endcode
class Manifest {
public:
    /// Загрузить и распарсить файл
    /// Многодокументные файлы: используется первый документ.
    static ManifestResult load(const std::filesystem::path& path);

    /// Распарсить YAML из строки (path используется только в сообщениях)
    static ManifestResult parse(const std::string& yaml, const std::filesystem::path& path = {});

    Manifest(std::filesystem::path path, Value data)
        : path_(std::move(path)), data_(std::move(data)) {}

    const std::filesystem::path& path() const { return path_; }

    /// Корневой документ
    const Value& data() const { return data_; }

    /// Строковое поле по цепочке ключей
    /// nullopt если поля нет или это не строка
    std::optional<std::string> get_string(const KeyPath& keys) const {
        return data_.find_string(keys);
    }

private:
    std::filesystem::path path_;
    Value data_;
};

struct ManifestResult {
    bool ok = false;
    std::optional<Manifest> manifest;
    ManifestError error;

    explicit operator bool() const { return ok; }
};

}  // namespace mustgather::manifest

#endif  // MUSTGATHER_MANIFEST_HPP
