// ==============================================================================
// manifest.cpp - Загрузка YAML манифестов
// ==============================================================================

#include <mustgather/manifest.hpp>
#include <mustgather/platform.hpp>

#include <fstream>
#include <sstream>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace mustgather::manifest {

namespace {

ManifestResult failure(ManifestErrorKind kind, std::string message,
                       const std::filesystem::path& path) {
    ManifestResult result;
    result.ok = false;
    result.error.kind = kind;
    result.error.message = std::move(message);
    result.error.path = platform::path_to_utf8(path);
    return result;
}

ManifestResult from_node(const YAML::Node& node, const std::filesystem::path& path) {
    if (!node.IsDefined() || node.IsNull()) {
        return failure(ManifestErrorKind::ParseError, "empty manifest", path);
    }
    ManifestResult result;
    result.ok = true;
    result.manifest.emplace(path, Value::from_yaml(node));
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// ManifestError
// ----------------------------------------------------------------------------

std::string ManifestError::format() const {
    return "failed to load manifest '" + path + "' - " + message;
}

// ----------------------------------------------------------------------------
// Manifest::load
// ----------------------------------------------------------------------------

ManifestResult Manifest::load(const std::filesystem::path& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec == std::errc::permission_denied) {
        return failure(ManifestErrorKind::PermissionDenied, ec.message(), path);
    }
    // ENOENT и ENOTDIR - файла нет; прочие ошибки (ELOOP, ENAMETOOLONG, ...) - IoError
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        return failure(ManifestErrorKind::IoError, ec.message(), path);
    }
    if (ec || !std::filesystem::exists(status)) {
        return failure(ManifestErrorKind::FileNotFound, "file does not exist", path);
    }
    if (!std::filesystem::is_regular_file(status)) {
        return failure(ManifestErrorKind::IoError, "not a regular file", path);
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return failure(ManifestErrorKind::PermissionDenied, "cannot open file", path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return failure(ManifestErrorKind::IoError, "failed to read file", path);
    }

    return parse(buffer.str(), path);
}

ManifestResult Manifest::parse(const std::string& yaml, const std::filesystem::path& path) {
    try {
        YAML::Node root = YAML::Load(yaml);
        return from_node(root, path);
    } catch (const YAML::Exception& e) {
        return failure(ManifestErrorKind::ParseError, std::string("YAML parse error: ") + e.what(),
                       path);
    }
}

}  // namespace mustgather::manifest
