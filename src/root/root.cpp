// ==============================================================================
// root.cpp - Поиск корня must-gather архива
// ==============================================================================

#include "mustgather/root.hpp"

#include "mustgather/layout.hpp"
#include "mustgather/platform.hpp"

#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace mustgather::root {

namespace {

constexpr const char* CANNOT_DETERMINE_ROOT = "Cannot determine root of must-gather";

RootResult failure(RootErrorKind kind, std::string message, const std::filesystem::path& path) {
    RootResult result;
    result.ok = false;
    result.error.kind = kind;
    result.error.message = std::move(message);
    result.error.path = platform::path_to_utf8(path);
    return result;
}

bool is_file_nothrow(const std::filesystem::path& p) {
    std::error_code ec;
    bool result = std::filesystem::is_regular_file(p, ec);
    return !ec && result;
}

bool is_directory_nothrow(const std::filesystem::path& p) {
    std::error_code ec;
    bool result = std::filesystem::is_directory(p, ec);
    return !ec && result;
}

/// Собрать непосредственные поддиректории dir
/// Записи, статус которых не читается, пропускаются.
/// @return false если саму директорию прочитать не удалось (причина в ec)
bool list_subdirectories(const std::filesystem::path& dir, std::vector<std::filesystem::path>& out,
                         std::error_code& ec) {
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return false;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return false;
        }
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && !entry_ec) {
            out.push_back(it->path());
        }
    }
    if (ec) {
        return false;
    }
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// RootError
// ----------------------------------------------------------------------------

std::string RootError::format() const {
    if (path.empty()) {
        return message;
    }
    return message + " - " + path;
}

std::string describe_depth(std::size_t depth) {
    return std::to_string(depth) + (depth == 1 ? " wrapper directory" : " wrapper directories");
}

// ----------------------------------------------------------------------------
// is_root
// ----------------------------------------------------------------------------

bool is_root(const std::filesystem::path& dir) {
    if (is_file_nothrow(dir / layout::VERSION_FILE)) {
        return true;
    }
    return is_directory_nothrow(dir / layout::NAMESPACES_DIR) &&
           is_directory_nothrow(dir / layout::CLUSTER_SCOPED_DIR);
}

// ----------------------------------------------------------------------------
// find_root
// ----------------------------------------------------------------------------

RootResult find_root(const std::filesystem::path& start, const RootOptions& opt) {
    std::error_code ec;

    bool exists = std::filesystem::exists(start, ec);
    if (ec) {
        return failure(RootErrorKind::InputUnreadable,
                       "failed to check path existence: " + ec.message(), start);
    }
    if (!exists) {
        return failure(RootErrorKind::InputUnreadable, "Specified path does not exist", start);
    }
    if (!is_directory_nothrow(start)) {
        return failure(RootErrorKind::InputUnreadable, "Specified path is not a directory", start);
    }

    // Канонические пути пройденных директорий (защита от циклов symlink'ов)
    std::set<std::filesystem::path> visited;
    std::filesystem::path current = start;

    for (std::size_t depth = 0;; ++depth) {
        const RootErrorKind read_error_kind =
            depth == 0 ? RootErrorKind::InputUnreadable : RootErrorKind::NotFound;

        auto canonical = platform::canonical_path(current, ec);
        if (!canonical) {
            return failure(read_error_kind, "failed to resolve path: " + ec.message(), current);
        }
        if (!visited.insert(*canonical).second) {
            return failure(RootErrorKind::NotFound,
                           std::string(CANNOT_DETERMINE_ROOT) + ": directory cycle detected",
                           current);
        }

        if (is_root(current)) {
            RootResult result;
            result.ok = true;
            result.root = std::move(*canonical);
            result.depth = depth;
            return result;
        }

        std::vector<std::filesystem::path> subdirs;
        if (!list_subdirectories(current, subdirs, ec)) {
            return failure(read_error_kind, "failed to read directory: " + ec.message(), current);
        }

        if (subdirs.size() != 1) {
            return failure(RootErrorKind::NotFound, CANNOT_DETERMINE_ROOT, current);
        }

        if (depth >= opt.max_depth) {
            return failure(RootErrorKind::NotFound,
                           std::string(CANNOT_DETERMINE_ROOT) + ": maximum depth of " +
                               std::to_string(opt.max_depth) + " exceeded",
                           current);
        }

        current = std::move(subdirs.front());
    }
}

}  // namespace mustgather::root
