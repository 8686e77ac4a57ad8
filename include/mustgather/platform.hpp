// ==============================================================================
// mustgather/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Канонизация путей без исключений
// - TTY detection для цветного вывода
// - Информация о платформе
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef MUSTGATHER_PLATFORM_HPP
#define MUSTGATHER_PLATFORM_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace mustgather::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать path из UTF-8 строки (argv, YAML и т.п.)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути (для вывода и сообщений об ошибках)
std::string path_to_utf8(const std::filesystem::path& p);

/// Канонический абсолютный путь (symlink'и раскрыты)
/// @return nullopt если путь не существует или не может быть разрешён,
///         причина в ec
std::optional<std::filesystem::path> canonical_path(const std::filesystem::path& p,
                                                    std::error_code& ec);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// "Windows", "macOS", "Linux" или "Unknown"
std::string os_name();

}  // namespace mustgather::platform

#endif  // MUSTGATHER_PLATFORM_HPP
