// ==============================================================================
// mustgather/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef MUSTGATHER_CLI_HPP
#define MUSTGATHER_CLI_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace mustgather::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// summary - сводка архива (title, version, nodes)
struct SummaryCommand {
    std::filesystem::path path;
    bool json = false;                     // -j, --json
    std::optional<std::size_t> max_depth;  // --max-depth
};

/// root - напечатать найденный корень архива
struct RootCommand {
    std::filesystem::path path;
    std::optional<std::size_t> max_depth;  // --max-depth
};

/// locate - напечатать путь к манифесту (без обращения к диску)
struct LocateCommand {
    std::filesystem::path root;
    std::string kind;
    std::string group;       // -g, --group
    std::string namespace_;  // -n, --namespace
    std::string name;        // --name
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command =
    std::variant<SummaryCommand, RootCommand, LocateCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// "mustgather <VERSION>\n"
std::string render_version();

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Inspect OpenShift must-gather archives";

}  // namespace mustgather::cli

#endif  // MUSTGATHER_CLI_HPP
