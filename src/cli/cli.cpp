// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "mustgather/cli.hpp"

#include "mustgather/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace mustgather::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string usage_line(const std::string& command) {
    if (command == "summary") {
        return "Usage: mustgather summary [OPTIONS] <PATH>";
    }
    if (command == "root") {
        return "Usage: mustgather root [OPTIONS] <PATH>";
    }
    if (command == "locate") {
        return "Usage: mustgather locate [OPTIONS] <ROOT> <KIND>";
    }
    return "Usage: mustgather [OPTIONS] <COMMAND>";
}

/// Ошибка использования в стиле clap: exit code 2
ParseResult usage_error(ParseResult result, const std::string& message,
                        const std::string& command = "") {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = "error: " + message + "\n\n" + usage_line(command) +
                                       "\n\nFor more information, try '--help'.\n";
    return result;
}

/// Неотрицательное целое без знака; nullopt при ошибке
std::optional<std::size_t> parse_count(const char* text) {
    if (text == nullptr || *text == '\0' || *text == '-' || *text == '+') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<std::size_t>(value);
}

/// Значение опции: "--opt value" или "--opt=value"
/// @return nullptr если значение отсутствует
const char* option_value(int argc, char** argv, int& i, const char* long_name) {
    const char* arg = argv[i];
    std::size_t len = std::strlen(long_name);
    if (starts_with(arg, long_name) && arg[len] == '=') {
        return arg + len + 1;
    }
    if (i + 1 < argc) {
        ++i;
        return argv[i];
    }
    return nullptr;
}

bool matches_option(const char* arg, const char* short_name, const char* long_name) {
    if (short_name != nullptr && str_eq(arg, short_name)) {
        return true;
    }
    std::size_t len = std::strlen(long_name);
    return starts_with(arg, long_name) && (arg[len] == '\0' || arg[len] == '=');
}

/// Глобальные флаги, допустимые и после подкоманды
bool consume_global_flag(const char* arg, GlobalOptions& global) {
    if (str_eq(arg, "-v")) {
        global.verbose++;
        return true;
    }
    if (str_eq(arg, "-q")) {
        global.quiet = true;
        return true;
    }
    return false;
}

ParseResult parse_summary(int argc, char** argv, int cmd_idx, ParseResult result) {
    SummaryCommand cmd;
    bool has_path = false;

    for (int i = cmd_idx + 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"summary"};
            return result;
        } else if (consume_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (matches_option(arg, nullptr, "--max-depth")) {
            const char* value = option_value(argc, argv, i, "--max-depth");
            auto depth = parse_count(value);
            if (!depth) {
                return usage_error(result,
                                   std::string("invalid value '") + (value ? value : "") +
                                       "' for '--max-depth <MAX_DEPTH>'",
                                   "summary");
            }
            cmd.max_depth = depth;
        } else if (arg[0] == '-') {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                               "summary");
        } else if (!has_path) {
            cmd.path = platform::path_from_utf8(arg);
            has_path = true;
        } else {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                               "summary");
        }
    }

    if (!has_path) {
        return usage_error(result, "the following required arguments were not provided:\n  <PATH>",
                           "summary");
    }

    result.ok = true;
    result.command = std::move(cmd);
    return result;
}

ParseResult parse_root(int argc, char** argv, int cmd_idx, ParseResult result) {
    RootCommand cmd;
    bool has_path = false;

    for (int i = cmd_idx + 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"root"};
            return result;
        } else if (consume_global_flag(arg, result.global)) {
            continue;
        } else if (matches_option(arg, nullptr, "--max-depth")) {
            const char* value = option_value(argc, argv, i, "--max-depth");
            auto depth = parse_count(value);
            if (!depth) {
                return usage_error(result,
                                   std::string("invalid value '") + (value ? value : "") +
                                       "' for '--max-depth <MAX_DEPTH>'",
                                   "root");
            }
            cmd.max_depth = depth;
        } else if (arg[0] == '-') {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                               "root");
        } else if (!has_path) {
            cmd.path = platform::path_from_utf8(arg);
            has_path = true;
        } else {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                               "root");
        }
    }

    if (!has_path) {
        return usage_error(result, "the following required arguments were not provided:\n  <PATH>",
                           "root");
    }

    result.ok = true;
    result.command = std::move(cmd);
    return result;
}

ParseResult parse_locate(int argc, char** argv, int cmd_idx, ParseResult result) {
    LocateCommand cmd;
    int positional = 0;

    for (int i = cmd_idx + 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"locate"};
            return result;
        } else if (consume_global_flag(arg, result.global)) {
            continue;
        } else if (matches_option(arg, "-g", "--group") ||
                   matches_option(arg, "-n", "--namespace") ||
                   matches_option(arg, nullptr, "--name")) {
            const char* long_name = (str_eq(arg, "-g") || starts_with(arg, "--group"))
                                        ? "--group"
                                        : ((str_eq(arg, "-n") || starts_with(arg, "--namespace"))
                                               ? "--namespace"
                                               : "--name");
            const char* value = option_value(argc, argv, i, long_name);
            if (value == nullptr) {
                return usage_error(result,
                                   std::string("a value is required for '") + long_name + "'",
                                   "locate");
            }
            if (str_eq(long_name, "--group")) {
                cmd.group = value;
            } else if (str_eq(long_name, "--namespace")) {
                cmd.namespace_ = value;
            } else {
                cmd.name = value;
            }
        } else if (arg[0] == '-') {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                               "locate");
        } else if (positional == 0) {
            cmd.root = platform::path_from_utf8(arg);
            ++positional;
        } else if (positional == 1) {
            cmd.kind = arg;
            ++positional;
        } else {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                               "locate");
        }
    }

    if (positional < 2) {
        return usage_error(result,
                           positional == 0
                               ? "the following required arguments were not provided:\n  <ROOT>\n  "
                                 "<KIND>"
                               : "the following required arguments were not provided:\n  <KIND>",
                           "locate");
    }

    result.ok = true;
    result.command = std::move(cmd);
    return result;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("mustgather ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: mustgather [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  summary  Print the title, cluster version and nodes of an archive\n"
               "  root     Print the resolved root directory of an archive\n"
               "  locate   Print the path where a resource manifest is stored\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "  -v...          Print verbose output\n"
               "  -q             Suppress informational output\n"
               "  -h, --help     Print help\n"
               "  -V, --version  Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Summarise an extracted must-gather:\n"
               "        ./mustgather summary must-gather.local.5129284/\n"
               "\n"
               "    Locate a machine manifest:\n"
               "        ./mustgather locate <ROOT> machines -g machine.openshift.io "
               "-n openshift-machine-api --name machine-1\n";
    } else if (*command == "summary") {
        return "Print the title, cluster version and nodes of an archive\n"
               "\n"
               "Usage: mustgather summary [OPTIONS] <PATH>\n"
               "\n"
               "Arguments:\n"
               "  <PATH>  A must-gather directory, or a directory wrapping one\n"
               "\n"
               "Options:\n"
               "  -j, --json                   Output as JSON\n"
               "      --max-depth <MAX_DEPTH>  Maximum number of wrapper directories to descend "
               "[default: 32]\n"
               "  -h, --help                   Print help\n";
    } else if (*command == "root") {
        return "Print the resolved root directory of an archive\n"
               "\n"
               "Usage: mustgather root [OPTIONS] <PATH>\n"
               "\n"
               "Arguments:\n"
               "  <PATH>  A must-gather directory, or a directory wrapping one\n"
               "\n"
               "Options:\n"
               "      --max-depth <MAX_DEPTH>  Maximum number of wrapper directories to descend "
               "[default: 32]\n"
               "  -h, --help                   Print help\n";
    } else if (*command == "locate") {
        return "Print the path where a resource manifest is stored\n"
               "\n"
               "Usage: mustgather locate [OPTIONS] <ROOT> <KIND>\n"
               "\n"
               "Arguments:\n"
               "  <ROOT>  The archive root\n"
               "  <KIND>  The resource kind (plural, e.g. nodes)\n"
               "\n"
               "Options:\n"
               "  -g, --group <GROUP>          API group of the kind\n"
               "  -n, --namespace <NAMESPACE>  Namespace of the resource (cluster-scoped if "
               "omitted)\n"
               "      --name <NAME>            Name of the resource (collection if omitted)\n"
               "  -h, --help                   Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (consume_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found");
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "summary")) {
        return parse_summary(argc, argv, cmd_idx, std::move(result));
    } else if (str_eq(cmd, "root")) {
        return parse_root(argc, argv, cmd_idx, std::move(result));
    } else if (str_eq(cmd, "locate")) {
        return parse_locate(argc, argv, cmd_idx, std::move(result));
    } else if (str_eq(cmd, "help")) {
        if (cmd_idx + 1 < argc) {
            const char* topic = argv[cmd_idx + 1];
            if (!str_eq(topic, "summary") && !str_eq(topic, "root") && !str_eq(topic, "locate")) {
                return usage_error(result,
                                   std::string("unrecognized subcommand '") + topic + "'");
            }
            result.ok = true;
            result.command = HelpCommand{std::string(topic)};
        } else {
            result.ok = true;
            result.command = HelpCommand{};
        }
        return result;
    }

    return usage_error(result, std::string("unrecognized subcommand '") + cmd + "'");
}

}  // namespace mustgather::cli
