// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются на границе приложения.
//
// ==============================================================================

#include "mustgather/cli.hpp"
#include "mustgather/layout.hpp"
#include "mustgather/output.hpp"
#include "mustgather/platform.hpp"
#include "mustgather/root.hpp"
#include "mustgather/summary.hpp"

#include <exception>
#include <iostream>
#include <rapidjson/document.h>
#include <string>
#include <type_traits>
#include <variant>

namespace {

int run_summary(const mustgather::cli::SummaryCommand& cmd, mustgather::output::Writer& writer) {
    using namespace mustgather;

    summary::SummaryOptions opt;
    if (cmd.max_depth.has_value()) {
        opt.root.max_depth = *cmd.max_depth;
    }
    opt.writer = &writer;

    writer.info("Reading must-gather from: " + platform::path_to_utf8(cmd.path));

    auto result = summary::build(cmd.path, opt);
    if (!result) {
        writer.error(result.error.format());
        return 1;
    }

    const summary::MustGather& mg = result.summary;
    if (mg.skipped_nodes > 0) {
        writer.warn("Skipped " + std::to_string(mg.skipped_nodes) +
                    " node manifest(s) that could not be loaded");
    }

    if (cmd.json) {
        rapidjson::Document doc = summary::to_value(mg).to_rapidjson_document();
        writer.write_json_pretty(doc);
        return 0;
    }

    writer.green_line(mg.title);
    writer.write_line(output::Stream::Stdout, "Version: " + mg.version);
    writer.write_line(output::Stream::Stdout, "Nodes: " + std::to_string(mg.nodes.size()));

    if (!mg.nodes.empty()) {
        output::Table table;
        table.set_headers({"Name", "Roles", "Ready", "Kubelet"});
        for (const auto& node : mg.nodes) {
            table.add_row({node.name, node.roles_string(), node.ready, node.kubelet_version});
        }
        table.print(writer);
    }
    return 0;
}

int run_root(const mustgather::cli::RootCommand& cmd, mustgather::output::Writer& writer) {
    using namespace mustgather;

    root::RootOptions opt;
    if (cmd.max_depth.has_value()) {
        opt.max_depth = *cmd.max_depth;
    }

    auto result = root::find_root(cmd.path, opt);
    if (!result) {
        writer.error(result.error.format());
        return 1;
    }

    writer.debug("descended through " + root::describe_depth(result.depth));
    writer.write_line(output::Stream::Stdout, platform::path_to_utf8(result.root));
    return 0;
}

int run_locate(const mustgather::cli::LocateCommand& cmd, mustgather::output::Writer& writer) {
    using namespace mustgather;

    layout::ResourceLocator locator;
    locator.name = cmd.name;
    locator.namespace_ = cmd.namespace_;
    locator.kind = cmd.kind;
    locator.group = cmd.group;

    auto path = layout::build_manifest_path(cmd.root, locator);
    writer.write_line(output::Stream::Stdout, platform::path_to_utf8(path));
    return 0;
}

int run(int argc, char** argv) {
    using namespace mustgather;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);
    writer.trace("platform: " + platform::os_name());

    // Диагностика парсинга идёт в stderr без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::SummaryCommand>) {
                return run_summary(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::RootCommand>) {
                return run_root(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::LocateCommand>) {
                return run_locate(cmd, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
