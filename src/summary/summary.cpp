// ==============================================================================
// summary.cpp - Сводка must-gather архива
// ==============================================================================

#include <mustgather/layout.hpp>
#include <mustgather/manifest.hpp>
#include <mustgather/output.hpp>
#include <mustgather/platform.hpp>
#include <mustgather/summary.hpp>

#include <algorithm>
#include <string>
#include <system_error>

namespace mustgather::summary {

namespace {

void debug(output::Writer* writer, const std::string& message) {
    if (writer != nullptr) {
        writer->debug(message);
    }
}

/// Манифесты коллекции, отсортированные по имени файла
std::vector<std::filesystem::path> list_manifests(const std::filesystem::path& dir,
                                                  output::Writer* writer) {
    std::vector<std::filesystem::path> result;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        debug(writer, "failed to read directory '" + platform::path_to_utf8(dir) +
                          "' - " + ec.message());
        return result;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }
        if (layout::is_manifest_file(it->path())) {
            result.push_back(it->path());
        }
    }
    if (ec) {
        debug(writer, "failed to read directory entry in '" + platform::path_to_utf8(dir) +
                          "' - " + ec.message());
    }

    // Порядок перечисления зависит от файловой системы
    std::sort(result.begin(), result.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  return a.filename() < b.filename();
              });
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// get_cluster_version
// ----------------------------------------------------------------------------

std::string get_cluster_version(const std::filesystem::path& root, output::Writer* writer) {
    std::filesystem::path path =
        layout::build_manifest_path(root, "", "", "clusterversions", "config.openshift.io");
    path /= CLUSTER_VERSION_MANIFEST;

    auto loaded = manifest::Manifest::load(path);
    if (!loaded) {
        debug(writer, "cluster version unavailable: " + loaded.error.format());
        return UNKNOWN_VERSION;
    }

    auto version = loaded.manifest->get_string({"status", "desired", "version"});
    if (!version.has_value()) {
        debug(writer, "cluster version unavailable: status.desired.version is missing or not a "
                      "string - " +
                          platform::path_to_utf8(path));
        return UNKNOWN_VERSION;
    }
    return *version;
}

// ----------------------------------------------------------------------------
// get_nodes
// ----------------------------------------------------------------------------

NodeScan get_nodes(const std::filesystem::path& root, output::Writer* writer) {
    NodeScan scan;

    layout::ResourceLocator locator;
    locator.kind = "nodes";
    locator.group = "core";

    for (const auto& path : list_manifests(layout::build_manifest_path(root, locator), writer)) {
        auto loaded = manifest::Manifest::load(path);
        if (!loaded) {
            debug(writer, "skipping node manifest: " + loaded.error.format());
            ++scan.skipped;
            continue;
        }

        auto node = resources::Node::from(loaded.manifest->data());
        if (!node.has_value()) {
            debug(writer, "skipping node manifest: not a Node resource - " +
                              platform::path_to_utf8(path));
            ++scan.skipped;
            continue;
        }

        node->source = platform::path_to_utf8(loaded.manifest->path());
        scan.nodes.push_back(std::move(*node));
    }

    return scan;
}

// ----------------------------------------------------------------------------
// build
// ----------------------------------------------------------------------------

SummaryResult build(const std::filesystem::path& start, const SummaryOptions& opt) {
    SummaryResult result;

    auto found = root::find_root(start, opt.root);
    if (!found) {
        result.ok = false;
        result.error = std::move(found.error);
        return result;
    }

    if (found.depth > 0) {
        debug(opt.writer, "unwrapped " + root::describe_depth(found.depth) + " to reach root " +
                              platform::path_to_utf8(found.root));
    }

    MustGather& mg = result.summary;
    mg.root = std::move(found.root);
    mg.title = platform::path_to_utf8(mg.root.filename());
    mg.version = get_cluster_version(mg.root, opt.writer);

    NodeScan scan = get_nodes(mg.root, opt.writer);
    mg.nodes = std::move(scan.nodes);
    mg.skipped_nodes = scan.skipped;

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// to_value
// ----------------------------------------------------------------------------

Value to_value(const MustGather& mg) {
    Value obj = Value::make_object();
    obj.set("title", Value(mg.title));
    obj.set("version", Value(mg.version));
    obj.set("root", Value(platform::path_to_utf8(mg.root)));

    Value nodes = Value::make_array();
    for (const auto& node : mg.nodes) {
        nodes.push_back(node.to_value());
    }
    obj.set("nodes", std::move(nodes));
    obj.set("skipped_nodes", Value(static_cast<std::uint64_t>(mg.skipped_nodes)));
    return obj;
}

}  // namespace mustgather::summary
