#include "babbler/io/snapshot_json.hpp"
#include "babbler/error.hpp"

#include <algorithm>
#include <cstdint>

namespace babbler::io {

using generative::ChainSnapshot;
using generative::Node;

namespace {

const boost::json::value& require(const boost::json::object& obj, const char* key, const std::string& where) {
    const boost::json::value* v = obj.if_contains(key);
    if (!v) {
        throw SnapshotError(std::string("missing field '") + key + "'", where);
    }
    return *v;
}

uint64_t read_count(const boost::json::value& v, const std::string& what) {
    if (v.is_uint64()) return v.get_uint64();
    if (v.is_int64() && v.get_int64() >= 0) return static_cast<uint64_t>(v.get_int64());
    throw SnapshotError("expected a non-negative integer", what);
}

boost::json::object node_to_json(const Node& node) {
    boost::json::array links;
    links.reserve(node.links.size());
    for (const auto& link : node.links) links.emplace_back(boost::json::string_view(link));

    boost::json::array freqs;
    freqs.reserve(node.freqs.size());
    for (uint64_t f : node.freqs) freqs.emplace_back(f);

    boost::json::object obj;
    obj["links"] = std::move(links);
    obj["freqs"] = std::move(freqs);
    obj["weight"] = node.weight;
    obj["isExit"] = node.is_exit;
    return obj;
}

Node node_from_json(const boost::json::value& v, const std::string& tail) {
    const std::string where = "node for tail '" + tail + "'";
    if (!v.is_object()) {
        throw SnapshotError("node is not an object", where);
    }
    const auto& obj = v.get_object();

    Node node;

    const auto& links = require(obj, "links", where);
    if (!links.is_array()) throw SnapshotError("'links' is not an array", where);
    for (const auto& link : links.get_array()) {
        if (!link.is_string()) throw SnapshotError("link is not a string", where);
        node.links.emplace_back(link.get_string().data(), link.get_string().size());
    }

    const auto& freqs = require(obj, "freqs", where);
    if (!freqs.is_array()) throw SnapshotError("'freqs' is not an array", where);
    for (const auto& freq : freqs.get_array()) {
        node.freqs.push_back(read_count(freq, where + " freqs"));
    }

    node.weight = read_count(require(obj, "weight", where), where + " weight");

    const auto& is_exit = require(obj, "isExit", where);
    if (!is_exit.is_bool()) throw SnapshotError("'isExit' is not a boolean", where);
    node.is_exit = is_exit.get_bool();

    return node;
}

} // namespace

boost::json::value snapshot_to_json(const ChainSnapshot& snapshot) {
    boost::json::object graph;
    graph.reserve(snapshot.graph.size());
    for (const auto& [tail, node] : snapshot.graph) {
        graph[tail] = node_to_json(node);
    }

    boost::json::object root;
    root["order"] = snapshot.order;
    root["graph"] = std::move(graph);
    return root;
}

ChainSnapshot snapshot_from_json(const boost::json::value& json) {
    if (!json.is_object()) {
        throw SnapshotError("snapshot is not an object", "snapshot_from_json");
    }
    const auto& root = json.get_object();

    ChainSnapshot snapshot;

    const auto& order = require(root, "order", "snapshot");
    if (order.is_int64()) {
        snapshot.order = order.get_int64();
    } else if (order.is_uint64()) {
        snapshot.order = static_cast<int64_t>(std::min<uint64_t>(order.get_uint64(), INT64_MAX));
    } else {
        throw SnapshotError("'order' is not an integer", "snapshot");
    }

    if (const auto* graph = root.if_contains("graph")) {
        if (!graph->is_object()) throw SnapshotError("'graph' is not an object", "snapshot");
        for (const auto& entry : graph->get_object()) {
            std::string tail(entry.key().data(), entry.key().size());
            Node node = node_from_json(entry.value(), tail);
            snapshot.graph.emplace_back(std::move(tail), std::move(node));
        }
    } else if (const auto* legacy = root.if_contains("graphData")) {
        if (!legacy->is_array()) throw SnapshotError("'graphData' is not an array", "snapshot");
        for (const auto& pair : legacy->get_array()) {
            if (!pair.is_array() || pair.get_array().size() != 2 || !pair.get_array()[0].is_string()) {
                throw SnapshotError("graphData entry is not a [tail, node] pair", "snapshot");
            }
            const auto& key = pair.get_array()[0].get_string();
            std::string tail(key.data(), key.size());
            Node node = node_from_json(pair.get_array()[1], tail);
            snapshot.graph.emplace_back(std::move(tail), std::move(node));
        }
    } else {
        throw SnapshotError("missing field 'graph'", "snapshot");
    }

    return snapshot;
}

std::string serialize_snapshot(const ChainSnapshot& snapshot) {
    return boost::json::serialize(snapshot_to_json(snapshot));
}

ChainSnapshot parse_snapshot(const std::string& text) {
    boost::json::error_code ec;
    boost::json::value json = boost::json::parse(text, ec);
    if (ec) {
        throw SnapshotError("invalid JSON: " + ec.message(), "parse_snapshot");
    }
    return snapshot_from_json(json);
}

} // namespace babbler::io
