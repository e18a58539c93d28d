/**
 * JSON encoding of chain snapshots.
 *
 * Written format:
 *   {"order": 4,
 *    "graph": {"<tail>": {"links": [...], "freqs": [...], "weight": 3, "isExit": true}, ...}}
 *
 * The reader also accepts the legacy layout, where the graph is stored
 * as an array of [tail, node] pairs under "graphData".
 */

#pragma once

#include "babbler/generative/node.hpp"

#include <boost/json.hpp>
#include <string>

namespace babbler::io {

boost::json::value snapshot_to_json(const generative::ChainSnapshot& snapshot);

// @throws SnapshotError on structural problems (missing fields, wrong types)
generative::ChainSnapshot snapshot_from_json(const boost::json::value& json);

std::string serialize_snapshot(const generative::ChainSnapshot& snapshot);

// @throws SnapshotError on malformed JSON text or structure
generative::ChainSnapshot parse_snapshot(const std::string& text);

} // namespace babbler::io
