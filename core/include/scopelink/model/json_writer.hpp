// scopelink/model/json_writer.hpp - JSON dumps of model trees and scopes
//
// The node format is the one ModelReader accepts, with the node id added once
// a node has been stamped. Dumps are meant for inspection, not for reloading
// a linked Environment.
//
#pragma once

#include <nlohmann/json.hpp>

#include "scopelink/model/model.hpp"

namespace scopelink
{

class Scope;

/**
 * Serialize a node and its subtree.
 *
 * @param node Any node; nullptr yields JSON null
 */
[[nodiscard]] nlohmann::json to_json(const Node * node);

/**
 * Summarize a scope: contribution names (registration order) with the kind
 * and id of each target, the number of included scopes, and whether it has a
 * container.
 */
[[nodiscard]] nlohmann::json to_json(const Scope & scope);

}  // namespace scopelink
