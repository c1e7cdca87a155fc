// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "node_adapter.h"
#include "path_template.h"
#include "version_error.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vnav {

/// One component of a sort key
using SortKeyField = std::variant<int64_t, std::string>;

/// Compared lexicographically; integers sort before strings at the same position
using SortKey = std::vector<SortKeyField>;

/**
 * @brief Priority function: (node, selection index, nesting depth) -> key
 */
using SortKeyFunction = std::function<SortKey(const NodeAdapter& node, int index, int depth)>;

/**
 * @brief A node as selected in the host
 */
struct SelectedNode {
    std::shared_ptr<NodeAdapter> node;
    int index = 0; ///< Position in the host selection
    int depth = 0; ///< Nesting depth (0 = top level)
};

/**
 * @brief The node whose path drives the navigation view
 */
struct DisplayCandidate {
    size_t position = 0; ///< Index in the sorted node list
    PathTemplate tmpl;
};

/**
 * @brief Orders selected nodes and picks the display candidate
 */
class NodeSortKeyEvaluator {
  public:
    explicit NodeSortKeyEvaluator(SortKeyFunction key_fn = nullptr);

    /**
     * @brief Stable sort ascending by key
     *
     * Keys are computed once per node. Without a key function the key is
     * (0, index), which keeps the selection order.
     */
    std::vector<SelectedNode> sort(const std::vector<SelectedNode>& nodes) const;

    static SortKey default_key(const NodeAdapter& node, int index, int depth);

    /**
     * @brief First node with a non-empty path holding a version marker
     *
     * Nodes with an empty or unparseable path are skipped.
     *
     * @param sorted Nodes in priority order
     * @param base_dir Directory for relative paths
     * @param error Set to NO_DISPLAYABLE_NODE when nothing qualifies (may be null)
     */
    static std::optional<DisplayCandidate>
    pick_display_candidate(const std::vector<SelectedNode>& sorted, const std::string& base_dir,
                           VersionError* error = nullptr);

  private:
    SortKeyFunction key_fn_;
};

} // namespace vnav
