// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "node_sort.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace vnav {

NodeSortKeyEvaluator::NodeSortKeyEvaluator(SortKeyFunction key_fn) : key_fn_(std::move(key_fn)) {}

SortKey NodeSortKeyEvaluator::default_key(const NodeAdapter& /*node*/, int index, int /*depth*/) {
    return {int64_t{0}, static_cast<int64_t>(index)};
}

std::vector<SelectedNode> NodeSortKeyEvaluator::sort(const std::vector<SelectedNode>& nodes) const {
    std::vector<SortKey> keys;
    keys.reserve(nodes.size());
    for (const auto& selected : nodes) {
        keys.push_back(key_fn_ ? key_fn_(*selected.node, selected.index, selected.depth)
                               : default_key(*selected.node, selected.index, selected.depth));
    }

    std::vector<size_t> order(nodes.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&keys](size_t a, size_t b) { return keys[a] < keys[b]; });

    std::vector<SelectedNode> sorted;
    sorted.reserve(nodes.size());
    for (size_t i : order) {
        sorted.push_back(nodes[i]);
    }
    return sorted;
}

std::optional<DisplayCandidate>
NodeSortKeyEvaluator::pick_display_candidate(const std::vector<SelectedNode>& sorted,
                                             const std::string& base_dir, VersionError* error) {
    for (size_t i = 0; i < sorted.size(); ++i) {
        const NodeAdapter& node = *sorted[i].node;
        const std::string path = node.get_path_value();
        if (path.empty()) {
            spdlog::debug("[NodeSortKeyEvaluator] Skipping {}: empty path", node.name());
            continue;
        }

        auto tmpl = PathTemplateParser::parse(path, base_dir);
        if (!tmpl) {
            spdlog::debug("[NodeSortKeyEvaluator] Skipping {}: no version in '{}'", node.name(),
                          path);
            continue;
        }

        spdlog::debug("[NodeSortKeyEvaluator] Display candidate: {} ({})", node.name(), path);
        return DisplayCandidate{i, std::move(*tmpl)};
    }

    if (error) {
        *error = VersionError::no_displayable_node(sorted.size());
    }
    return std::nullopt;
}

} // namespace vnav
