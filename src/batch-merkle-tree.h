// Copyright Cartesi and individual authors (see AUTHORS)
// SPDX-License-Identifier: LGPL-3.0-or-later
//
// This program is free software: you can redistribute it and/or modify it under
// the terms of the GNU Lesser General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT ANY
// WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
// PARTICULAR PURPOSE. See the GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License along
// with this program (see COPYING). If not, see <https://www.gnu.org/licenses/>.
//

#ifndef BATCH_MERKLE_TREE_H
#define BATCH_MERKLE_TREE_H

#include <cstddef>
#include <vector>

#include "i-hasher.h"

/// \file
/// \brief Batch Merkle root computation.

namespace merkle {

/// \brief Reduces one level of the tree to the level above it
/// \tparam H Hasher class
/// \param h Hasher object
/// \param level Node hashes at the current level, in order. Must not be empty.
/// \returns Node hashes at the level above, in order
/// \details When level has an odd number of nodes, its last node is paired with
/// a copy of itself.
template <IHasher H>
std::vector<typename H::hash_type> get_batch_merkle_next_level(H &h, const std::vector<typename H::hash_type> &level) {
    std::vector<typename H::hash_type> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
        const auto &left = level[i];
        const auto &right = (i + 1 < level.size()) ? level[i + 1] : left;
        next.push_back(get_concat_hash(h, left, right));
    }
    return next;
}

/// \brief Computes the Merkle root of a complete list of leaf hashes
/// \tparam H Hasher class
/// \param h Hasher object
/// \param leaves Leaf hashes, in order
/// \returns Root hash. The empty hash if there are no leaves, the leaf itself if there is only one.
/// \details Reduces the list level by level until a single node remains.
/// Odd levels are padded by duplicating their last node.
template <IHasher H>
typename H::hash_type get_batch_merkle_root_hash(H &h, const std::vector<typename H::hash_type> &leaves) {
    if (leaves.empty()) {
        return get_empty_hash<H>();
    }
    if (leaves.size() == 1) {
        return leaves.front();
    }
    auto level = get_batch_merkle_next_level(h, leaves);
    while (level.size() > 1) {
        level = get_batch_merkle_next_level(h, level);
    }
    return level.front();
}

} // namespace merkle

#endif
