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

#ifndef INCREMENTAL_MERKLE_TREE_H
#define INCREMENTAL_MERKLE_TREE_H

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include "i-hasher.h"

/// \file
/// \brief Incremental Merkle tree interface.

namespace merkle {

/// \brief Incremental Merkle tree that maintains the root of a growing list of leaves
/// \tparam H Hasher class
/// \details Stores at most one hash per tree level (the context), so space is O(log n).
/// After each push_back, the root equals what get_batch_merkle_root_hash() would produce
/// over all leaves pushed so far, including its duplication of the last node on odd levels.
/// Not safe for concurrent use: push_back must be serialized per instance.
template <IHasher H>
class incremental_merkle_tree {
public:
    /// \brief Hasher class.
    using hasher_type = H;

    /// \brief Storage for a hash.
    using hash_type = typename hasher_type::hash_type;

    /// \brief Storage for the context.
    using hashes_type = std::vector<hash_type>;

    /// \brief Constructor for an empty tree
    /// \param h Hasher object
    explicit incremental_merkle_tree(hasher_type h = hasher_type{}) : m_hasher{std::move(h)} {}

    /// \brief Constructor from a previously saved context
    /// \param context Context obtained from get_context()
    /// \param h Hasher object
    /// \details The root hash is not part of the context and starts out empty.
    /// Callers that need it across a save point must keep it themselves.
    explicit incremental_merkle_tree(hashes_type context, hasher_type h = hasher_type{}) :
        m_hasher{std::move(h)},
        m_context{std::move(context)} {}

    /// \brief Appends a new leaf hash to the tree
    /// \param new_leaf_hash Hash of new leaf data
    /// \returns Root hash of the tree with the new leaf
    /// \details
    /// The walk goes up one level at a time, carrying the hash to be merged at that level.
    /// While the walk is authoritative it behaves like a binary counter increment:
    /// an occupied level is paired with the carried hash and cleared (carry), and an empty
    /// level receives the carried hash (no carry). From that point on the walk only
    /// projects the root, pairing with stored siblings or with a copy of itself,
    /// without touching the context.
    /// An all-zero leaf hash cannot be told apart from an empty level and is treated as one.
    const hash_type &push_back(const hash_type &new_leaf_hash) {
        hash_type value = new_leaf_hash;
        bool authoritative = true;
        for (size_t level = 0;; ++level) {
            if (level >= m_context.size()) {
                // Only grows here before any level holds a sibling
                const bool all_empty = std::all_of(m_context.begin(), m_context.end(),
                    [](const hash_type &hash) { return is_empty_hash(hash); });
                if (all_empty) {
                    m_context.push_back(value);
                }
                break;
            }
            auto &sibling = m_context[level];
            if (is_empty_hash(sibling)) {
                if (authoritative) {
                    sibling = value;
                    authoritative = false;
                }
                get_concat_hash(m_hasher, value, value, value);
            } else {
                get_concat_hash(m_hasher, sibling, value, value);
                if (authoritative) {
                    sibling = hash_type{};
                }
            }
        }
        m_root_hash = value;
        return m_root_hash;
    }

    /// \brief Returns the root hash returned by the last call to push_back()
    /// \details The empty hash for a new tree or one constructed from a context
    const hash_type &get_root_hash() const noexcept {
        return m_root_hash;
    }

    /// \brief Returns the context, one entry per level, empty hash for levels with no stored sibling
    const hashes_type &get_context() const noexcept {
        return m_context;
    }

    /// \brief Returns the number of levels in the context
    size_t get_height() const noexcept {
        return m_context.size();
    }

    /// \brief Returns true if no leaf has been stored yet
    bool empty() const noexcept {
        return m_context.empty();
    }

private:
    hasher_type m_hasher;     ///< Hasher object
    hashes_type m_context;    ///< Stored sibling per level
    hash_type m_root_hash{};  ///< Root hash after last push_back
};

} // namespace merkle

#endif
