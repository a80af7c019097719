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

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "batch-merkle-tree.h"
#include "incremental-merkle-tree.h"
#include "keccak-256-hasher.h"
#include "leaf-reader.h"
#include "sha-256-hasher.h"
#include "sha3-256-hasher.h"
#include "unique-c-ptr.h"
#include "variant-hasher.h"

using namespace merkle;

/// \brief Checks if string matches prefix and captures remaninder
/// \param pre Prefix to match in str.
/// \param str Input string
/// \param val If string matches prefix, points to remaninder
/// \returns True if string matches prefix, false otherwise
static bool stringval(const char *pre, const char *str, const char **val) {
    const size_t len = strlen(pre);
    if (strncmp(pre, str, len) == 0) {
        *val = str + len;
        return true;
    }
    return false;
}

/// \brief Prints formatted message to stderr
/// \param fmt Format string
/// \param ... Arguments, if any
// NOLINTNEXTLINE(cert-dcl50-cpp): this vararg is safe because the compiler can check the format
__attribute__((format(printf, 1, 2))) static void error(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    (void) vfprintf(stderr, fmt, ap);
    va_end(ap);
    exit(1);
}

/// \brief Checks that the incremental and batch trees agree on every prefix of leaves
/// \tparam H Hasher class
/// \param h Hasher object
/// \param name Name of the hash function, for error messages
/// \param leaves Leaf data
template <IHasher H>
static void check_equivalence(H h, const char *name, const std::vector<std::string> &leaves) {
    using hash_type = typename H::hash_type;
    std::vector<hash_type> leaf_hashes;
    incremental_merkle_tree<H> incremental_tree{h};
    if (get_batch_merkle_root_hash(h, leaf_hashes) != hash_type{}) {
        error("%s: root of empty list is not the empty hash\n", name);
    }
    for (const auto &leaf : leaves) {
        const auto leaf_hash = get_hash(h, leaf);
        leaf_hashes.push_back(leaf_hash);
        // Save the context before adding the leaf, and restore it into a new tree
        incremental_merkle_tree<H> restored_tree{incremental_tree.get_context(), h};
        const auto incremental_root = incremental_tree.push_back(leaf_hash);
        const auto batch_root = get_batch_merkle_root_hash(h, leaf_hashes);
        // Compare the root hash for the incremental tree and the batch root
        // computed from scratch over all leaf hashes
        if (incremental_root != batch_root) {
            error("%s: mismatch in root hash for incremental tree and batch tree after %zu leaves\n", name,
                leaf_hashes.size());
        }
        if (incremental_tree.get_root_hash() != incremental_root) {
            error("%s: incremental tree did not keep root hash after %zu leaves\n", name, leaf_hashes.size());
        }
        // Compare the root hash for the restored tree with the original
        if (restored_tree.push_back(leaf_hash) != incremental_root) {
            error("%s: mismatch in root hash for restored tree after %zu leaves\n", name, leaf_hashes.size());
        }
        if (restored_tree.get_context() != incremental_tree.get_context()) {
            error("%s: mismatch in context for restored tree after %zu leaves\n", name, leaf_hashes.size());
        }
    }
    std::cerr << name << ": " << leaves.size() << " leaves, root " << H::encode(incremental_tree.get_root_hash())
              << '\n';
}

/// \brief Prints help message
static void help(const char *name) {
    (void) fprintf(stderr,
        "Usage:\n  %s [--input=<filename>]\n\n"
        "Reads leaves one per line (default: the letters a to n) and checks that the\n"
        "incremental tree matches the batch tree after each leaf, for every hash function.\n",
        name);
    exit(0);
}

int main(int argc, char *argv[]) try {
    const char *input_name = nullptr;
    // Process command line arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0) {
            help(argv[0]);
        } else if (stringval("--input=", argv[i], &input_name)) {
            ;
        } else {
            error("unrecognized option '%s'\n", argv[i]);
        }
    }
    std::vector<std::string> leaves;
    if (input_name != nullptr) {
        auto input_file = make_unique_fopen(input_name, "r");
        leaves = read_leaves(input_file.get());
    } else {
        for (char c = 'a'; c <= 'n'; ++c) {
            leaves.emplace_back(1, c);
        }
    }
    check_equivalence(sha_256_hasher{}, "sha256", leaves);
    check_equivalence(sha3_256_hasher{}, "sha3-256", leaves);
    check_equivalence(keccak_256_hasher{}, "keccak256", leaves);
    for (auto hash_function :
        {hash_function_type::sha256, hash_function_type::sha3_256, hash_function_type::keccak256}) {
        check_equivalence(variant_hasher{hash_function}, to_string(hash_function), leaves);
    }
    (void) fprintf(stderr, "passed test\n");
    return 0;
} catch (std::exception &x) {
    std::cerr << "Caught exception: " << x.what() << '\n';
    exit(1);
}
