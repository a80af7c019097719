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
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "batch-merkle-tree.h"
#include "incremental-merkle-tree.h"
#include "leaf-reader.h"
#include "slog.h"
#include "unique-c-ptr.h"
#include "variant-hasher.h"

using namespace merkle;
using hasher_type = variant_hasher;
using hash_type = hasher_type::hash_type;

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

/// \brief Prints hash in its canonical encoding to file
/// \param hash Hash to be printed.
/// \param f File to print to
static void print_hash(const hash_type &hash, FILE *f) {
    (void) fprintf(f, "%s\n", hasher_type::encode(hash).c_str());
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

/// \brief Prints help message
static void help(const char *name) {
    (void) fprintf(stderr, R"(Usage:

  %s [options]

Computes the Merkle root of a list of leaves read one per line from a file.

Each leaf is hashed, and the list of leaf hashes is reduced pairwise, level
by level, until a single hash remains. When a level has an odd number of
nodes, its last node is paired with itself. A node hash is the hash of the
concatenation of the canonical encodings ("0x" followed by lowercase hex)
of its two children. The root of an empty list is the all-zero hash.

Options:

  --input=<filename>                    default: reads from standard input
  Gives the input filename.

  --hash-function=<name>                default: sha256
  One of sha256, sha3-256 or keccak256.

  --hashed
  Each line already holds an encoded leaf hash, which is used as is.

  --incremental
  Feeds leaves one at a time to an incremental tree and prints the root
  after each one.

  --log-level=<level>                   default: warning
  One of trace, debug, info, warning, error or fatal.

  --help
  Prints this message and returns.
)",
        name);
    exit(0);
}

int main(int argc, char *argv[]) try {
    const char *input_name = nullptr;
    const char *hash_function_name = "sha256";
    const char *log_level_name = nullptr;
    bool hashed = false;
    bool incremental = false;
    // Process command line arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0) {
            help(argv[0]);
        } else if (strcmp(argv[i], "--hashed") == 0) {
            hashed = true;
        } else if (strcmp(argv[i], "--incremental") == 0) {
            incremental = true;
        } else if (stringval("--input=", argv[i], &input_name)) {
            ;
        } else if (stringval("--hash-function=", argv[i], &hash_function_name)) {
            ;
        } else if (stringval("--log-level=", argv[i], &log_level_name)) {
            ;
        } else {
            error("unrecognized option '%s'\n", argv[i]);
        }
    }
    if (log_level_name != nullptr) {
        slog::log_level(slog::level_operation::set, slog::from_string(log_level_name));
    }
    const auto hash_function = hash_function_type_from_string(hash_function_name);
    SLOG(debug) << "using hash function " << to_string(hash_function);

    // Read from stdin if no input name was given
    auto input_file = unique_file_ptr{stdin};
    if (input_name != nullptr) {
        input_file = make_unique_fopen(input_name, "r");
    }

    hasher_type h{hash_function};
    incremental_merkle_tree<hasher_type> incremental_tree{hasher_type{hash_function}};
    // Only the batch tree needs to keep all leaf hashes
    std::vector<hash_type> leaf_hashes;
    size_t leaf_count = 0;
    while (auto leaf = read_leaf(input_file.get())) {
        const auto leaf_hash = hashed ? hasher_type::decode(*leaf) : get_hash(h, *leaf);
        SLOG(trace) << "leaf " << leaf_count << ": " << hasher_type::encode(leaf_hash);
        ++leaf_count;
        if (incremental) {
            print_hash(incremental_tree.push_back(leaf_hash), stdout);
        } else {
            leaf_hashes.push_back(leaf_hash);
        }
    }
    SLOG(debug) << "read " << leaf_count << " leaves";
    if (incremental) {
        SLOG(debug) << "incremental tree height is " << incremental_tree.get_height();
        if (leaf_count == 0) {
            print_hash(incremental_tree.get_root_hash(), stdout);
        }
    } else {
        print_hash(get_batch_merkle_root_hash(h, leaf_hashes), stdout);
    }
    return 0;
} catch (std::exception &x) {
    std::cerr << "Caught exception: " << x.what() << '\n';
    exit(1);
}
