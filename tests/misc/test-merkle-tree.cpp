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

#define BOOST_TEST_MODULE Merkle tree test // NOLINT(cppcoreguidelines-macro-usage)
#define BOOST_TEST_NO_OLD_TOOLS

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <boost/test/included/unit_test.hpp>
#pragma GCC diagnostic pop

#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include <batch-merkle-tree.h>
#include <hex-encoding.h>
#include <i-hasher.h>
#include <incremental-merkle-tree.h>
#include <keccak-256-hasher.h>
#include <leaf-reader.h>
#include <sha-256-hasher.h>
#include <sha3-256-hasher.h>
#include <slog.h>
#include <variant-hasher.h>

using namespace merkle;

// NOLINTBEGIN(cppcoreguidelines-avoid-do-while)

// NOLINTNEXTLINE
#define BOOST_AUTO_TEST_CASE_NOLINT(...) BOOST_AUTO_TEST_CASE(__VA_ARGS__)
// NOLINTNEXTLINE
#define BOOST_FIXTURE_TEST_CASE_NOLINT(...) BOOST_FIXTURE_TEST_CASE(__VA_ARGS__)

template <IHasher H>
static std::vector<typename H::hash_type> hash_leaves(H &h, const std::string &letters) {
    std::vector<typename H::hash_type> hashes;
    for (const char c : letters) {
        hashes.push_back(get_hash(h, std::string(1, c)));
    }
    return hashes;
}

template <IHasher H>
class leaves_fixture {
public:
    leaves_fixture() : _leaves{hash_leaves(_h, "abcdefghijklmn")} {}

    ~leaves_fixture() = default;

    leaves_fixture(const leaves_fixture &other) = delete;
    leaves_fixture(leaves_fixture &&other) noexcept = delete;
    leaves_fixture &operator=(const leaves_fixture &other) = delete;
    leaves_fixture &operator=(leaves_fixture &&other) noexcept = delete;

protected:
    std::vector<typename H::hash_type> prefix(size_t count) const {
        return {_leaves.begin(), _leaves.begin() + static_cast<std::ptrdiff_t>(count)};
    }

    H _h{};
    std::vector<typename H::hash_type> _leaves;
};

using sha_256_fixture = leaves_fixture<sha_256_hasher>;
using sha3_256_fixture = leaves_fixture<sha3_256_hasher>;

BOOST_AUTO_TEST_CASE_NOLINT(encode_hash_basic_test) {
    const sha_256_hasher::hash_type hash{0x00, 0x01, 0xab, 0xff};
    const auto encoded = sha_256_hasher::encode(hash);
    BOOST_CHECK_EQUAL(encoded.size(), 2 + (2 * sha_256_hasher::hash_size));
    BOOST_CHECK_EQUAL(encoded.substr(0, 10), std::string("0x0001abff"));
    BOOST_CHECK_EQUAL(encoded.substr(10), std::string(56, '0'));
}

BOOST_AUTO_TEST_CASE_NOLINT(decode_hash_basic_test) {
    const auto text = std::string("0x") + "ABcd" + std::string(60, '7');
    const auto hash = sha_256_hasher::decode(text);
    BOOST_CHECK_EQUAL(hash[0], 0xab);
    BOOST_CHECK_EQUAL(hash[1], 0xcd);
    BOOST_CHECK_EQUAL(hash[31], 0x77);
    BOOST_CHECK_EQUAL(sha_256_hasher::encode(hash), std::string("0xabcd") + std::string(60, '7'));
}

BOOST_AUTO_TEST_CASE_NOLINT(decode_hash_invalid_test) {
    BOOST_CHECK_THROW(sha_256_hasher::decode(std::string(64, '0')), std::invalid_argument);
    BOOST_CHECK_THROW(sha_256_hasher::decode("0x" + std::string(62, '0')), std::invalid_argument);
    BOOST_CHECK_THROW(sha_256_hasher::decode("0x" + std::string(66, '0')), std::invalid_argument);
    BOOST_CHECK_THROW(sha_256_hasher::decode("0x" + std::string(63, '0') + "g"), std::invalid_argument);
    BOOST_CHECK_THROW(sha_256_hasher::decode("0x" + std::string(63, '0') + " "), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE_NOLINT(hasher_known_answer_test) {
    sha_256_hasher sha256;
    BOOST_CHECK_EQUAL(sha_256_hasher::encode(get_hash(sha256, "")),
        "0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    BOOST_CHECK_EQUAL(sha_256_hasher::encode(get_hash(sha256, "abc")),
        "0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    sha3_256_hasher sha3;
    BOOST_CHECK_EQUAL(sha3_256_hasher::encode(get_hash(sha3, "")),
        "0xa7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
    BOOST_CHECK_EQUAL(sha3_256_hasher::encode(get_hash(sha3, "abc")),
        "0x3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
    keccak_256_hasher keccak;
    BOOST_CHECK_EQUAL(keccak_256_hasher::encode(get_hash(keccak, "")),
        "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

BOOST_AUTO_TEST_CASE_NOLINT(hasher_is_reusable_test) {
    sha_256_hasher h;
    const auto first = get_hash(h, "abc");
    const auto second = get_hash(h, "abc");
    BOOST_CHECK(first == second);
}

BOOST_AUTO_TEST_CASE_NOLINT(concat_hash_uses_encodings_test) {
    sha_256_hasher h;
    const auto left = get_hash(h, "a");
    const auto right = get_hash(h, "b");
    const auto expected = get_hash(h, sha_256_hasher::encode(left) + sha_256_hasher::encode(right));
    BOOST_CHECK(get_concat_hash(h, left, right) == expected);
    // Raw byte concatenation would give a different tree
    sha_256_hasher::hash_type raw{};
    h.begin();
    h.add_data(left.data(), left.size());
    h.add_data(right.data(), right.size());
    h.end(raw);
    BOOST_CHECK(get_concat_hash(h, left, right) != raw);
    // Order matters
    BOOST_CHECK(get_concat_hash(h, left, right) != get_concat_hash(h, right, left));
}

BOOST_AUTO_TEST_CASE_NOLINT(concat_hash_aliased_result_test) {
    sha_256_hasher h;
    const auto left = get_hash(h, "a");
    auto right = get_hash(h, "b");
    const auto expected = get_concat_hash(h, left, right);
    get_concat_hash(h, left, right, right);
    BOOST_CHECK(right == expected);
}

BOOST_AUTO_TEST_CASE_NOLINT(hash_function_type_names_test) {
    BOOST_CHECK(hash_function_type_from_string("sha256") == hash_function_type::sha256);
    BOOST_CHECK(hash_function_type_from_string("sha3-256") == hash_function_type::sha3_256);
    BOOST_CHECK(hash_function_type_from_string("keccak256") == hash_function_type::keccak256);
    BOOST_CHECK_EQUAL(std::string(to_string(hash_function_type::sha3_256)), "sha3-256");
    BOOST_CHECK_THROW(hash_function_type_from_string("md5"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE_NOLINT(variant_hasher_matches_concrete_hashers_test) {
    sha_256_hasher sha256;
    sha3_256_hasher sha3;
    keccak_256_hasher keccak;
    variant_hasher v_sha256{hash_function_type::sha256};
    variant_hasher v_sha3{hash_function_type::sha3_256};
    variant_hasher v_keccak{hash_function_type::keccak256};
    BOOST_CHECK(get_hash(v_sha256, "leaf") == get_hash(sha256, "leaf"));
    BOOST_CHECK(get_hash(v_sha3, "leaf") == get_hash(sha3, "leaf"));
    BOOST_CHECK(get_hash(v_keccak, "leaf") == get_hash(keccak, "leaf"));
    BOOST_CHECK(v_sha3.get_hash_function() == hash_function_type::sha3_256);
}

BOOST_FIXTURE_TEST_CASE_NOLINT(batch_root_empty_test, sha_256_fixture) {
    const auto root = get_batch_merkle_root_hash(_h, {});
    BOOST_CHECK(is_empty_hash(root));
    BOOST_CHECK_EQUAL(sha_256_hasher::encode(root), "0x" + std::string(64, '0'));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(batch_root_single_leaf_test, sha_256_fixture) {
    BOOST_CHECK(get_batch_merkle_root_hash(_h, prefix(1)) == _leaves[0]);
}

BOOST_FIXTURE_TEST_CASE_NOLINT(batch_root_two_leaves_test, sha_256_fixture) {
    BOOST_CHECK(get_batch_merkle_root_hash(_h, prefix(2)) == get_concat_hash(_h, _leaves[0], _leaves[1]));
    BOOST_CHECK_EQUAL(sha_256_hasher::encode(get_batch_merkle_root_hash(_h, prefix(2))),
        "0x5415c4936f7265ebfb857a6d6cc5ce36d2aa7ecbc4d69a5390f135f54879f7bc");
}

BOOST_FIXTURE_TEST_CASE_NOLINT(batch_root_three_leaves_test, sha_256_fixture) {
    const auto ab = get_concat_hash(_h, _leaves[0], _leaves[1]);
    const auto cc = get_concat_hash(_h, _leaves[2], _leaves[2]);
    BOOST_CHECK(get_batch_merkle_root_hash(_h, prefix(3)) == get_concat_hash(_h, ab, cc));
    BOOST_CHECK_EQUAL(sha_256_hasher::encode(get_batch_merkle_root_hash(_h, prefix(3))),
        "0xdf2739c2cd7bf3cd52aa4769a72fe0c838dc18ca0b147837b50267dd5f3327fb");
}

BOOST_FIXTURE_TEST_CASE_NOLINT(batch_root_known_answer_test, sha_256_fixture) {
    BOOST_CHECK_EQUAL(sha_256_hasher::encode(get_batch_merkle_root_hash(_h, _leaves)),
        "0x131f484d076bff1b3205d9b32d7d940a7c44be3a6f4c777975a411e4bda403a9");
}

BOOST_FIXTURE_TEST_CASE_NOLINT(batch_root_known_answer_sha3_test, sha3_256_fixture) {
    BOOST_CHECK_EQUAL(sha3_256_hasher::encode(get_batch_merkle_root_hash(_h, prefix(2))),
        "0x476f474edd58e3fdeb0bd2ad7dbf2ec6e0375dac5ab757159bc4ecf09272ba8e");
    BOOST_CHECK_EQUAL(sha3_256_hasher::encode(get_batch_merkle_root_hash(_h, prefix(3))),
        "0x6c2822d9fae98564c7d881b6f9f3e8fd815c243208983ecc65402e431adc4b4c");
    BOOST_CHECK_EQUAL(sha3_256_hasher::encode(get_batch_merkle_root_hash(_h, _leaves)),
        "0xcfa3d986831e17f94c1a2149e6655de705e8e2a4e61dcb834d8b16bb4524a8cd");
}

BOOST_FIXTURE_TEST_CASE_NOLINT(batch_root_duplicate_padding_test, sha_256_fixture) {
    for (size_t count = 3; count <= _leaves.size(); count += 2) {
        auto padded = prefix(count);
        padded.push_back(padded.back());
        BOOST_CHECK(get_batch_merkle_root_hash(_h, prefix(count)) == get_batch_merkle_root_hash(_h, padded));
    }
}

BOOST_FIXTURE_TEST_CASE_NOLINT(batch_root_does_not_modify_input_test, sha_256_fixture) {
    const auto leaves = prefix(5);
    const auto copy = leaves;
    std::ignore = get_batch_merkle_root_hash(_h, leaves);
    BOOST_CHECK(leaves == copy);
}

BOOST_FIXTURE_TEST_CASE_NOLINT(batch_root_deterministic_test, sha_256_fixture) {
    BOOST_CHECK(get_batch_merkle_root_hash(_h, _leaves) == get_batch_merkle_root_hash(_h, _leaves));
}

BOOST_AUTO_TEST_CASE_NOLINT(batch_root_hash_families_differ_test) {
    sha_256_hasher sha256;
    sha3_256_hasher sha3;
    const auto sha256_root = get_batch_merkle_root_hash(sha256, hash_leaves(sha256, "abcdefghijklmn"));
    const auto sha3_root = get_batch_merkle_root_hash(sha3, hash_leaves(sha3, "abcdefghijklmn"));
    BOOST_CHECK(sha256_root != sha3_root);
}

BOOST_FIXTURE_TEST_CASE_NOLINT(batch_next_level_test, sha_256_fixture) {
    const auto next = get_batch_merkle_next_level(_h, prefix(5));
    BOOST_REQUIRE_EQUAL(next.size(), 3);
    BOOST_CHECK(next[0] == get_concat_hash(_h, _leaves[0], _leaves[1]));
    BOOST_CHECK(next[1] == get_concat_hash(_h, _leaves[2], _leaves[3]));
    BOOST_CHECK(next[2] == get_concat_hash(_h, _leaves[4], _leaves[4]));
}

BOOST_AUTO_TEST_CASE_NOLINT(incremental_tree_new_test) {
    const incremental_merkle_tree<sha_256_hasher> tree;
    BOOST_CHECK(tree.empty());
    BOOST_CHECK_EQUAL(tree.get_height(), 0);
    BOOST_CHECK(is_empty_hash(tree.get_root_hash()));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(incremental_tree_equivalence_sha256_test, sha_256_fixture) {
    incremental_merkle_tree<sha_256_hasher> tree;
    for (size_t i = 0; i < _leaves.size(); ++i) {
        const auto root = tree.push_back(_leaves[i]);
        BOOST_CHECK(root == get_batch_merkle_root_hash(_h, prefix(i + 1)));
        BOOST_CHECK(tree.get_root_hash() == root);
    }
}

BOOST_FIXTURE_TEST_CASE_NOLINT(incremental_tree_equivalence_sha3_test, sha3_256_fixture) {
    incremental_merkle_tree<sha3_256_hasher> tree;
    for (size_t i = 0; i < _leaves.size(); ++i) {
        const auto root = tree.push_back(_leaves[i]);
        BOOST_CHECK(root == get_batch_merkle_root_hash(_h, prefix(i + 1)));
    }
}

BOOST_AUTO_TEST_CASE_NOLINT(incremental_tree_equivalence_many_leaves_test) {
    keccak_256_hasher h;
    incremental_merkle_tree<keccak_256_hasher> tree;
    std::vector<keccak_256_hasher::hash_type> leaves;
    for (int i = 0; i < 70; ++i) {
        leaves.push_back(get_hash(h, std::to_string(i)));
        BOOST_CHECK(tree.push_back(leaves.back()) == get_batch_merkle_root_hash(h, leaves));
    }
    // 70 = 0b1000110 needs 7 levels
    BOOST_CHECK_EQUAL(tree.get_height(), 7);
}

BOOST_AUTO_TEST_CASE_NOLINT(incremental_tree_variant_hasher_test) {
    variant_hasher h{hash_function_type::sha3_256};
    incremental_merkle_tree<variant_hasher> tree{variant_hasher{hash_function_type::sha3_256}};
    const auto leaves = hash_leaves(h, "abcdefg");
    for (size_t i = 0; i < leaves.size(); ++i) {
        const std::vector<variant_hasher::hash_type> prefix(leaves.begin(), leaves.begin() + i + 1);
        BOOST_CHECK(tree.push_back(leaves[i]) == get_batch_merkle_root_hash(h, prefix));
    }
}

BOOST_FIXTURE_TEST_CASE_NOLINT(incremental_tree_context_test, sha_256_fixture) {
    incremental_merkle_tree<sha_256_hasher> tree;
    const sha_256_hasher::hash_type empty{};
    const auto ab = get_concat_hash(_h, _leaves[0], _leaves[1]);
    const auto cd = get_concat_hash(_h, _leaves[2], _leaves[3]);
    const auto abcd = get_concat_hash(_h, ab, cd);
    // First leaf opens level 0
    tree.push_back(_leaves[0]);
    BOOST_CHECK(tree.get_context() == (std::vector{_leaves[0]}));
    // Second leaf pairs with it and carries into a new level
    tree.push_back(_leaves[1]);
    BOOST_CHECK(tree.get_context() == (std::vector{empty, ab}));
    // Third leaf waits for its sibling, level 1 is untouched
    tree.push_back(_leaves[2]);
    BOOST_CHECK(tree.get_context() == (std::vector{_leaves[2], ab}));
    // Fourth leaf carries through two levels
    tree.push_back(_leaves[3]);
    BOOST_CHECK(tree.get_context() == (std::vector{empty, empty, abcd}));
    BOOST_CHECK(tree.get_root_hash() == abcd);
    // Fifth leaf is stored without changing upper levels
    tree.push_back(_leaves[4]);
    BOOST_CHECK(tree.get_context() == (std::vector{_leaves[4], empty, abcd}));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(incremental_tree_zero_leaf_test, sha_256_fixture) {
    incremental_merkle_tree<sha_256_hasher> tree;
    const sha_256_hasher::hash_type zero{};
    BOOST_CHECK(is_empty_hash(tree.push_back(zero)));
    BOOST_CHECK(tree.get_context() == (std::vector{zero}));
    // The zero leaf occupies level 0 as an empty slot, so the next leaf takes its place
    BOOST_CHECK(tree.push_back(_leaves[0]) == get_concat_hash(_h, _leaves[0], _leaves[0]));
    BOOST_CHECK(tree.get_context() == (std::vector{_leaves[0]}));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(incremental_tree_restore_test, sha_256_fixture) {
    for (size_t saved_count = 0; saved_count < _leaves.size(); ++saved_count) {
        incremental_merkle_tree<sha_256_hasher> tree;
        for (size_t i = 0; i < saved_count; ++i) {
            tree.push_back(_leaves[i]);
        }
        const auto saved_root = tree.get_root_hash();
        incremental_merkle_tree<sha_256_hasher> restored{tree.get_context()};
        BOOST_CHECK(restored.get_context() == tree.get_context());
        // The root is not part of the context
        BOOST_CHECK(is_empty_hash(restored.get_root_hash()));
        BOOST_CHECK(saved_root == get_batch_merkle_root_hash(_h, prefix(saved_count)));
        const auto root = tree.push_back(_leaves[saved_count]);
        BOOST_CHECK(restored.push_back(_leaves[saved_count]) == root);
        BOOST_CHECK(root == get_batch_merkle_root_hash(_h, prefix(saved_count + 1)));
    }
}

BOOST_FIXTURE_TEST_CASE_NOLINT(incremental_tree_restore_and_continue_test, sha_256_fixture) {
    incremental_merkle_tree<sha_256_hasher> tree;
    for (size_t i = 0; i < 6; ++i) {
        tree.push_back(_leaves[i]);
    }
    incremental_merkle_tree<sha_256_hasher> restored{tree.get_context()};
    for (size_t i = 6; i < _leaves.size(); ++i) {
        BOOST_CHECK(restored.push_back(_leaves[i]) == get_batch_merkle_root_hash(_h, prefix(i + 1)));
    }
}

BOOST_AUTO_TEST_CASE_NOLINT(incremental_tree_hash_families_differ_test) {
    sha_256_hasher sha256;
    sha3_256_hasher sha3;
    incremental_merkle_tree<sha_256_hasher> sha256_tree;
    incremental_merkle_tree<sha3_256_hasher> sha3_tree;
    const auto sha256_leaves = hash_leaves(sha256, "abcde");
    const auto sha3_leaves = hash_leaves(sha3, "abcde");
    for (size_t i = 0; i < sha256_leaves.size(); ++i) {
        BOOST_CHECK(sha256_tree.push_back(sha256_leaves[i]) != sha3_tree.push_back(sha3_leaves[i]));
    }
}

BOOST_AUTO_TEST_CASE_NOLINT(read_leaves_test) {
    FILE *f = tmpfile();
    BOOST_REQUIRE(f != nullptr);
    const std::string text = "a\nbc\r\n\nlast";
    BOOST_REQUIRE_EQUAL(fwrite(text.data(), 1, text.size(), f), text.size());
    rewind(f);
    const auto leaves = read_leaves(f);
    std::ignore = fclose(f);
    BOOST_REQUIRE_EQUAL(leaves.size(), 4);
    BOOST_CHECK_EQUAL(leaves[0], "a");
    BOOST_CHECK_EQUAL(leaves[1], "bc");
    BOOST_CHECK_EQUAL(leaves[2], "");
    BOOST_CHECK_EQUAL(leaves[3], "last");
}

BOOST_AUTO_TEST_CASE_NOLINT(log_level_names_test) {
    BOOST_CHECK(slog::from_string("debug") == slog::severity_level::debug);
    BOOST_CHECK_EQUAL(std::string(slog::to_string(slog::severity_level::warning)), "warning");
    BOOST_CHECK_THROW(slog::from_string("verbose"), std::domain_error);
    const auto previous = slog::log_level(slog::level_operation::set, slog::severity_level::error);
    BOOST_CHECK(slog::log_level(slog::level_operation::get) == slog::severity_level::error);
    slog::log_level(slog::level_operation::set, previous);
}

BOOST_AUTO_TEST_CASE_NOLINT(log_output_prefix_test) {
    std::ostringstream captured;
    auto *const clog_buf = std::clog.rdbuf(captured.rdbuf());
    const auto previous = slog::log_level(slog::level_operation::set, slog::severity_level::info);
    SLOG(debug) << "hidden";
    SLOG(info) << "read " << 3 << " leaves";
    SLOG(error) << "bad leaf";
    slog::log_level(slog::level_operation::set, previous);
    std::clog.rdbuf(clog_buf);
    BOOST_CHECK_EQUAL(captured.str(), "[info] read 3 leaves\n[error] bad leaf\n");
}

// NOLINTEND(cppcoreguidelines-avoid-do-while)
