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

#ifndef VARIANT_HASHER_H
#define VARIANT_HASHER_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "i-hasher.h"
#include "keccak-256-hasher.h"
#include "sha-256-hasher.h"
#include "sha3-256-hasher.h"

namespace merkle {

/// \brief Hash function
enum class hash_function_type : uint64_t {
    sha256,    ///< SHA-256 (SHA-2 family)
    sha3_256,  ///< SHA3-256 (FIPS 202)
    keccak256, ///< Keccak-256 (as used by Ethereum)
};

/// \brief Gets the name of a hash function
/// \param hash_function Hash function
/// \returns "sha256", "sha3-256" or "keccak256"
const char *to_string(hash_function_type hash_function);

/// \brief Gets the hash function with a given name or throws std::invalid_argument
/// \param name Name of the hash function
/// \returns The corresponding enumeration
hash_function_type hash_function_type_from_string(const char *name);

/// \brief Hasher selected at run time among the supported hash functions
class variant_hasher final : public i_hasher<variant_hasher, std::integral_constant<size_t, 32>> {
    std::variant<sha_256_hasher, sha3_256_hasher, keccak_256_hasher> m_hasher_impl;
    hash_function_type m_hash_function;

    friend i_hasher<variant_hasher, std::integral_constant<size_t, 32>>;

    void do_begin() {
        std::visit([](auto &h) { h.begin(); }, m_hasher_impl);
    }

    void do_add_data(const unsigned char *data, size_t length) {
        std::visit([data, length](auto &h) { h.add_data(data, length); }, m_hasher_impl);
    }

    void do_end(hash_type &hash) {
        std::visit([&hash](auto &h) { h.end(hash); }, m_hasher_impl);
    }

public:
    explicit variant_hasher(hash_function_type hash_function) : m_hash_function{hash_function} {
        switch (hash_function) {
            case hash_function_type::sha256:
                m_hasher_impl.emplace<sha_256_hasher>();
                break;
            case hash_function_type::sha3_256:
                m_hasher_impl.emplace<sha3_256_hasher>();
                break;
            case hash_function_type::keccak256:
                m_hasher_impl.emplace<keccak_256_hasher>();
                break;
            default:
                throw std::invalid_argument("unsupported hash function type");
        }
    }

    variant_hasher() = delete; ///< Default constructor is not allowed

    /// \brief Returns the hash function in use
    hash_function_type get_hash_function() const noexcept {
        return m_hash_function;
    }
};

} // namespace merkle

#endif
