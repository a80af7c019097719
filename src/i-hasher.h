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

#ifndef I_HASHER_H
#define I_HASHER_H

/// \file
/// \brief Hasher interface

#include <array>
#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>

#include "hex-encoding.h"

namespace merkle {

/// \brief Hasher interface.
/// \tparam DERIVED Derived class implementing the interface. (An example of CRTP.)
/// \tparam HASH_SIZE Size of hash, as an std::integral_constant.
template <typename DERIVED, typename HASH_SIZE>
class i_hasher { // CRTP
    i_hasher() = default;
    friend DERIVED;

    /// \brief Returns object cast as the derived class
    DERIVED &derived() {
        return *static_cast<DERIVED *>(this);
    }

    /// \brief Returns object cast as the derived class
    const DERIVED &derived() const {
        return *static_cast<const DERIVED *>(this);
    }

public:
    static constexpr size_t hash_size = HASH_SIZE::value; ///< Number of bytes in a hash

    /// \brief Storage for a hash. A value-initialized hash (all zeros) is the empty hash.
    using hash_type = std::array<unsigned char, hash_size>;

    void begin() {
        return derived().do_begin();
    }

    void add_data(const unsigned char *data, size_t length) {
        return derived().do_add_data(data, length);
    }

    void end(hash_type &hash) {
        return derived().do_end(hash);
    }

    /// \brief Returns the canonical encoding of a hash
    /// \param hash Hash to encode
    /// \returns "0x" followed by lowercase hex
    static std::string encode(const hash_type &hash) {
        return encode_hash(hash.data(), hash.size());
    }

    /// \brief Parses the canonical encoding of a hash
    /// \param text Encoded hash
    /// \returns Decoded hash, or throws std::invalid_argument
    static hash_type decode(std::string_view text) {
        hash_type hash{};
        decode_hash(text, hash.data(), hash.size());
        return hash;
    }
};

// C++20 concept for classes implementing the i_hasher interface
template <typename H>
concept IHasher = requires(H &h, const unsigned char *data, size_t length, typename H::hash_type &hash) {
    { H::hash_size } -> std::convertible_to<size_t>;
    h.begin();
    h.add_data(data, length);
    h.end(hash);
    { H::encode(hash) } -> std::same_as<std::string>;
};

/// \brief Returns the empty hash for a hasher
template <IHasher H>
constexpr typename H::hash_type get_empty_hash() {
    return typename H::hash_type{};
}

/// \brief Checks if a hash is the empty (all-zero) hash
template <size_t N>
constexpr bool is_empty_hash(const std::array<unsigned char, N> &hash) {
    return hash == std::array<unsigned char, N>{};
}

/// \brief Computes the hash of data
/// \tparam H Hasher class
/// \param h Hasher object
/// \param data Pointer to data
/// \param length Number of bytes in data
/// \param result Receives the hash of data
template <IHasher H>
inline void get_hash(H &h, const unsigned char *data, size_t length, typename H::hash_type &result) {
    h.begin();
    h.add_data(data, length);
    h.end(result);
}

/// \brief Computes the hash of the bytes in a string
/// \tparam H Hasher class
/// \param h Hasher object
/// \param data Data to hash
/// \returns The hash of data
template <IHasher H>
inline typename H::hash_type get_hash(H &h, std::string_view data) {
    typename H::hash_type result{};
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    get_hash(h, reinterpret_cast<const unsigned char *>(data.data()), data.size(), result);
    return result;
}

/// \brief Computes the hash of concatenated hashes
/// \tparam H Hasher class
/// \param h Hasher object
/// \param left Left hash to concatenate
/// \param right Right hash to concatenate
/// \param result Receives the hash of the concatenation
/// \details What gets hashed is the concatenation of the canonical encodings
/// of left and right, not the raw hash bytes. result may alias left or right.
template <IHasher H>
inline void get_concat_hash(H &h, const typename H::hash_type &left, const typename H::hash_type &right,
    typename H::hash_type &result) {
    const auto encoded_left = H::encode(left);
    const auto encoded_right = H::encode(right);
    h.begin();
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    h.add_data(reinterpret_cast<const unsigned char *>(encoded_left.data()), encoded_left.size());
    h.add_data(reinterpret_cast<const unsigned char *>(encoded_right.data()), encoded_right.size());
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
    h.end(result);
}

/// \brief Computes the hash of concatenated hashes
/// \tparam H Hasher class
/// \param h Hasher object
/// \param left Left hash to concatenate
/// \param right Right hash to concatenate
/// \return The hash of the concatenation
template <IHasher H>
inline typename H::hash_type get_concat_hash(H &h, const typename H::hash_type &left,
    const typename H::hash_type &right) {
    typename H::hash_type result{};
    get_concat_hash(h, left, right, result);
    return result;
}

} // namespace merkle

#endif
