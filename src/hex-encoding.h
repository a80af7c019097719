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

#ifndef HEX_ENCODING_H
#define HEX_ENCODING_H

/// \file
/// \brief Canonical hash encoding

#include <cstddef>
#include <string>
#include <string_view>

namespace merkle {

/// \brief Prefix of every encoded hash
constexpr std::string_view HASH_ENCODING_PREFIX = "0x";

/// \brief Encodes a hash as prefixed lowercase hex
/// \param data Pointer to hash bytes
/// \param length Number of bytes
/// \returns "0x" followed by two lowercase hex characters per byte
/// \details This is both the display form of a hash and the byte sequence
/// fed to the hash function when two nodes are combined.
std::string encode_hash(const unsigned char *data, size_t length);

/// \brief Decodes a prefixed hex string into a hash
/// \param text Encoded hash, with "0x" prefix. Hex digits may be in either case.
/// \param data Receives the decoded bytes
/// \param length Number of bytes expected in the hash
/// \details Throws std::invalid_argument if the prefix is missing, if the number of
/// hex digits does not match length, or if a non-hex character is found.
void decode_hash(std::string_view text, unsigned char *data, size_t length);

} // namespace merkle

#endif
