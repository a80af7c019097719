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

#include "hex-encoding.h"

#include <cctype>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

#include <cryptopp/filters.h>
#include <cryptopp/hex.h>

namespace merkle {

std::string encode_hash(const unsigned char *data, size_t length) {
    std::string encoded{HASH_ENCODING_PREFIX};
    encoded.reserve(HASH_ENCODING_PREFIX.size() + (2 * length));
    // NOLINTNEXTLINE: suppress cryptopp warnings
    CryptoPP::StringSource ss(data, length, true, new CryptoPP::HexEncoder(new CryptoPP::StringSink(encoded), false));
    return encoded;
}

void decode_hash(std::string_view text, unsigned char *data, size_t length) {
    if (!text.starts_with(HASH_ENCODING_PREFIX)) {
        throw std::invalid_argument{"encoded hash is missing '0x' prefix"};
    }
    text.remove_prefix(HASH_ENCODING_PREFIX.size());
    if (text.size() != 2 * length) {
        throw std::invalid_argument{"encoded hash has " + std::to_string(text.size()) + " hex digits (expected " +
            std::to_string(2 * length) + ")"};
    }
    // HexDecoder silently skips invalid characters, so reject them up front
    for (const char c : text) {
        if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
            throw std::invalid_argument{"encoded hash contains invalid hex digit"};
        }
    }
    std::string decoded;
    // NOLINTNEXTLINE: suppress cryptopp warnings
    CryptoPP::StringSource ss(std::string{text}, true, new CryptoPP::HexDecoder(new CryptoPP::StringSink(decoded)));
    if (decoded.size() != length) {
        throw std::invalid_argument{"encoded hash has unexpected size"};
    }
    memcpy(data, decoded.data(), length);
}

} // namespace merkle
