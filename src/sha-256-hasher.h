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

#ifndef SHA_256_HASHER_H
#define SHA_256_HASHER_H

#include <cstddef>
#include <type_traits>

#include <cryptopp/sha.h>

#include "i-hasher.h"

namespace merkle {

/// \brief SHA-256 hasher, backed by Crypto++
class sha_256_hasher final : public i_hasher<sha_256_hasher, std::integral_constant<size_t, 32>> {
    CryptoPP::SHA256 m_sha{};

    friend i_hasher<sha_256_hasher, std::integral_constant<size_t, 32>>;

    void do_begin() {
        m_sha.Restart();
    }

    void do_add_data(const unsigned char *data, size_t length) {
        m_sha.Update(data, length);
    }

    void do_end(hash_type &hash) {
        m_sha.Final(hash.data());
    }

public:
    static_assert(CryptoPP::SHA256::DIGESTSIZE == hash_size, "unexpected SHA-256 digest size");

    sha_256_hasher() = default;
};

} // namespace merkle

#endif
