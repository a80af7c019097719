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

#ifndef SHA3_256_HASHER_H
#define SHA3_256_HASHER_H

#include <cstddef>
#include <type_traits>

#include <cryptopp/sha3.h>

#include "i-hasher.h"

namespace merkle {

/// \brief FIPS 202 SHA3-256 hasher, backed by Crypto++
/// \details Differs from keccak_256_hasher only in the padding delimiter.
class sha3_256_hasher final : public i_hasher<sha3_256_hasher, std::integral_constant<size_t, 32>> {
    CryptoPP::SHA3_256 m_sha3{};

    friend i_hasher<sha3_256_hasher, std::integral_constant<size_t, 32>>;

    void do_begin() {
        m_sha3.Restart();
    }

    void do_add_data(const unsigned char *data, size_t length) {
        m_sha3.Update(data, length);
    }

    void do_end(hash_type &hash) {
        m_sha3.Final(hash.data());
    }

public:
    static_assert(CryptoPP::SHA3_256::DIGESTSIZE == hash_size, "unexpected SHA3-256 digest size");

    sha3_256_hasher() = default;
};

} // namespace merkle

#endif
