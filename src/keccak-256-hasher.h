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

#ifndef KECCAK_256_HASHER_H
#define KECCAK_256_HASHER_H

#include <cstddef>
#include <type_traits>

#include <cryptopp/keccak.h>

#include "i-hasher.h"

namespace merkle {

/// \brief Keccak-256 hasher, backed by Crypto++
/// \details This is the Keccak-256 used by Ethereum, that is, it does not
/// follow the FIPS 202 standard and uses delimited suffix 0x01.
class keccak_256_hasher final : public i_hasher<keccak_256_hasher, std::integral_constant<size_t, 32>> {
    CryptoPP::Keccak_256 m_kc{};

    friend i_hasher<keccak_256_hasher, std::integral_constant<size_t, 32>>;

    void do_begin() {
        m_kc.Restart();
    }

    void do_add_data(const unsigned char *data, size_t length) {
        m_kc.Update(data, length);
    }

    void do_end(hash_type &hash) {
        m_kc.Final(hash.data());
    }

public:
    static_assert(CryptoPP::Keccak_256::DIGESTSIZE == hash_size, "unexpected Keccak-256 digest size");

    keccak_256_hasher() = default;
};

} // namespace merkle

#endif
