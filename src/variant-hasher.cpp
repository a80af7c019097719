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

#include "variant-hasher.h"

#include <cstring>
#include <stdexcept>
#include <string>

namespace merkle {

const char *to_string(hash_function_type hash_function) {
    switch (hash_function) {
        case hash_function_type::sha256:
            return "sha256";
        case hash_function_type::sha3_256:
            return "sha3-256";
        case hash_function_type::keccak256:
            return "keccak256";
        default:
            return "unknown";
    }
}

hash_function_type hash_function_type_from_string(const char *name) {
    if (strcmp(name, "sha256") == 0) {
        return hash_function_type::sha256;
    }
    if (strcmp(name, "sha3-256") == 0) {
        return hash_function_type::sha3_256;
    }
    if (strcmp(name, "keccak256") == 0) {
        return hash_function_type::keccak256;
    }
    throw std::invalid_argument{"unknown hash function '" + std::string{name} + "'"};
}

} // namespace merkle
