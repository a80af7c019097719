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

#include "leaf-reader.h"

#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace merkle {

std::optional<std::string> read_leaf(FILE *f) {
    std::string line;
    int c = 0;
    while ((c = fgetc(f)) != EOF) {
        if (c == '\n') {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        line.push_back(static_cast<char>(c));
    }
    if (ferror(f) != 0) {
        throw std::runtime_error{"error reading input"};
    }
    if (line.empty()) {
        return {};
    }
    if (line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::vector<std::string> read_leaves(FILE *f) {
    std::vector<std::string> leaves;
    while (auto leaf = read_leaf(f)) {
        leaves.push_back(std::move(*leaf));
    }
    return leaves;
}

} // namespace merkle
