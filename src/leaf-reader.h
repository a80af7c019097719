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

#ifndef LEAF_READER_H
#define LEAF_READER_H

/// \file
/// \brief Line-oriented leaf input

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace merkle {

/// \brief Reads the next line from a file
/// \param f File to read from
/// \returns Line without its terminating "\n" or "\r\n", or nothing at end of file
/// \details Throws std::runtime_error on read errors. A last line with no
/// terminator is still returned.
std::optional<std::string> read_leaf(FILE *f);

/// \brief Reads all remaining lines from a file
/// \param f File to read from
/// \returns One entry per line, in order
std::vector<std::string> read_leaves(FILE *f);

} // namespace merkle

#endif
