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

#ifndef UNIQUE_C_PTR_H
#define UNIQUE_C_PTR_H

#include <cerrno>
#include <cstdio>
#include <memory>
#include <string>
#include <system_error>
#include <tuple>

namespace merkle {

namespace detail {

struct fclose_deleter {
    void operator()(FILE *p) const {
        // Standard streams are borrowed, not owned
        if (p != stdin && p != stdout && p != stderr) {
            std::ignore = std::fclose(p);
        }
    }
};

} // namespace detail

using unique_file_ptr = std::unique_ptr<FILE, detail::fclose_deleter>;

static inline auto make_unique_fopen(const char *pathname, const char *mode) {
    FILE *fp = fopen(pathname, mode);
    if (fp == nullptr) {
        throw std::system_error(errno, std::generic_category(),
            "unable to open '" + std::string{pathname} + "' in mode '" + std::string{mode} + "'");
    }
    return unique_file_ptr{fp};
}

} // namespace merkle

#endif
