/*
 * This file is part of the LAPIS reconstruction program.
 *
 * Copyright (C) 2026 Helmholtz-Zentrum Dresden-Rossendorf
 *
 * LAPIS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * LAPIS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with LAPIS. If not, see <http://www.gnu.org/licenses/>.
 *
 * Date: 17 October 2026
 */

#ifndef LAPIS_FILESYSTEM_H_
#define LAPIS_FILESYSTEM_H_

#include <string>

namespace lapis
{
    // creates path including its parents, true if the directory exists afterwards
    auto create_directory(const std::string& path) -> bool;

    auto join_path(const std::string& dir, const std::string& name) -> std::string;
}

#endif /* LAPIS_FILESYSTEM_H_ */
