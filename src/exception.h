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

#ifndef LAPIS_EXCEPTION_H_
#define LAPIS_EXCEPTION_H_

#include <exception>
#include <stdexcept>

namespace lapis
{
    // sinogram, mask or deformation extents do not match the reconstruction configuration
    class shape_mismatch : public std::invalid_argument
    {
        public:
            using std::invalid_argument::invalid_argument;
    };

    class invalid_filter_kind : public std::invalid_argument
    {
        public:
            using std::invalid_argument::invalid_argument;
    };

    class reconstruction_error : public std::runtime_error
    {
        public:
            using std::runtime_error::runtime_error;
    };
}

#endif /* LAPIS_EXCEPTION_H_ */
