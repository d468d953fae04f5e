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

#include <complex>
#include <stdexcept>

#include "array.h"
#include "backend.h"
#include "phase_gradient.h"

namespace lapis
{
    auto phase_gradient(const array3d<std::complex<float>>& sinogram, float step) -> array3d<float>
    {
        if(!(step > 0.f))
            throw std::invalid_argument{"phase_gradient(): step has to be positive"};

        auto out = make_array<float>(sinogram.dim_x, sinogram.dim_y, sinogram.dim_z, sinogram.loc);
        if(sinogram.empty())
            return out;

        backend::phase_gradient(sinogram, step, out);
        return out;
    }
}
