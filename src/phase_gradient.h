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

#ifndef LAPIS_PHASE_GRADIENT_H_
#define LAPIS_PHASE_GRADIENT_H_

#include <complex>

#include "array.h"

namespace lapis
{
    constexpr auto default_phase_gradient_step = 0.01f;

    /*
     * Derivative of the phase of a complex sinogram along the detector columns [rad / px],
     * computed from sub-pixel Fourier shifts of the unit modulus field so that it is insensitive
     * to phase wrapping.
     */
    auto phase_gradient(const array3d<std::complex<float>>& sinogram, float step = default_phase_gradient_step)
        -> array3d<float>;
}

#endif /* LAPIS_PHASE_GRADIENT_H_ */
