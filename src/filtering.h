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

#ifndef LAPIS_FILTERING_H_
#define LAPIS_FILTERING_H_

#include <complex>
#include <cstdint>
#include <string>

#include "array.h"

namespace lapis
{
    // how the detector axis is extended to the filter size
    enum class padding_mode
    {
        zero,
        replicate,  // edge replication, recommended for laminography and local tomography
        symmetric   // mirrored at the detector border
    };

    auto to_padding_mode(const std::string& name) -> padding_mode;
    auto to_string(padding_mode padding) -> std::string;

    /*
     * Filters every detector row of every projection in the frequency domain. h holds one filter column
     * per projection of the sinogram (see make_filter_matrix()). The result has the shape and the memory
     * location of the input.
     */
    auto filter_projections(const array3d<float>& sinogram, const array3d<std::complex<float>>& h,
                            std::uint32_t width, padding_mode padding) -> array3d<float>;
}

#endif /* LAPIS_FILTERING_H_ */
