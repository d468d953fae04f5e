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

#ifndef LAPIS_SOURCE_H_
#define LAPIS_SOURCE_H_

#include <complex>
#include <string>
#include <vector>

#include "array.h"
#include "geometry.h"

namespace lapis
{
    /*
     * Raw little endian float32 sinogram, projection after projection (proj_width x proj_height each).
     * Complex sinograms store interleaved real and imaginary parts.
     */
    auto load_sinogram(const std::string& path, const reconstruction_config& cfg) -> array3d<float>;
    auto load_complex_sinogram(const std::string& path, const reconstruction_config& cfg)
        -> array3d<std::complex<float>>;

    // one projection per line: ray_x ray_y ray_z [delta_s delta_t]
    auto load_vectors(const std::string& path) -> std::vector<projection_vector>;

    // one 0 or 1 per line
    auto load_valid_angles(const std::string& path) -> std::vector<bool>;

    // raw float32, either a single (vol_x, vol_y) slice or the whole volume
    auto load_mask(const std::string& path, const reconstruction_config& cfg) -> array3d<float>;
}

#endif /* LAPIS_SOURCE_H_ */
