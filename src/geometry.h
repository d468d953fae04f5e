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

#ifndef LAPIS_GEOMETRY_H_
#define LAPIS_GEOMETRY_H_

#include <cstdint>
#include <vector>

namespace lapis
{
    struct reconstruction_config
    {
        // Detector
        std::uint32_t proj_width;   // detector columns (= sinogram width)
        std::uint32_t proj_height;  // detector rows (= sinogram layers)
        std::uint32_t proj_count;   // number of projections

        // Volume
        std::uint32_t vol_x;        // voxels in x direction
        std::uint32_t vol_y;        // voxels in y direction
        std::uint32_t vol_z;        // voxels in z direction
    };

    struct projection_vector
    {
        // parallel beam direction
        double ray_x;
        double ray_y;
        double ray_z;

        float delta_s;  // horizontal detector offset [px]
        float delta_t;  // vertical detector offset [px]
    };

    struct projection_angles
    {
        double theta;   // rotation angle [rad]
        double lamino;  // tilt between rotation axis and beam [rad], pi/2 for standard tomography
    };

    auto calculate_angles(const projection_vector& v) noexcept -> projection_angles;
    auto calculate_angles(const std::vector<projection_vector>& vectors) -> std::vector<projection_angles>;

    auto make_projection_vector(double theta, double lamino, float delta_s = 0.f, float delta_t = 0.f) noexcept
        -> projection_vector;

    auto volume_voxels(const reconstruction_config& cfg) noexcept -> std::uint64_t;
}

#endif /* LAPIS_GEOMETRY_H_ */
