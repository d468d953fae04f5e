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

#include <cmath>
#include <cstdint>
#include <vector>

#include "geometry.h"

namespace lapis
{
    auto calculate_angles(const projection_vector& v) noexcept -> projection_angles
    {
        auto a = projection_angles{};
        a.theta = M_PI - std::atan2(v.ray_y, -v.ray_x);

        // ray_x / cos(theta) and ray_y / sin(theta) are the same in-plane length, use the better conditioned one
        auto c = std::cos(a.theta);
        auto s = std::sin(a.theta);
        auto in_plane = std::abs(c) >= std::abs(s) ? v.ray_x / c : v.ray_y / s;

        a.lamino = M_PI / 2 - std::atan2(v.ray_z, in_plane);
        return a;
    }

    auto calculate_angles(const std::vector<projection_vector>& vectors) -> std::vector<projection_angles>
    {
        auto ret = std::vector<projection_angles>{};
        ret.reserve(vectors.size());
        for(auto&& v : vectors)
            ret.push_back(calculate_angles(v));
        return ret;
    }

    auto make_projection_vector(double theta, double lamino, float delta_s, float delta_t) noexcept
        -> projection_vector
    {
        return projection_vector{std::sin(lamino) * std::cos(theta),
                                 std::sin(lamino) * std::sin(theta),
                                 std::cos(lamino),
                                 delta_s, delta_t};
    }

    auto volume_voxels(const reconstruction_config& cfg) noexcept -> std::uint64_t
    {
        return static_cast<std::uint64_t>(cfg.vol_x) * cfg.vol_y * cfg.vol_z;
    }
}
