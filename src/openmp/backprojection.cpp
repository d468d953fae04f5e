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
#include <cstddef>
#include <cstdint>
#include <vector>

#include "../array.h"
#include "backend.h"

namespace lapis
{
    namespace openmp
    {
        namespace
        {
            inline auto vol_centered_coordinate(std::uint32_t coord, std::uint32_t dim, float size) noexcept -> float
            {
                auto size2 = size / 2.f;
                return -(static_cast<float>(dim) * size2) + size2 + static_cast<float>(coord) * size;
            }

            inline auto proj_real_coordinate(float coord, std::uint32_t dim, float size, float offset) noexcept -> float
            {
                auto size2 = size / 2.f;
                auto min = -(static_cast<float>(dim) * size2) - offset;
                return (coord - min) / size - (1.f / 2.f);
            }

            // samples outside of the detector are zero
            inline auto fetch(const float* p, std::int64_t x, std::int64_t y, std::uint32_t dim_x, std::uint32_t dim_y) noexcept
                -> float
            {
                if(x < 0 || y < 0 || x >= static_cast<std::int64_t>(dim_x) || y >= static_cast<std::int64_t>(dim_y))
                    return 0.f;
                return p[x + y * static_cast<std::int64_t>(dim_x)];
            }

            auto interpolate(const float* p, float x, float y, std::uint32_t dim_x, std::uint32_t dim_y) noexcept
                -> float
            {
                auto x1 = std::floor(x);
                auto y1 = std::floor(y);

                if(x1 < -1.f || y1 < -1.f || x1 >= static_cast<float>(dim_x) || y1 >= static_cast<float>(dim_y))
                    return 0.f;

                auto x1i = static_cast<std::int64_t>(x1);
                auto y1i = static_cast<std::int64_t>(y1);

                auto q11 = fetch(p, x1i, y1i, dim_x, dim_y);
                auto q12 = fetch(p, x1i, y1i + 1, dim_x, dim_y);
                auto q21 = fetch(p, x1i + 1, y1i, dim_x, dim_y);
                auto q22 = fetch(p, x1i + 1, y1i + 1, dim_x, dim_y);

                auto fx = x - x1;
                auto fy = y - y1;
                auto interp_y1 = (1.f - fx) * q11 + fx * q21;
                auto interp_y2 = (1.f - fx) * q12 + fx * q22;

                return (1.f - fy) * interp_y1 + fy * interp_y2;
            }
        }

        auto backproject(const array3d<float>& p, const std::vector<detector_basis>& bases,
                         array3d<float>& v, std::uint32_t offset, const volume_region& roi,
                         const float* dx, const float* dy, const float* dz) noexcept -> void
        {
            const auto num = p.dim_z;
            const auto p_size = p.slice_size();
            const auto p_ptr = p.buf.get();
            const auto deform = (dx != nullptr) && (dy != nullptr) && (dz != nullptr);

            #pragma omp parallel for collapse(2) schedule(dynamic)
            for(auto m = roi.z1; m < roi.z2; ++m)
            {
                for(auto l = roi.y1; l < roi.y2; ++l)
                {
                    for(auto k = roi.x1; k < roi.x2; ++k)
                    {
                        // get centered coordinates -- volume center is at (0, 0, 0)
                        auto x_k = vol_centered_coordinate(k, roi.dim_x, 1.f);
                        auto y_l = vol_centered_coordinate(l, roi.dim_y, 1.f);
                        auto z_m = vol_centered_coordinate(m, roi.dim_z, 1.f);

                        if(deform)
                        {
                            const auto coord = k + l * static_cast<std::size_t>(roi.dim_x)
                                                 + m * static_cast<std::size_t>(roi.dim_x) * roi.dim_y;
                            x_k += dx[coord];
                            y_l += dy[coord];
                            z_m += dz[coord];
                        }

                        auto sum = 0.f;
                        for(auto i = 0u; i < num; ++i)
                        {
                            const auto& b = bases[i];

                            // project onto the detector axes
                            const auto s = x_k * b.u_x + y_l * b.u_y + z_m * b.u_z;
                            const auto t = x_k * b.v_x + y_l * b.v_y + z_m * b.v_z;

                            const auto h = proj_real_coordinate(s, p.dim_x, 1.f, b.delta_s);
                            const auto w = proj_real_coordinate(t, p.dim_y, 1.f, b.delta_t);

                            sum += interpolate(p_ptr + i * p_size, h, w, p.dim_x, p.dim_y);
                        }

                        v(k, l, m - offset) += sum;
                    }
                }
            }
        }
    }
}
