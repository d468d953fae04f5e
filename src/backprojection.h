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

#ifndef LAPIS_BACKPROJECTION_H_
#define LAPIS_BACKPROJECTION_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "array.h"
#include "backend.h"
#include "geometry.h"

namespace lapis
{
    enum class backprojection_path
    {
        single_device,
        partitioned
    };

    struct split_factors
    {
        std::uint32_t x = 1;
        std::uint32_t y = 1;
        std::uint32_t z = 1;
    };

    // per-voxel displacements in voxels, all empty means no deformation
    struct deformation_fields
    {
        array3d<float> x;
        array3d<float> y;
        array3d<float> z;

        auto empty() const noexcept -> bool
        {
            return x.empty() && y.empty() && z.empty();
        }
    };

    struct backprojection_options
    {
        split_factors split;                                    // subvolumes (partitioned path)
        split_factors split_sub;                                // tiles per (sub)volume
        std::vector<backend::device_handle> devices;
        int verbose = 1;
        const deformation_fields* deformation = nullptr;
    };

    // largest detector extent the single device projector handles
    constexpr auto max_single_projection_extent = std::uint32_t{4096};

    auto select_backprojection_path(const array3d<float>& sinogram, const reconstruction_config& cfg,
                                    std::size_t device_count) noexcept -> backprojection_path;

    auto make_detector_bases(const std::vector<projection_vector>& vectors)
        -> std::vector<backend::detector_basis>;

    /*
     * Back-projects the filtered sinogram into a volume of cfg's extent on the first requested device.
     * The volume is processed in split_sub tiles and ends up in the sinogram's memory location.
     */
    auto backproject(const array3d<float>& sinogram, const reconstruction_config& cfg,
                     const std::vector<projection_vector>& vectors, const backprojection_options& opts)
        -> array3d<float>;

    /*
     * Splits the volume along z into subvolumes (see make_subvolume_information) and distributes them
     * over the requested devices. The sinogram has to reside on the host, so does the result.
     */
    auto backproject_partitioned(const array3d<float>& sinogram, const reconstruction_config& cfg,
                                 const std::vector<projection_vector>& vectors,
                                 const backprojection_options& opts) -> array3d<float>;
}

#endif /* LAPIS_BACKPROJECTION_H_ */
