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

#ifndef LAPIS_SUBVOLUME_INFORMATION_H_
#define LAPIS_SUBVOLUME_INFORMATION_H_

#include <cstddef>
#include <cstdint>

#include "geometry.h"

namespace lapis
{
    struct subvolume_geometry
    {
        std::uint32_t dim_x;
        std::uint32_t dim_y;
        std::uint32_t dim_z;

        /* Not all volumes are evenly distributable. The last subvolume therefore contains the remaining
         * slices.
         */
        std::uint32_t remainder;
    };

    struct subvolume_info
    {
        subvolume_geometry geo;
        std::uint32_t num;
    };

    /*
     * Splits the volume along z into max(split_z, device_count, voxels / INT32_MAX) subvolumes so that
     * every device receives work and no subvolume exceeds 32 bit indexing. There are never more
     * subvolumes than slices.
     */
    auto make_subvolume_information(const reconstruction_config& cfg, std::uint32_t split_z, std::size_t device_count)
        -> subvolume_info;
}

#endif /* LAPIS_SUBVOLUME_INFORMATION_H_ */
