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

#include <algorithm>
#include <cstddef>
#include <cstdint>

#include "geometry.h"
#include "scheduler.h"
#include "subvolume_information.h"

namespace lapis
{
    auto make_subvolume_information(const reconstruction_config& cfg, std::uint32_t split_z, std::size_t device_count)
        -> subvolume_info
    {
        const auto voxels = volume_voxels(cfg);

        auto num = std::max<std::uint64_t>(split_z, 1u);
        num = std::max<std::uint64_t>(num, device_count);
        num = std::max<std::uint64_t>(num, (voxels + max_elements_per_block - 1) / max_elements_per_block);
        num = std::min<std::uint64_t>(num, std::max(cfg.vol_z, 1u));

        const auto vols_needed = static_cast<std::uint32_t>(num);

        auto subvol_info = subvolume_info{};
        subvol_info.geo.dim_x = cfg.vol_x;
        subvol_info.geo.dim_y = cfg.vol_y;
        subvol_info.geo.dim_z = cfg.vol_z / vols_needed;
        subvol_info.geo.remainder = cfg.vol_z % vols_needed;
        subvol_info.num = vols_needed;

        return subvol_info;
    }
}
