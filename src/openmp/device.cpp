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

#include <vector>

#include "backend.h"

namespace lapis
{
    namespace openmp
    {
        auto set_device(const device_handle&) noexcept -> void
        {}

        auto get_devices() -> std::vector<device_handle>
        {
            return std::vector<device_handle>{0};
        }

        auto get_device_info(const device_handle& device) -> device_info
        {
            return device_info{device, false, available_host_memory()};
        }
    }
}
