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
#include <iterator>
#include <limits>
#include <vector>

#include <boost/log/trivial.hpp>

#include "backend.h"
#include "resources.h"

namespace lapis
{
    auto make_compute_resources() -> compute_resources
    {
        auto res = compute_resources{};
        for(auto&& d : backend::get_devices())
            res.devices.push_back(backend::get_device_info(d));
        res.host_memory = backend::available_host_memory();

        BOOST_LOG_TRIVIAL(debug) << backend::name << " backend: " << res.devices.size()
                                 << (res.devices.size() == 1 ? " device, " : " devices, ")
                                 << res.host_memory << " bytes of free host memory";
        return res;
    }

    auto has_accelerator(const compute_resources& res) noexcept -> bool
    {
        return std::any_of(std::begin(res.devices), std::end(res.devices),
                           [](const backend::device_info& d) { return d.accelerator; });
    }

    auto accelerator_memory(const compute_resources& res) noexcept -> std::size_t
    {
        auto mem = std::numeric_limits<std::size_t>::max();
        auto found = false;
        for(auto&& d : res.devices)
        {
            if(!d.accelerator)
                continue;
            mem = std::min(mem, d.available_memory);
            found = true;
        }
        return found ? mem : 0;
    }
}
