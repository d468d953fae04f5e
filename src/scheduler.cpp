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
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include "scheduler.h"

namespace lapis
{
    namespace
    {
        inline auto ceil_div(long double num, long double den) noexcept -> long double
        {
            return std::ceil(num / den);
        }
    }

    auto plan_blocks(std::uint64_t element_count, std::size_t available_bytes, std::size_t bytes_per_element,
                     std::size_t device_count) -> std::uint32_t
    {
        if(available_bytes == 0)
            throw std::invalid_argument{"plan_blocks(): no memory available"};

        const auto elements = static_cast<long double>(element_count);

        auto blocks = ceil_div(static_cast<long double>(bytes_per_element) * elements,
                               static_cast<long double>(available_bytes));
        blocks = std::max(blocks, ceil_div(elements, static_cast<long double>(max_elements_per_block)));
        blocks = std::max(blocks, static_cast<long double>(device_count));
        blocks = std::max(blocks, 1.0L);

        if(blocks > static_cast<long double>(std::numeric_limits<std::uint32_t>::max()))
            throw std::invalid_argument{"plan_blocks(): workload cannot be partitioned into the available memory"};

        return static_cast<std::uint32_t>(blocks);
    }

    auto plan_filter_blocks(std::uint64_t element_count, const memory_budget& budget, std::size_t device_count)
        -> std::uint32_t
    {
        if(budget.accelerator)
            return plan_blocks(element_count, budget.available_bytes, accelerator_bytes_per_element, device_count);

        return plan_blocks(element_count, std::min(budget.available_bytes, host_memory_cap),
                           host_bytes_per_element, device_count);
    }
}
