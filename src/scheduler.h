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

#ifndef LAPIS_SCHEDULER_H_
#define LAPIS_SCHEDULER_H_

#include <cstddef>
#include <cstdint>
#include <limits>

namespace lapis
{
    struct memory_budget
    {
        bool accelerator;
        std::size_t available_bytes;
    };

    // complex single precision working buffers on the accelerator
    constexpr auto accelerator_bytes_per_element = std::size_t{8 * 4};

    // host processing shares the process memory, budget more conservatively
    constexpr auto host_bytes_per_element = std::size_t{6 * 8};

    // never plan with more host memory than this, leaves headroom for the runtime
    constexpr auto host_memory_cap = std::size_t{20000000000};

    constexpr auto max_elements_per_block = static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());

    /*
     * Number of blocks the work has to be split into so that
     *
     * 1) bytes_per_element * element_count / blocks fits into available_bytes,
     * 2) no block addresses more elements than a 32 bit index can express,
     * 3) every requested device receives at least one block.
     */
    auto plan_blocks(std::uint64_t element_count, std::size_t available_bytes, std::size_t bytes_per_element,
                     std::size_t device_count) -> std::uint32_t;

    auto plan_filter_blocks(std::uint64_t element_count, const memory_budget& budget, std::size_t device_count)
        -> std::uint32_t;
}

#endif /* LAPIS_SCHEDULER_H_ */
