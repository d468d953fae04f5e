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

#ifndef LAPIS_RESOURCES_H_
#define LAPIS_RESOURCES_H_

#include <cstddef>
#include <vector>

#include "backend.h"

namespace lapis
{
    // what the machine offers, queried once per run or constructed by hand
    struct compute_resources
    {
        std::vector<backend::device_info> devices;
        std::size_t host_memory;
    };

    auto make_compute_resources() -> compute_resources;

    auto has_accelerator(const compute_resources& res) noexcept -> bool;

    // smallest memory amount reported by an accelerator, 0 without one
    auto accelerator_memory(const compute_resources& res) noexcept -> std::size_t;
}

#endif /* LAPIS_RESOURCES_H_ */
