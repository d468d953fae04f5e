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

#include <cstddef>

#include <unistd.h>

#include "backend.h"

namespace lapis
{
    namespace openmp
    {
        auto available_host_memory() noexcept -> std::size_t
        {
            const auto pages = sysconf(_SC_AVPHYS_PAGES);
            const auto page_size = sysconf(_SC_PAGESIZE);
            if(pages < 0 || page_size < 0)
                return 0;

            return static_cast<std::size_t>(pages) * static_cast<std::size_t>(page_size);
        }
    }
}
