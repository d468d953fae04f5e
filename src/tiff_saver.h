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

#ifndef LAPIS_TIFF_SAVER_H_
#define LAPIS_TIFF_SAVER_H_

#include <string>

#include "array.h"

namespace lapis
{
    class tiff_saver
    {
        public:
            tiff_saver() noexcept = default;

            // writes one page per z slice to path + ".tif", `a` has to reside on the host
            auto save(const array3d<float>& a, const std::string& path) const -> void;
    };
}

#endif /* LAPIS_TIFF_SAVER_H_ */
