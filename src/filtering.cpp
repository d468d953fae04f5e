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

#include <complex>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "array.h"
#include "backend.h"
#include "exception.h"
#include "filtering.h"

namespace lapis
{
    auto to_padding_mode(const std::string& name) -> padding_mode
    {
        if(name == "zero" || name == "0")
            return padding_mode::zero;
        else if(name == "replicate")
            return padding_mode::replicate;
        else if(name == "symmetric")
            return padding_mode::symmetric;

        throw std::invalid_argument{"Invalid padding selected: " + name};
    }

    auto to_string(padding_mode padding) -> std::string
    {
        switch(padding)
        {
            case padding_mode::zero: return "zero";
            case padding_mode::replicate: return "replicate";
            case padding_mode::symmetric: return "symmetric";
        }
        return "unknown";
    }

    auto filter_projections(const array3d<float>& sinogram, const array3d<std::complex<float>>& h,
                            std::uint32_t width, padding_mode padding) -> array3d<float>
    {
        if(sinogram.dim_x != width)
            throw shape_mismatch{"filter_projections(): sinogram width does not match the projection width"};

        if(width % 2 != 0)
            throw shape_mismatch{"filter_projections(): only even width of sinogram is supported"};

        if(h.dim_x < width || (h.dim_x - width) % 2 != 0 || h.dim_y != 1)
            throw shape_mismatch{"filter_projections(): filter size does not fit the projection width"};

        if(h.dim_z != sinogram.dim_z)
            throw shape_mismatch{"filter_projections(): filter and sinogram projection counts differ"};

        auto out = make_array<float>(sinogram.dim_x, sinogram.dim_y, sinogram.dim_z, sinogram.loc);
        if(sinogram.empty())
            return out;

        backend::apply_filter(sinogram, h, padding, out);
        return out;
    }
}
