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

#ifndef LAPIS_FILTER_H_
#define LAPIS_FILTER_H_

#include <complex>
#include <cstdint>
#include <string>
#include <vector>

#include "array.h"

namespace lapis
{
    enum class filter_type
    {
        ram_lak,
        shepp_logan,
        cosine,
        hamming,
        hann,
        parzen,
        none
    };

    using filter_buffer_type = std::vector<std::complex<float>>;
    using filter_matrix_type = array3d<std::complex<float>>;

    auto to_filter_type(const std::string& name) -> filter_type;
    auto to_string(filter_type type) -> std::string;

    // padded projection width: max(64, next power of two of 2 * width)
    auto filter_size(std::uint32_t width) noexcept -> std::uint32_t;

    /*
     * Frequency response of the reconstruction filter for projections of the given width.
     * filter_value is the fraction of the frequencies below Nyquist which are passed and
     * controls the width of the apodization windows. In derivative mode the response is the
     * Hilbert-like kernel used for phase derivative data: constant magnitude, odd and purely imaginary.
     */
    auto make_filter(filter_type type, std::uint32_t width, float filter_value, bool derivative)
        -> filter_buffer_type;

    // outer product kernel x weights -> (filter size, 1, number of projections)
    auto make_filter_matrix(const filter_buffer_type& kernel, const std::vector<float>& weights)
        -> filter_matrix_type;
}

#endif /* LAPIS_FILTER_H_ */
