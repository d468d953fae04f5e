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
#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "array.h"
#include "exception.h"
#include "filter.h"

namespace lapis
{
    namespace
    {
        // MATLAB's parzenwin()
        auto parzen_window(std::int64_t n) -> std::vector<double>
        {
            auto w = std::vector<double>(static_cast<std::size_t>(n));
            const auto half = static_cast<double>(n) / 2.;
            const auto inner = static_cast<double>(n - 1) / 4.;

            for(auto i = 0; i < n; ++i)
            {
                const auto k = std::abs(static_cast<double>(i) - static_cast<double>(n - 1) / 2.);
                const auto r = k / half;
                if(k <= inner)
                    w[i] = 1. - 6. * r * r + 6. * r * r * r;
                else
                    w[i] = 2. * std::pow(1. - r, 3.);
            }

            return w;
        }

        auto apply_parzen(std::vector<double>& filt, double d) -> void
        {
            const auto n = static_cast<std::int64_t>(filt.size());
            const auto len = static_cast<std::int64_t>(std::round(2. * static_cast<double>(n) * d)) - 1;
            if(len < 1)
            {
                std::fill(std::begin(filt), std::end(filt), 0.);
                return;
            }

            auto win = parzen_window(len);

            // upper half of the window, 1-based indices round(len/2) .. len
            const auto first = static_cast<std::int64_t>(std::round(static_cast<double>(len) / 2.)) - 1;
            const auto count = std::min(len - first, n);

            for(auto i = 0; i < count; ++i)
                filt[i] *= win[first + i];

            std::fill(std::begin(filt) + count, std::end(filt), 0.);
        }
    }

    auto to_filter_type(const std::string& name) -> filter_type
    {
        if(name == "ram-lak")
            return filter_type::ram_lak;
        else if(name == "shepp-logan")
            return filter_type::shepp_logan;
        else if(name == "cosine")
            return filter_type::cosine;
        else if(name == "hamming")
            return filter_type::hamming;
        else if(name == "hann")
            return filter_type::hann;
        else if(name == "parzen")
            return filter_type::parzen;
        else if(name == "none")
            return filter_type::none;

        throw invalid_filter_kind{"Invalid filter selected: " + name};
    }

    auto to_string(filter_type type) -> std::string
    {
        switch(type)
        {
            case filter_type::ram_lak: return "ram-lak";
            case filter_type::shepp_logan: return "shepp-logan";
            case filter_type::cosine: return "cosine";
            case filter_type::hamming: return "hamming";
            case filter_type::hann: return "hann";
            case filter_type::parzen: return "parzen";
            case filter_type::none: return "none";
        }
        return "unknown";
    }

    auto filter_size(std::uint32_t width) noexcept -> std::uint32_t
    {
        auto order = std::uint32_t{64};
        while(order < 2u * width)
            order *= 2u;
        return order;
    }

    auto make_filter(filter_type type, std::uint32_t width, float filter_value, bool derivative)
        -> filter_buffer_type
    {
        const auto order = filter_size(width);
        const auto n = order / 2 + 1;
        const auto d = static_cast<double>(filter_value);

        // ramp up to Nyquist
        auto filt = std::vector<double>(n);
        auto w = std::vector<double>(n);
        for(auto k = 0u; k < n; ++k)
        {
            filt[k] = derivative ? 1. : 2. * static_cast<double>(k) / static_cast<double>(order);
            w[k] = 2. * M_PI * static_cast<double>(k) / static_cast<double>(order);
        }

        // index 0 is never shaped -> no 0/0 for shepp-logan
        switch(type)
        {
            case filter_type::ram_lak:
                break;

            case filter_type::shepp_logan:
                for(auto k = 1u; k < n; ++k)
                {
                    const auto x = w[k] / (2. * d);
                    filt[k] *= std::sin(x) / x;
                }
                break;

            case filter_type::cosine:
                for(auto k = 1u; k < n; ++k)
                    filt[k] *= std::cos(w[k] / (2. * d));
                break;

            case filter_type::hamming:
                for(auto k = 1u; k < n; ++k)
                    filt[k] *= .54 + .46 * std::cos(w[k] / d);
                break;

            case filter_type::hann:
                for(auto k = 1u; k < n; ++k)
                    filt[k] *= (1. + std::cos(w[k] / d)) / 2.;
                break;

            case filter_type::parzen:
                apply_parzen(filt, d);
                break;

            default:
                throw invalid_filter_kind{"Invalid filter selected: " + to_string(type)};
        }

        // crop the frequency response
        for(auto k = 0u; k < n; ++k)
        {
            if(w[k] > M_PI * d)
                filt[k] = 0.;
        }

        auto ret = filter_buffer_type(order);
        if(derivative)
        {
            // [filt, -filt(end-1:-1:2)] / (i * pi)
            const auto scale = std::complex<double>{0., M_PI};
            for(auto k = 0u; k < n; ++k)
                ret[k] = std::complex<float>(filt[k] / scale);
            for(auto k = n; k < order; ++k)
                ret[k] = std::complex<float>(-filt[order - k] / scale);
        }
        else
        {
            for(auto k = 0u; k < n; ++k)
                ret[k] = std::complex<float>(static_cast<float>(filt[k]), 0.f);
            for(auto k = n; k < order; ++k)
                ret[k] = std::complex<float>(static_cast<float>(filt[order - k]), 0.f);
        }

        return ret;
    }

    auto make_filter_matrix(const filter_buffer_type& kernel, const std::vector<float>& weights)
        -> filter_matrix_type
    {
        const auto size = static_cast<std::uint32_t>(kernel.size());
        const auto num = static_cast<std::uint32_t>(weights.size());

        auto h = make_array<std::complex<float>>(size, 1u, num);

        #pragma omp parallel for
        for(auto p = 0u; p < num; ++p)
        {
            for(auto k = 0u; k < size; ++k)
                h(k, 0u, p) = kernel[k] * weights[p];
        }

        return h;
    }
}
