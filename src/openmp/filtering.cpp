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
#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>

#include <fftw3.h>

#include "../array.h"
#include "../filtering.h"
#include "backend.h"

namespace lapis
{
    namespace openmp
    {
        namespace
        {
            auto planner_mutex() -> std::mutex&
            {
                static auto&& m = std::mutex{};
                return m;
            }

            inline auto padded_index(std::int64_t i, std::int64_t width, padding_mode padding) noexcept -> std::int64_t
            {
                if(i >= 0 && i < width)
                    return i;

                switch(padding)
                {
                    case padding_mode::replicate:
                        return i < 0 ? 0 : width - 1;

                    case padding_mode::symmetric:
                    {
                        // mirror including the border sample, periodic for pads larger than the width
                        const auto period = 2 * width;
                        auto m = ((i % period) + period) % period;
                        return m < width ? m : period - 1 - m;
                    }

                    default:
                        return -1;
                }
            }

            auto expand(const float* src, std::uint32_t width, std::size_t rows,
                        fft::complex_type* dst, std::uint32_t filter_size, padding_mode padding) noexcept -> void
            {
                const auto pad = static_cast<std::int64_t>((filter_size - width) / 2);
                const auto w = static_cast<std::int64_t>(width);

                #pragma omp parallel for
                for(auto r = std::size_t{0}; r < rows; ++r)
                {
                    const auto row_in = src + r * width;
                    auto row_out = dst + r * filter_size;
                    for(auto j = 0u; j < filter_size; ++j)
                    {
                        const auto i = padded_index(static_cast<std::int64_t>(j) - pad, w, padding);
                        row_out[j][0] = i < 0 ? 0.f : row_in[i];
                        row_out[j][1] = 0.f;
                    }
                }
            }

            auto do_filtering(fft::complex_type* data, const std::complex<float>* h,
                              std::uint32_t filter_size, std::uint32_t rows_per_proj, std::uint32_t num_proj) noexcept
                -> void
            {
                #pragma omp parallel for collapse(2)
                for(auto p = 0u; p < num_proj; ++p)
                {
                    for(auto y = 0u; y < rows_per_proj; ++y)
                    {
                        auto row = data + (static_cast<std::size_t>(p) * rows_per_proj + y) * filter_size;
                        const auto col = h + static_cast<std::size_t>(p) * filter_size;
                        for(auto k = 0u; k < filter_size; ++k)
                        {
                            const auto re = row[k][0];
                            const auto im = row[k][1];
                            row[k][0] = re * col[k].real() - im * col[k].imag();
                            row[k][1] = re * col[k].imag() + im * col[k].real();
                        }
                    }
                }
            }

            // take the centered part of the real component and normalize the inverse FFT
            auto shrink(const fft::complex_type* src, std::uint32_t filter_size, std::size_t rows,
                        float* dst, std::uint32_t width) noexcept -> void
            {
                const auto first = filter_size / 2 - width / 2;
                const auto norm = static_cast<float>(filter_size);

                #pragma omp parallel for
                for(auto r = std::size_t{0}; r < rows; ++r)
                {
                    const auto row_in = src + r * filter_size + first;
                    auto row_out = dst + r * width;
                    for(auto x = 0u; x < width; ++x)
                        row_out[x] = row_in[x][0] / norm;
                }
            }
        }

        namespace fft
        {
            plan::plan(int n, int batch, complex_type* data, int sign)
            {
                auto&& lock = std::lock_guard<std::mutex>{planner_mutex()};
                plan_ = fftwf_plan_many_dft(1, &n, batch,
                                            data, nullptr, 1, n,
                                            data, nullptr, 1, n,
                                            sign, FFTW_ESTIMATE);
                if(plan_ == nullptr)
                    throw runtime_error{"fftwf_plan_many_dft() failed"};
            }

            plan::~plan()
            {
                auto&& lock = std::lock_guard<std::mutex>{planner_mutex()};
                fftwf_destroy_plan(plan_);
            }

            auto plan::execute() noexcept -> void
            {
                fftwf_execute(plan_);
            }
        }

        auto apply_filter(const array3d<float>& in, const array3d<std::complex<float>>& h,
                          padding_mode padding, array3d<float>& out) -> void
        {
            const auto filter_size = h.dim_x;
            const auto rows = static_cast<std::size_t>(in.dim_y) * in.dim_z;
            if(rows > static_cast<std::size_t>(std::numeric_limits<int>::max()))
                throw fft::invalid_argument{"apply_filter(): too many projection rows for a single transform"};

            const auto batch = static_cast<int>(rows);
            const auto n = static_cast<int>(filter_size);

            // allocate memory for the expanded projections (width -> filter_size)
            auto buf = fft::make_ptr<fft::complex_type>(rows * filter_size);

            // create plans for forward and inverse FFT
            auto forward = fft::plan{n, batch, buf.get(), FFTW_FORWARD};
            auto inverse = fft::plan{n, batch, buf.get(), FFTW_BACKWARD};

            // expand and transform the projections
            expand(in.buf.get(), in.dim_x, rows, buf.get(), filter_size, padding);
            forward.execute();

            // apply the filter to the transformed projections
            do_filtering(buf.get(), h.buf.get(), filter_size, in.dim_y, in.dim_z);

            // inverse transformation
            inverse.execute();

            // shrink to original size and normalize
            shrink(buf.get(), filter_size, rows, out.buf.get(), in.dim_x);
        }
    }
}
