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

#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <limits>

#include <fftw3.h>

#include "../array.h"
#include "backend.h"

namespace lapis
{
    namespace openmp
    {
        auto phase_gradient(const array3d<std::complex<float>>& in, float step, array3d<float>& out) -> void
        {
            const auto width = in.dim_x;
            const auto rows = static_cast<std::size_t>(in.dim_y) * in.dim_z;
            if(rows > static_cast<std::size_t>(std::numeric_limits<int>::max()))
                throw fft::invalid_argument{"phase_gradient(): too many projection rows for a single transform"};

            const auto n = static_cast<int>(width);
            const auto batch = static_cast<int>(rows);

            auto spectrum = fft::make_ptr<fft::complex_type>(rows * width);
            auto shifted = fft::make_ptr<fft::complex_type>(rows * width);

            auto forward = fft::plan{n, batch, spectrum.get(), FFTW_FORWARD};
            auto inverse_spectrum = fft::plan{n, batch, spectrum.get(), FFTW_BACKWARD};
            auto inverse_shifted = fft::plan{n, batch, shifted.get(), FFTW_BACKWARD};

            // unit modulus field, the amplitude does not carry phase information
            #pragma omp parallel for
            for(auto i = std::size_t{0}; i < rows * width; ++i)
            {
                const auto z = in.buf[i];
                const auto a = std::abs(z);
                const auto u = a > 0.f ? z / a : std::complex<float>{0.f, 0.f};
                spectrum[i][0] = u.real();
                spectrum[i][1] = u.imag();
            }

            forward.execute();

            // spectrum -> u(x + step), shifted -> u(x - step)
            #pragma omp parallel for
            for(auto r = std::size_t{0}; r < rows; ++r)
            {
                for(auto k = 0u; k < width; ++k)
                {
                    const auto idx = r * width + k;
                    const auto nu = (k < width / 2) ? static_cast<double>(k) / width
                                                    : static_cast<double>(k) / width - 1.;
                    const auto ramp = std::polar(1., 2. * M_PI * nu * static_cast<double>(step));
                    const auto s = std::complex<double>{spectrum[idx][0], spectrum[idx][1]};

                    const auto plus = s * ramp;
                    const auto minus = s * std::conj(ramp);

                    spectrum[idx][0] = static_cast<float>(plus.real());
                    spectrum[idx][1] = static_cast<float>(plus.imag());
                    shifted[idx][0] = static_cast<float>(minus.real());
                    shifted[idx][1] = static_cast<float>(minus.imag());
                }
            }

            inverse_spectrum.execute();
            inverse_shifted.execute();

            // the FFT normalization is a positive real factor and does not change the angle
            #pragma omp parallel for
            for(auto i = std::size_t{0}; i < rows * width; ++i)
            {
                const auto plus = std::complex<float>{spectrum[i][0], spectrum[i][1]};
                const auto minus = std::complex<float>{shifted[i][0], shifted[i][1]};
                out.buf[i] = std::arg(plus * std::conj(minus)) / (2.f * step);
            }
        }
    }
}
