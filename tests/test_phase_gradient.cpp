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
#include <stdexcept>

#include <catch2/catch.hpp>

#include "array.h"
#include "phase_gradient.h"

using namespace lapis;

TEST_CASE( "Linear phase has a constant gradient", "[phase_gradient]" ) {
  const auto width = 64u;
  const auto cycles = GENERATE(1, 3, -5);

  auto sino = make_array<std::complex<float>>(width, 2, 3);
  for(auto z = 0u; z < 3; ++z)
  {
    for(auto y = 0u; y < 2; ++y)
    {
      for(auto x = 0u; x < width; ++x)
      {
        // the amplitude does not matter
        const auto amplitude = 1. + 0.5 * y + z;
        sino(x, y, z) = std::complex<float>(std::polar(amplitude, 2. * M_PI * cycles * x / width));
      }
    }
  }

  const auto grad = phase_gradient(sino);
  REQUIRE(grad.dim_x == width);
  REQUIRE(grad.dim_y == 2);
  REQUIRE(grad.dim_z == 3);

  const auto expected = 2. * M_PI * cycles / width;
  for(auto i = 0u; i < grad.size(); ++i)
    REQUIRE(grad.buf[i] == Approx(expected).margin(1e-3));
}

TEST_CASE( "Phase gradient needs a positive step", "[phase_gradient]" ) {
  const auto sino = make_array<std::complex<float>>(8, 1, 1);
  REQUIRE_THROWS_AS(phase_gradient(sino, 0.f), std::invalid_argument);
  REQUIRE_THROWS_AS(phase_gradient(sino, -0.1f), std::invalid_argument);
}
