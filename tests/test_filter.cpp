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
#include <vector>

#include <catch2/catch.hpp>

#include "exception.h"
#include "filter.h"

using namespace lapis;

TEST_CASE( "Filter size is a power of two of at least twice the width", "[filter]" ) {
  REQUIRE(filter_size(10) == 64);
  REQUIRE(filter_size(32) == 64);
  REQUIRE(filter_size(33) == 128);
  REQUIRE(filter_size(100) == 256);
  REQUIRE(filter_size(2048) == 4096);
}

TEST_CASE( "Filter names", "[filter]" ) {
  REQUIRE(to_filter_type("ram-lak") == filter_type::ram_lak);
  REQUIRE(to_filter_type("shepp-logan") == filter_type::shepp_logan);
  REQUIRE(to_filter_type("parzen") == filter_type::parzen);
  REQUIRE(to_filter_type("none") == filter_type::none);
  REQUIRE(to_string(filter_type::hann) == "hann");

  REQUIRE_THROWS_AS(to_filter_type("butterworth"), invalid_filter_kind);
  REQUIRE_THROWS_AS(make_filter(filter_type::none, 64, 1.f, false), invalid_filter_kind);
}

TEST_CASE( "Kernels are conjugate symmetric", "[filter]" ) {
  const auto types = std::vector<filter_type>{filter_type::ram_lak, filter_type::shepp_logan, filter_type::cosine,
                                              filter_type::hamming, filter_type::hann, filter_type::parzen};
  const auto value = GENERATE(1.f, 0.7f, 0.5f);

  for(auto&& t : types)
  {
    const auto h = make_filter(t, 100, value, false);
    const auto order = h.size();
    REQUIRE(order == 256);

    for(auto k = 1u; k < order / 2; ++k)
    {
      REQUIRE(h[order - k].real() == Approx(std::conj(h[k]).real()).margin(1e-7));
      REQUIRE(h[order - k].imag() == Approx(std::conj(h[k]).imag()).margin(1e-7));
    }
  }
}

TEST_CASE( "Derivative kernels are odd and purely imaginary", "[filter]" ) {
  const auto h = make_filter(filter_type::ram_lak, 64, 1.f, true);
  const auto order = h.size();

  for(auto k = 0u; k < order; ++k)
    REQUIRE(h[k].real() == Approx(0.f).margin(1e-7));

  for(auto k = 1u; k < order / 2; ++k)
  {
    REQUIRE(h[k].imag() == Approx(-1. / M_PI).epsilon(1e-5));
    REQUIRE(h[order - k].imag() == Approx(-h[k].imag()).margin(1e-7));
  }
}

TEST_CASE( "Ram-Lak kernel is a monotonic ramp", "[filter]" ) {
  const auto h = make_filter(filter_type::ram_lak, 48, 1.f, false);
  const auto order = h.size();
  REQUIRE(order == 128);

  REQUIRE(h[0].real() == 0.f);
  for(auto k = 1u; k <= order / 2; ++k)
  {
    REQUIRE(h[k].real() >= h[k - 1].real());
    REQUIRE(h[k].real() == Approx(2. * k / order));
    REQUIRE(h[k].imag() == 0.f);
  }
}

TEST_CASE( "Frequencies above the cutoff are removed", "[filter]" ) {
  const auto h = make_filter(filter_type::hamming, 32, 0.5f, false);
  const auto order = h.size();

  for(auto k = 0u; k <= order / 2; ++k)
  {
    if(k > order / 4)
      REQUIRE(h[k].real() == 0.f);
    else if(k > 0)
      REQUIRE(h[k].real() > 0.f);
  }
}

TEST_CASE( "Shaped kernels stay below the ramp", "[filter]" ) {
  const auto ramp = make_filter(filter_type::ram_lak, 64, 1.f, false);
  const auto types = std::vector<filter_type>{filter_type::shepp_logan, filter_type::cosine,
                                              filter_type::hamming, filter_type::hann, filter_type::parzen};

  for(auto&& t : types)
  {
    const auto h = make_filter(t, 64, 1.f, false);
    for(auto k = 0u; k < h.size(); ++k)
      REQUIRE(std::abs(h[k]) <= std::abs(ramp[k]) + 1e-6f);

    // the low frequencies are passed
    REQUIRE(h[2].real() == Approx(ramp[2].real()).epsilon(0.05));
  }
}

TEST_CASE( "Parzen kernel tapers to zero at Nyquist", "[filter]" ) {
  const auto h = make_filter(filter_type::parzen, 32, 1.f, false);
  const auto order = h.size();

  REQUIRE(h[order / 4].real() > 0.f);
  REQUIRE(h[order / 2].real() < 0.01f);

  // a tiny window removes everything
  const auto empty = make_filter(filter_type::parzen, 32, 0.001f, false);
  for(auto&& v : empty)
    REQUIRE(std::abs(v) == 0.f);
}

TEST_CASE( "Filter matrix is the outer product of kernel and weights", "[filter]" ) {
  const auto kernel = make_filter(filter_type::shepp_logan, 16, 1.f, false);
  const auto weights = std::vector<float>{0.5f, 1.f, 2.f};

  const auto h = make_filter_matrix(kernel, weights);
  REQUIRE(h.dim_x == kernel.size());
  REQUIRE(h.dim_y == 1);
  REQUIRE(h.dim_z == 3);

  for(auto p = 0u; p < 3; ++p)
  {
    for(auto k = 0u; k < h.dim_x; ++k)
      REQUIRE(h(k, 0, p).real() == Approx(kernel[k].real() * weights[p]));
  }
}
