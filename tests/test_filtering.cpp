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
#include <cstdint>
#include <random>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "array.h"
#include "exception.h"
#include "filter.h"
#include "filtering.h"

using namespace lapis;

namespace
{
  auto random_sinogram(std::uint32_t x, std::uint32_t y, std::uint32_t z) -> array3d<float>
  {
    auto gen = std::mt19937{42};
    auto dist = std::uniform_real_distribution<float>{-1.f, 1.f};

    auto s = make_array<float>(x, y, z);
    for(auto i = 0u; i < s.size(); ++i)
      s.buf[i] = dist(gen);
    return s;
  }

  // frequency response of a shift by `shift` samples to the right
  auto shift_kernel(std::uint32_t order, std::uint32_t num, int shift) -> array3d<std::complex<float>>
  {
    auto h = make_array<std::complex<float>>(order, 1, num);
    for(auto p = 0u; p < num; ++p)
    {
      for(auto k = 0u; k < order; ++k)
        h(k, 0, p) = std::complex<float>(std::polar(1., -2. * M_PI * k * shift / order));
    }
    return h;
  }
}

TEST_CASE( "Padding names", "[filtering]" ) {
  REQUIRE(to_padding_mode("zero") == padding_mode::zero);
  REQUIRE(to_padding_mode("0") == padding_mode::zero);
  REQUIRE(to_padding_mode("replicate") == padding_mode::replicate);
  REQUIRE(to_padding_mode("symmetric") == padding_mode::symmetric);
  REQUIRE(to_string(padding_mode::replicate) == "replicate");
  REQUIRE_THROWS_AS(to_padding_mode("circular"), std::invalid_argument);
}

TEST_CASE( "Filtering with an all-ones kernel is the identity", "[filtering]" ) {
  const auto padding = GENERATE(padding_mode::zero, padding_mode::replicate, padding_mode::symmetric);

  const auto s = random_sinogram(40, 3, 5);
  const auto order = filter_size(40);

  auto h = make_array<std::complex<float>>(order, 1, 5);
  for(auto i = 0u; i < h.size(); ++i)
    h.buf[i] = std::complex<float>{1.f, 0.f};

  const auto out = filter_projections(s, h, 40, padding);
  REQUIRE(out.dim_x == s.dim_x);
  REQUIRE(out.dim_y == s.dim_y);
  REQUIRE(out.dim_z == s.dim_z);

  for(auto i = 0u; i < s.size(); ++i)
    REQUIRE(out.buf[i] == Approx(s.buf[i]).margin(1e-5));
}

TEST_CASE( "Projections are filtered with their own kernel column", "[filtering]" ) {
  const auto s = random_sinogram(16, 2, 3);
  const auto order = filter_size(16);

  auto h = make_array<std::complex<float>>(order, 1, 3);
  for(auto p = 0u; p < 3; ++p)
  {
    for(auto k = 0u; k < order; ++k)
      h(k, 0, p) = std::complex<float>{static_cast<float>(p + 1), 0.f};
  }

  const auto out = filter_projections(s, h, 16, padding_mode::zero);
  for(auto p = 0u; p < 3; ++p)
  {
    for(auto y = 0u; y < 2; ++y)
    {
      for(auto x = 0u; x < 16; ++x)
        REQUIRE(out(x, y, p) == Approx((p + 1) * s(x, y, p)).margin(1e-5));
    }
  }
}

TEST_CASE( "Padding modes extend the detector rows", "[filtering]" ) {
  const auto width = 8u;
  auto s = make_array<float>(width, 1, 1);
  for(auto x = 0u; x < width; ++x)
    s(x, 0, 0) = static_cast<float>(x + 1);

  // shift by two samples, the first two outputs show the padding
  const auto h = shift_kernel(filter_size(width), 1, 2);

  SECTION( "zero" ) {
    const auto out = filter_projections(s, h, width, padding_mode::zero);
    REQUIRE(out(0, 0, 0) == Approx(0.f).margin(1e-5));
    REQUIRE(out(1, 0, 0) == Approx(0.f).margin(1e-5));
    REQUIRE(out(2, 0, 0) == Approx(1.f).margin(1e-5));
    REQUIRE(out(7, 0, 0) == Approx(6.f).margin(1e-5));
  }

  SECTION( "replicate" ) {
    const auto out = filter_projections(s, h, width, padding_mode::replicate);
    REQUIRE(out(0, 0, 0) == Approx(1.f).margin(1e-5));
    REQUIRE(out(1, 0, 0) == Approx(1.f).margin(1e-5));
    REQUIRE(out(2, 0, 0) == Approx(1.f).margin(1e-5));
  }

  SECTION( "symmetric" ) {
    const auto out = filter_projections(s, h, width, padding_mode::symmetric);
    REQUIRE(out(0, 0, 0) == Approx(2.f).margin(1e-5));
    REQUIRE(out(1, 0, 0) == Approx(1.f).margin(1e-5));
    REQUIRE(out(2, 0, 0) == Approx(1.f).margin(1e-5));
  }
}

TEST_CASE( "Ramp filtering removes constant offsets only with edge padding", "[filtering]" ) {
  const auto width = 32u;
  const auto num = 2u;
  auto s = make_array<float>(width, 4, num);
  for(auto i = 0u; i < s.size(); ++i)
    s.buf[i] = 1.f;

  const auto kernel = make_filter(filter_type::ram_lak, width, 1.f, false);
  const auto h = make_filter_matrix(kernel, std::vector<float>(num, 1.f));

  const auto replicated = filter_projections(s, h, width, padding_mode::replicate);
  for(auto i = 0u; i < replicated.size(); ++i)
    REQUIRE(replicated.buf[i] == Approx(0.f).margin(1e-5));

  const auto zero_padded = filter_projections(s, h, width, padding_mode::zero);
  REQUIRE(std::abs(zero_padded(0, 0, 0)) > 1e-3f);
}

TEST_CASE( "Filter stage validates shapes", "[filtering]" ) {
  const auto s = random_sinogram(16, 2, 3);
  const auto order = filter_size(16);

  SECTION( "projection count" ) {
    const auto h = make_array<std::complex<float>>(order, 1, 4);
    REQUIRE_THROWS_AS(filter_projections(s, h, 16, padding_mode::zero), shape_mismatch);
  }

  SECTION( "filter too short" ) {
    const auto h = make_array<std::complex<float>>(8, 1, 3);
    REQUIRE_THROWS_AS(filter_projections(s, h, 16, padding_mode::zero), shape_mismatch);
  }

  SECTION( "width" ) {
    const auto h = make_array<std::complex<float>>(order, 1, 3);
    REQUIRE_THROWS_AS(filter_projections(s, h, 18, padding_mode::zero), shape_mismatch);

    const auto odd = random_sinogram(15, 2, 3);
    REQUIRE_THROWS_AS(filter_projections(odd, h, 15, padding_mode::zero), shape_mismatch);
  }
}

TEST_CASE( "Filtering keeps the memory location", "[filtering]" ) {
  auto s = random_sinogram(16, 1, 2);
  s.loc = memory_location::device;
  const auto h = make_filter_matrix(make_filter(filter_type::hann, 16, 1.f, false), {1.f, 1.f});

  const auto out = filter_projections(s, h, 16, padding_mode::zero);
  REQUIRE(out.loc == memory_location::device);
}
