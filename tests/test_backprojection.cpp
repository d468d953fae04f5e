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
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

#include <catch2/catch.hpp>

#include "array.h"
#include "backend.h"
#include "backprojection.h"
#include "exception.h"
#include "geometry.h"
#include "subvolume_information.h"

using namespace lapis;

namespace
{
  auto make_config(std::uint32_t w, std::uint32_t h, std::uint32_t n,
                   std::uint32_t x, std::uint32_t y, std::uint32_t z) -> reconstruction_config
  {
    return reconstruction_config{w, h, n, x, y, z};
  }

  auto random_sinogram(std::uint32_t x, std::uint32_t y, std::uint32_t z) -> array3d<float>
  {
    auto gen = std::mt19937{7};
    auto dist = std::uniform_real_distribution<float>{0.f, 1.f};

    auto s = make_array<float>(x, y, z);
    for(auto i = 0u; i < s.size(); ++i)
      s.buf[i] = dist(gen);
    return s;
  }

  auto random_vectors(std::uint32_t n, double lamino) -> std::vector<projection_vector>
  {
    auto gen = std::mt19937{11};
    auto dist = std::uniform_real_distribution<double>{0., M_PI};

    auto v = std::vector<projection_vector>{};
    for(auto i = 0u; i < n; ++i)
      v.push_back(make_projection_vector(dist(gen), lamino));
    return v;
  }
}

TEST_CASE( "Projector path selection", "[backprojection]" ) {
  const auto cfg = make_config(64, 8, 4, 32, 32, 32);
  auto sino = make_array<float>(64, 8, 4);

  REQUIRE(select_backprojection_path(sino, cfg, 0) == backprojection_path::single_device);
  REQUIRE(select_backprojection_path(sino, cfg, 1) == backprojection_path::single_device);
  REQUIRE(select_backprojection_path(sino, cfg, 2) == backprojection_path::partitioned);

  SECTION( "resident data stays on its device" ) {
    sino.loc = memory_location::device;
    REQUIRE(select_backprojection_path(sino, cfg, 2) == backprojection_path::single_device);
  }

  SECTION( "large detectors" ) {
    const auto wide = make_array<float>(max_single_projection_extent, 1, 1);
    const auto wide_cfg = make_config(max_single_projection_extent, 1, 1, 32, 32, 32);
    REQUIRE(select_backprojection_path(wide, wide_cfg, 1) == backprojection_path::partitioned);
  }

  SECTION( "large volumes" ) {
    const auto big = make_config(64, 8, 4, 2048, 2048, 1024);
    REQUIRE(select_backprojection_path(sino, big, 1) == backprojection_path::partitioned);
  }
}

TEST_CASE( "Subvolumes take the remainder in the last one", "[backprojection]" ) {
  const auto cfg = make_config(16, 16, 10, 16, 16, 10);

  auto info = make_subvolume_information(cfg, 3, 1);
  REQUIRE(info.num == 3);
  REQUIRE(info.geo.dim_z == 3);
  REQUIRE(info.geo.remainder == 1);

  info = make_subvolume_information(cfg, 1, 4);
  REQUIRE(info.num == 4);
  REQUIRE(info.geo.dim_z == 2);
  REQUIRE(info.geo.remainder == 2);

  info = make_subvolume_information(cfg, 50, 1);
  REQUIRE(info.num == 10);
  REQUIRE(info.geo.dim_z == 1);
  REQUIRE(info.geo.remainder == 0);
}

TEST_CASE( "Detector axes are perpendicular to the rays", "[backprojection]" ) {
  const auto vectors = random_vectors(20, M_PI / 3);
  const auto bases = make_detector_bases(vectors);
  REQUIRE(bases.size() == vectors.size());

  for(auto i = 0u; i < vectors.size(); ++i)
  {
    const auto& r = vectors[i];
    const auto& b = bases[i];
    REQUIRE(r.ray_x * b.u_x + r.ray_y * b.u_y + r.ray_z * b.u_z == Approx(0.).margin(1e-6));
    REQUIRE(r.ray_x * b.v_x + r.ray_y * b.v_y + r.ray_z * b.v_z == Approx(0.).margin(1e-6));
    REQUIRE(b.u_x * b.v_x + b.u_y * b.v_y + b.u_z * b.v_z == Approx(0.).margin(1e-6));
  }
}

TEST_CASE( "A detector column is smeared along the ray", "[backprojection]" ) {
  const auto cfg = make_config(8, 8, 1, 8, 8, 8);
  auto sino = make_array<float>(8, 8, 1);
  for(auto y = 0u; y < 8; ++y)
    sino(5, y, 0) = 1.f;

  const auto vectors = std::vector<projection_vector>{make_projection_vector(0., M_PI / 2)};

  SECTION( "plain" ) {
    const auto v = backproject(sino, cfg, vectors, backprojection_options{});
    for(auto z = 0u; z < 8; ++z)
    {
      for(auto x = 0u; x < 8; ++x)
      {
        REQUIRE(v(x, 5, z) == Approx(1.f));
        REQUIRE(v(x, 4, z) == Approx(0.f).margin(1e-6));
        REQUIRE(v(x, 6, z) == Approx(0.f).margin(1e-6));
      }
    }
  }

  SECTION( "deformed" ) {
    auto fields = deformation_fields{make_array<float>(8, 8, 8), make_array<float>(8, 8, 8), make_array<float>(8, 8, 8)};
    for(auto i = 0u; i < fields.y.size(); ++i)
      fields.y.buf[i] = 1.f;

    auto opts = backprojection_options{};
    opts.deformation = &fields;

    const auto v = backproject(sino, cfg, vectors, opts);
    REQUIRE(v(3, 4, 3) == Approx(1.f));
    REQUIRE(v(3, 5, 3) == Approx(0.f).margin(1e-6));
  }
}

TEST_CASE( "Partitioned and single device projectors agree", "[backprojection]" ) {
  const auto cfg = make_config(16, 8, 10, 12, 10, 9);
  const auto sino = random_sinogram(16, 8, 10);
  const auto vectors = random_vectors(10, 1.2);

  const auto reference = backproject(sino, cfg, vectors, backprojection_options{});
  REQUIRE(reference.dim_x == 12);
  REQUIRE(reference.dim_y == 10);
  REQUIRE(reference.dim_z == 9);

  auto opts = backprojection_options{};
  opts.split.z = 4;
  opts.split_sub = split_factors{2, 3, 2};
  opts.devices = {0, 0};

  const auto tiled = backproject(sino, cfg, vectors, opts);
  const auto partitioned = backproject_partitioned(sino, cfg, vectors, opts);
  REQUIRE(partitioned.loc == memory_location::host);

  for(auto i = 0u; i < reference.size(); ++i)
  {
    REQUIRE(tiled.buf[i] == Approx(reference.buf[i]).margin(1e-5));
    REQUIRE(partitioned.buf[i] == Approx(reference.buf[i]).margin(1e-5));
  }
}

TEST_CASE( "Projector validates its inputs", "[backprojection]" ) {
  const auto cfg = make_config(16, 8, 4, 8, 8, 8);
  const auto sino = random_sinogram(16, 8, 4);

  REQUIRE_THROWS_AS(backproject(sino, cfg, random_vectors(3, 1.), backprojection_options{}), shape_mismatch);

  auto fields = deformation_fields{make_array<float>(8, 8, 7), make_array<float>(8, 8, 8), make_array<float>(8, 8, 8)};
  auto opts = backprojection_options{};
  opts.deformation = &fields;
  REQUIRE_THROWS_AS(backproject(sino, cfg, random_vectors(4, 1.), opts), shape_mismatch);

  auto resident = random_sinogram(16, 8, 4);
  resident.loc = memory_location::device;
  REQUIRE_THROWS_AS(backproject_partitioned(resident, cfg, random_vectors(4, 1.), backprojection_options{}),
                    std::invalid_argument);
}
