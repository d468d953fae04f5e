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
#include <numeric>
#include <vector>

#include <catch2/catch.hpp>

#include "geometry.h"
#include "weighting.h"

using namespace lapis;

namespace
{
  auto make_vectors(const std::vector<double>& degrees, double lamino = M_PI / 2) -> std::vector<projection_vector>
  {
    auto v = std::vector<projection_vector>{};
    for(auto&& d : degrees)
      v.push_back(make_projection_vector(d * M_PI / 180., lamino));
    return v;
  }

  auto mean(const std::vector<float>& w) -> double
  {
    return std::accumulate(std::begin(w), std::end(w), 0.) / static_cast<double>(w.size());
  }
}

TEST_CASE( "Angles are recovered from projection vectors", "[weighting]" ) {
  const auto theta = GENERATE(0., 0.3, M_PI / 2, 2.5);
  const auto lamino = GENERATE(M_PI / 2, M_PI / 3, 0.4);

  const auto a = calculate_angles(make_projection_vector(theta, lamino));
  REQUIRE(a.theta == Approx(theta).margin(1e-9));
  REQUIRE(a.lamino == Approx(lamino).margin(1e-9));
}

TEST_CASE( "Equally spaced angles get uniform weights", "[weighting]" ) {
  const auto n = 180u;
  auto degrees = std::vector<double>(n);
  for(auto i = 0u; i < n; ++i)
    degrees[i] = i * 180. / n;

  const auto w = estimate_weights(make_vectors(degrees), true);
  REQUIRE(w.weights.size() == n);
  REQUIRE_FALSE(w.missing_wedge);

  for(auto&& v : w.weights)
    REQUIRE(v == Approx(M_PI / (2. * n)).epsilon(1e-4));
}

TEST_CASE( "Weights without estimation only carry the tilt", "[weighting]" ) {
  const auto lamino = M_PI / 3;
  const auto w = estimate_weights(make_vectors({0., 1., 5., 30.}, lamino), false);

  REQUIRE_FALSE(w.missing_wedge);
  for(auto&& v : w.weights)
    REQUIRE(v == Approx(M_PI / 8. * std::sin(lamino)).epsilon(1e-5));
}

TEST_CASE( "Non-uniform sampling is compensated", "[weighting]" ) {
  const auto w = estimate_weights(make_vectors({0., 1., 2., 4., 5., 6.}), true);
  REQUIRE_FALSE(w.missing_wedge);

  // projections next to the gap cover a larger angular range
  REQUIRE(w.weights[2] == Approx(1.5 * w.weights[0]).epsilon(1e-4));
  REQUIRE(w.weights[3] == Approx(1.5 * w.weights[5]).epsilon(1e-4));
  REQUIRE(w.weights[1] == Approx(w.weights[4]).epsilon(1e-4));

  const auto scale = M_PI / (2. * 6);
  REQUIRE(mean(w.weights) / scale == Approx(1.).epsilon(1e-5));
}

TEST_CASE( "Large angular gaps are clamped to the median", "[weighting]" ) {
  auto degrees = std::vector<double>{};
  for(auto i = 0; i < 20; ++i)
    degrees.push_back(i);
  for(auto i = 60; i < 80; ++i)
    degrees.push_back(i);

  const auto w = estimate_weights(make_vectors(degrees), true);
  REQUIRE(w.missing_wedge);

  const auto scale = M_PI / (2. * degrees.size());
  for(auto&& v : w.weights)
    REQUIRE(v == Approx(scale).epsilon(1e-4));

  REQUIRE(mean(w.weights) / scale == Approx(1.).epsilon(1e-5));
}

TEST_CASE( "Degenerate angle sets", "[weighting]" ) {
  SECTION( "single projection" ) {
    const auto w = estimate_weights(make_vectors({42.}), true);
    REQUIRE(w.weights.size() == 1);
    REQUIRE(w.weights[0] == Approx(M_PI / 2.));
  }

  SECTION( "coinciding angles" ) {
    const auto w = estimate_weights(make_vectors({10., 10., 10., 10.}), true);
    REQUIRE_FALSE(w.missing_wedge);
    for(auto&& v : w.weights)
      REQUIRE(v == Approx(M_PI / 8.));
  }

  SECTION( "no projections" ) {
    const auto w = estimate_weights({}, true);
    REQUIRE(w.weights.empty());
  }
}
