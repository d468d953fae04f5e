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

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "scheduler.h"

using namespace lapis;

TEST_CASE( "Block count covers memory and index limits", "[scheduler]" ) {
  const auto elements = std::uint64_t{1} << 33;
  const auto memory = std::size_t{1} << 30;

  const auto blocks = plan_blocks(elements, memory, 8, 1);
  REQUIRE(blocks >= 64);
  REQUIRE(blocks >= elements / max_elements_per_block);
  REQUIRE(blocks == 64);
}

TEST_CASE( "Block count scales linearly with the element count", "[scheduler]" ) {
  const auto memory = std::size_t{1} << 30;
  const auto unit = std::uint64_t{1} << 27;   // 8 bytes each -> exactly the memory

  for(auto m = 1u; m <= 10u; ++m)
    REQUIRE(plan_blocks(m * unit, memory, 8, 1) == m);
}

TEST_CASE( "Every device receives a block", "[scheduler]" ) {
  const auto devices = GENERATE(1u, 2u, 4u, 7u);
  REQUIRE(plan_blocks(10, std::size_t{1} << 30, 8, devices) == devices);
  REQUIRE(plan_blocks(0, std::size_t{1} << 30, 8, 0) == 1);
}

TEST_CASE( "Blocks never exceed 32 bit indexing", "[scheduler]" ) {
  const auto elements = 3 * max_elements_per_block;
  REQUIRE(plan_blocks(elements, std::numeric_limits<std::size_t>::max(), 1, 1) == 3);
  REQUIRE(plan_blocks(elements + 1, std::numeric_limits<std::size_t>::max(), 1, 1) == 4);
}

TEST_CASE( "Planning without memory fails", "[scheduler]" ) {
  REQUIRE_THROWS_AS(plan_blocks(100, 0, 8, 1), std::invalid_argument);
  REQUIRE_THROWS_AS(plan_blocks(std::numeric_limits<std::uint64_t>::max(), 1, 8, 1), std::invalid_argument);
}

TEST_CASE( "Host and accelerator budgets", "[scheduler]" ) {
  const auto elements = std::uint64_t{1000000000};
  const auto plenty = std::size_t{1000000000000000};

  // 48 GB of working memory against the 20 GB cap
  REQUIRE(plan_filter_blocks(elements, memory_budget{false, plenty}, 1) == 3);

  // accelerators report their memory without a cap
  REQUIRE(plan_filter_blocks(elements, memory_budget{true, plenty}, 1) == 1);

  REQUIRE(plan_filter_blocks(elements, memory_budget{true, std::size_t{8000000000}}, 1) == 4);
  REQUIRE(plan_filter_blocks(elements, memory_budget{false, std::size_t{8000000000}}, 1) == 6);
}
