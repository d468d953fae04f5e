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

#ifndef LAPIS_PROGRAM_OPTIONS_H_
#define LAPIS_PROGRAM_OPTIONS_H_

#include <cstdint>
#include <string>
#include <vector>

#include "backend.h"
#include "fbp.h"
#include "geometry.h"

namespace lapis
{
    struct program_options
    {
        reconstruction_config cfg;

        std::string input_path;
        bool complex_input = false;
        std::string vectors_path;
        std::string valid_angles_path;
        std::string mask_path;

        std::string output_path;
        std::string prefix;
        bool save_sinogram = false;

        std::string filter;
        float filter_value = 1.f;
        std::string padding;
        bool use_derivative = false;
        bool determine_weights = true;
        bool only_filter_sinogram = false;

        std::vector<std::uint32_t> split;
        std::vector<std::uint32_t> split_sub;
        std::vector<backend::device_handle> devices;

        int verbose = 1;
    };

    auto make_program_options(int argc, char** argv) -> program_options;

    // translates the parsed switches into reconstruction options, throws std::invalid_argument
    auto make_fbp_options(const program_options& po) -> fbp_options;
}

#endif /* LAPIS_PROGRAM_OPTIONS_H_ */
