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

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "backprojection.h"
#include "fbp.h"
#include "filter.h"
#include "filtering.h"
#include "geometry.h"
#include "program_options.h"

namespace lapis
{
    namespace
    {
        auto to_split_factors(const std::vector<std::uint32_t>& v, const char* name) -> split_factors
        {
            auto s = split_factors{};
            if(v.empty())
                return s;

            if(v.size() != 3)
                throw std::invalid_argument{std::string{"--"} + name + " expects three factors (x y z)"};

            for(auto&& f : v)
            {
                if(f == 0)
                    throw std::invalid_argument{std::string{"--"} + name + " factors have to be positive"};
            }

            s.x = v[0];
            s.y = v[1];
            s.z = v[2];
            return s;
        }
    }

    auto make_program_options(int argc, char** argv) -> program_options
    {
        auto po = program_options{};

        auto geometry_path = std::string{""};

        try
        {
            // General options
            boost::program_options::options_description general{"General options"};
            general.add_options()
                    ("help", "produce a help message")
                    ("geometry-format", "Display geometry file format")
                    ("verbose", boost::program_options::value<int>(&po.verbose)->default_value(1), "Verbosity: 0 = quiet, 1 = normal, 2 = debug");

            // Geometry options
            boost::program_options::options_description geo_opts{"Geometry options"};
            geo_opts.add_options()
                    ("geometry", boost::program_options::value<std::string>(&geometry_path)->required(), "Path to geometry file")
                    ("vectors", boost::program_options::value<std::string>(&po.vectors_path)->required(), "Path to projection vectors (ray_x ray_y ray_z [delta_s delta_t] per line)")
                    ("valid-angles", boost::program_options::value<std::string>(&po.valid_angles_path), "Path to valid angle mask, one 0 or 1 per projection (optional)");

            // I/O options
            boost::program_options::options_description io{"Input/output options"};
            io.add_options()
                    ("input", boost::program_options::value<std::string>(&po.input_path)->required(), "Path to the raw float32 sinogram")
                    ("complex", "Input sinogram is complex, reconstruct its phase gradient (optional)")
                    ("output", boost::program_options::value<std::string>(&po.output_path)->required(), "Output directory for the reconstructed volume")
                    ("name", boost::program_options::value<std::string>(&po.prefix)->default_value("vol"), "Name of the reconstructed volume (optional)")
                    ("save-sinogram", "Also save the filtered sinogram (optional)")
                    ("mask", boost::program_options::value<std::string>(&po.mask_path), "Path to a raw float32 slice or volume mask (optional)");

            // Reconstruction options
            boost::program_options::options_description recon{"Reconstruction options"};
            recon.add_options()
                    ("filter", boost::program_options::value<std::string>(&po.filter)->default_value("ram-lak"), "ram-lak, shepp-logan, cosine, hamming, hann, parzen or none")
                    ("filter-value", boost::program_options::value<float>(&po.filter_value)->default_value(1.f), "Fraction of the passed frequencies, (0, 1]")
                    ("padding", boost::program_options::value<std::string>(&po.padding)->default_value("zero"), "zero, replicate or symmetric")
                    ("derivative", "Filter derivative data (optional)")
                    ("no-weights", "Skip the estimation of angular weights (optional)")
                    ("only-filter", "Only filter the sinogram, skip the back-projection (optional)")
                    ("split", boost::program_options::value<std::vector<std::uint32_t>>(&po.split)->multitoken(), "Volume split factors x y z (optional)")
                    ("split-sub", boost::program_options::value<std::vector<std::uint32_t>>(&po.split_sub)->multitoken(), "Tile split factors x y z (optional)")
                    ("devices", boost::program_options::value<std::vector<backend::device_handle>>(&po.devices)->multitoken(), "Devices to use (optional)");

            // Geometry file
            boost::program_options::options_description geom{"Geometry file"};
            geom.add_options()
                    ("proj_width", boost::program_options::value<std::uint32_t>(&po.cfg.proj_width)->required(), "[integer] number of detector columns (= projection width, even)")
                    ("proj_height", boost::program_options::value<std::uint32_t>(&po.cfg.proj_height)->required(), "[integer] number of detector rows (= projection height)")
                    ("proj_count", boost::program_options::value<std::uint32_t>(&po.cfg.proj_count)->required(), "[integer] number of projections")
                    ("vol_x", boost::program_options::value<std::uint32_t>(&po.cfg.vol_x)->required(), "[integer] volume width in voxels")
                    ("vol_y", boost::program_options::value<std::uint32_t>(&po.cfg.vol_y)->required(), "[integer] volume depth in voxels")
                    ("vol_z", boost::program_options::value<std::uint32_t>(&po.cfg.vol_z)->required(), "[integer] volume height in voxels");

            // combine
            boost::program_options::options_description params;
            params.add(general).add(geo_opts).add(io).add(recon);

            boost::program_options::variables_map param_map, geom_map;
            boost::program_options::store(boost::program_options::parse_command_line(argc, argv, params), param_map);

            if(param_map.count("help"))
            {
                std::cout << params << std::endl;
                std::exit(EXIT_SUCCESS);
            }
            else if(param_map.count("geometry-format"))
            {
                std::cout << geom << std::endl;
                std::exit(EXIT_SUCCESS);
            }

            po.complex_input = param_map.count("complex") > 0;
            po.save_sinogram = param_map.count("save-sinogram") > 0;
            po.use_derivative = param_map.count("derivative") > 0;
            po.determine_weights = param_map.count("no-weights") == 0;
            po.only_filter_sinogram = param_map.count("only-filter") > 0;

            boost::program_options::notify(param_map);

            auto&& file = std::ifstream{geometry_path.c_str()};
            if(!file)
            {
                std::cerr << "could not open the geometry file at " << geometry_path << std::endl;
                std::exit(EXIT_FAILURE);
            }
            boost::program_options::store(boost::program_options::parse_config_file(file, geom), geom_map);
            boost::program_options::notify(geom_map);
        }
        catch(const boost::program_options::error& err)
        {
            std::cerr << err.what() << std::endl;
            std::exit(EXIT_FAILURE);
        }

        return po;
    }

    auto make_fbp_options(const program_options& po) -> fbp_options
    {
        auto opts = fbp_options{};
        opts.split = to_split_factors(po.split, "split");
        opts.split_sub = to_split_factors(po.split_sub, "split-sub");
        opts.filter = to_filter_type(po.filter);
        opts.filter_value = po.filter_value;
        opts.padding = to_padding_mode(po.padding);
        opts.devices = po.devices;
        opts.verbose = po.verbose;
        opts.use_derivative = po.use_derivative;
        opts.determine_weights = po.determine_weights;
        opts.only_filter_sinogram = po.only_filter_sinogram;

        if(!(po.filter_value > 0.f && po.filter_value <= 1.f))
            throw std::invalid_argument{"--filter-value has to be in (0, 1]"};

        return opts;
    }
}
