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
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/log/trivial.hpp>

#include "array.h"
#include "geometry.h"
#include "source.h"

namespace lapis
{
    namespace
    {
        auto file_size(const std::string& path) -> std::uintmax_t
        {
            try
            {
                return boost::filesystem::file_size(boost::filesystem::path{path});
            }
            catch(const boost::filesystem::filesystem_error& err)
            {
                BOOST_LOG_TRIVIAL(fatal) << path << " could not be read: " << err.what();
                throw std::runtime_error{path + " could not be read"};
            }
        }

        template <class T>
        auto read_raw(const std::string& path, array3d<T>& a) -> void
        {
            const auto bytes = a.size() * sizeof(T);
            if(file_size(path) != bytes)
                throw std::runtime_error{path + " does not contain " + std::to_string(bytes) + " bytes"};

            auto&& file = std::ifstream{path.c_str(), std::ios_base::binary};
            if(!file.is_open())
                throw std::runtime_error{"Could not open " + path};

            file.read(reinterpret_cast<char*>(a.buf.get()), static_cast<std::streamsize>(bytes));
            if(!file)
                throw std::runtime_error{"I/O error while reading " + path};
        }
    }

    auto load_sinogram(const std::string& path, const reconstruction_config& cfg) -> array3d<float>
    {
        auto sino = make_array<float>(cfg.proj_width, cfg.proj_height, cfg.proj_count);
        read_raw(path, sino);
        BOOST_LOG_TRIVIAL(info) << "Loaded " << cfg.proj_count << " projections from " << path;
        return sino;
    }

    auto load_complex_sinogram(const std::string& path, const reconstruction_config& cfg)
        -> array3d<std::complex<float>>
    {
        auto sino = make_array<std::complex<float>>(cfg.proj_width, cfg.proj_height, cfg.proj_count);
        read_raw(path, sino);
        BOOST_LOG_TRIVIAL(info) << "Loaded " << cfg.proj_count << " complex projections from " << path;
        return sino;
    }

    auto load_vectors(const std::string& path) -> std::vector<projection_vector>
    {
        auto&& file = std::ifstream{path.c_str()};
        if(!file.is_open())
            throw std::runtime_error{"Could not open projection vector file at " + path};

        auto vectors = std::vector<projection_vector>{};
        auto line = std::string{};
        auto line_no = 0u;
        while(std::getline(file, line))
        {
            ++line_no;
            if(line.empty() || line[0] == '#')
                continue;

            auto&& ss = std::istringstream{line};
            auto values = std::vector<double>{};
            auto val = 0.0;
            while(ss >> val)
                values.push_back(val);

            if(values.empty())
                continue;

            if(values.size() != 3 && values.size() != 5)
                throw std::runtime_error{path + ":" + std::to_string(line_no) + ": expected 3 or 5 values, got "
                                         + std::to_string(values.size())};

            auto v = projection_vector{values[0], values[1], values[2], 0.f, 0.f};
            if(values.size() == 5)
            {
                v.delta_s = static_cast<float>(values[3]);
                v.delta_t = static_cast<float>(values[4]);
            }
            vectors.push_back(v);
        }

        BOOST_LOG_TRIVIAL(info) << "Read " << vectors.size() << " projection vectors from " << path;
        return vectors;
    }

    auto load_valid_angles(const std::string& path) -> std::vector<bool>
    {
        auto&& file = std::ifstream{path.c_str()};
        if(!file.is_open())
            throw std::runtime_error{"Could not open valid angle file at " + path};

        auto valid = std::vector<bool>{};
        auto flag = 0;
        while(file >> flag)
            valid.push_back(flag != 0);

        if(!file.eof())
            throw std::runtime_error{path + " contains non-numeric entries"};

        return valid;
    }

    auto load_mask(const std::string& path, const reconstruction_config& cfg) -> array3d<float>
    {
        const auto slice_bytes = static_cast<std::uintmax_t>(cfg.vol_x) * cfg.vol_y * sizeof(float);
        const auto size = file_size(path);

        auto mask = array3d<float>{};
        if(size == slice_bytes)
            mask = make_array<float>(cfg.vol_x, cfg.vol_y, 1);
        else if(size == slice_bytes * cfg.vol_z)
            mask = make_array<float>(cfg.vol_x, cfg.vol_y, cfg.vol_z);
        else
            throw std::runtime_error{path + " is neither a " + std::to_string(cfg.vol_x) + "x"
                                     + std::to_string(cfg.vol_y) + " slice nor a volume mask"};

        read_raw(path, mask);
        return mask;
    }
}
