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

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/log/trivial.hpp>

#include "array.h"
#include "backend.h"
#include "backprojection.h"
#include "block_dispatch.h"
#include "exception.h"
#include "geometry.h"
#include "scheduler.h"
#include "subvolume_information.h"
#include "task_queue.h"

namespace lapis
{
    namespace
    {
        auto check_inputs(const array3d<float>& sinogram, const reconstruction_config& cfg,
                          const std::vector<projection_vector>& vectors, const backprojection_options& opts) -> void
        {
            if(sinogram.dim_x != cfg.proj_width || sinogram.dim_y != cfg.proj_height)
                throw shape_mismatch{"backproject(): sinogram does not match the detector geometry"};

            if(vectors.size() != sinogram.dim_z)
                throw shape_mismatch{"backproject(): expected " + std::to_string(sinogram.dim_z)
                                     + " projection vectors, got " + std::to_string(vectors.size())};

            if(opts.deformation == nullptr || opts.deformation->empty())
                return;

            auto fits = [&cfg](const array3d<float>& f)
            {
                return f.dim_x == cfg.vol_x && f.dim_y == cfg.vol_y && f.dim_z == cfg.vol_z;
            };

            if(!fits(opts.deformation->x) || !fits(opts.deformation->y) || !fits(opts.deformation->z))
                throw shape_mismatch{"backproject(): deformation fields do not match the volume"};
        }

        auto deformation_pointers(const backprojection_options& opts) noexcept -> std::vector<const float*>
        {
            if(opts.deformation == nullptr || opts.deformation->empty())
                return {nullptr, nullptr, nullptr};

            return {opts.deformation->x.buf.get(), opts.deformation->y.buf.get(), opts.deformation->z.buf.get()};
        }

        /*
         * Back-projects the full sinogram into the slices [first, last) of the volume. `v` holds exactly
         * these slices. The x-y plane and the z range are tiled according to split_sub.
         */
        auto process_subvolume(const array3d<float>& p, const std::vector<backend::detector_basis>& bases,
                               array3d<float>& v, std::uint32_t first, std::uint32_t last,
                               const reconstruction_config& cfg, const backprojection_options& opts) -> void
        {
            const auto d = deformation_pointers(opts);

            const auto xs = make_blocks(cfg.vol_x, opts.split_sub.x);
            const auto ys = make_blocks(cfg.vol_y, opts.split_sub.y);
            const auto zs = make_blocks(last - first, opts.split_sub.z);

            for(auto&& bz : zs)
            {
                for(auto&& by : ys)
                {
                    for(auto&& bx : xs)
                    {
                        auto roi = backend::volume_region{bx.first, bx.last,
                                                          by.first, by.last,
                                                          first + bz.first, first + bz.last,
                                                          cfg.vol_x, cfg.vol_y, cfg.vol_z};

                        if(opts.verbose > 1)
                            BOOST_LOG_TRIVIAL(debug) << "Back-projecting tile [" << roi.x1 << ", " << roi.x2 << ") x ["
                                                     << roi.y1 << ", " << roi.y2 << ") x ["
                                                     << roi.z1 << ", " << roi.z2 << ")";

                        backend::backproject(p, bases, v, first, roi, d[0], d[1], d[2]);
                    }
                }
            }
        }
    }

    auto select_backprojection_path(const array3d<float>& sinogram, const reconstruction_config& cfg,
                                    std::size_t device_count) noexcept -> backprojection_path
    {
        if(sinogram.loc == memory_location::device)
            return backprojection_path::single_device;

        const auto small_detector = std::max(sinogram.dim_x, sinogram.dim_y) < max_single_projection_extent;
        const auto small_volume = volume_voxels(cfg) < max_elements_per_block;

        if(small_detector && small_volume && device_count <= 1)
            return backprojection_path::single_device;

        return backprojection_path::partitioned;
    }

    auto make_detector_bases(const std::vector<projection_vector>& vectors)
        -> std::vector<backend::detector_basis>
    {
        auto bases = std::vector<backend::detector_basis>{};
        bases.reserve(vectors.size());

        for(auto&& vec : vectors)
        {
            const auto a = calculate_angles(vec);
            const auto sin_t = static_cast<float>(std::sin(a.theta));
            const auto cos_t = static_cast<float>(std::cos(a.theta));
            const auto sin_l = static_cast<float>(std::sin(a.lamino));
            const auto cos_l = static_cast<float>(std::cos(a.lamino));

            bases.push_back(backend::detector_basis{-sin_t, cos_t, 0.f,
                                                    -cos_l * cos_t, -cos_l * sin_t, sin_l,
                                                    vec.delta_s, vec.delta_t});
        }

        return bases;
    }

    auto backproject(const array3d<float>& sinogram, const reconstruction_config& cfg,
                     const std::vector<projection_vector>& vectors, const backprojection_options& opts)
        -> array3d<float>
    {
        check_inputs(sinogram, cfg, vectors, opts);

        const auto device = opts.devices.empty() ? backend::get_devices().front() : opts.devices.front();
        backend::set_device(device);

        if(opts.verbose > 1)
            BOOST_LOG_TRIVIAL(debug) << "Back-projecting " << sinogram.dim_z << " projections into a "
                                     << cfg.vol_x << "x" << cfg.vol_y << "x" << cfg.vol_z << " volume on device #"
                                     << device;

        const auto bases = make_detector_bases(vectors);
        auto v = make_array<float>(cfg.vol_x, cfg.vol_y, cfg.vol_z, sinogram.loc);
        process_subvolume(sinogram, bases, v, 0, cfg.vol_z, cfg, opts);
        return v;
    }

    auto backproject_partitioned(const array3d<float>& sinogram, const reconstruction_config& cfg,
                                 const std::vector<projection_vector>& vectors,
                                 const backprojection_options& opts) -> array3d<float>
    {
        check_inputs(sinogram, cfg, vectors, opts);

        if(sinogram.loc != memory_location::host)
            throw std::invalid_argument{"backproject_partitioned(): the sinogram has to reside on the host"};

        auto devices = opts.devices;
        if(devices.empty())
            devices = std::vector<backend::device_handle>{backend::get_devices().front()};

        const auto subvol_info = make_subvolume_information(cfg, opts.split.z, devices.size());
        if(opts.verbose > 1)
            BOOST_LOG_TRIVIAL(debug) << "Volume split into " << subvol_info.num << " subvolumes of "
                                     << subvol_info.geo.dim_z << " slices, remainder " << subvol_info.geo.remainder;
        const auto bases = make_detector_bases(vectors);

        auto volume = make_array<float>(cfg.vol_x, cfg.vol_y, cfg.vol_z, memory_location::host);

        auto&& queue = task_queue<block>{};
        for(auto i = 0u; i < subvol_info.num; ++i)
        {
            const auto first = i * subvol_info.geo.dim_z;
            auto last = first + subvol_info.geo.dim_z;
            if(i == subvol_info.num - 1)
                last += subvol_info.geo.remainder;
            queue.push(block{i, first, last});
        }

        auto worker = [&](backend::device_handle device)
        {
            backend::set_device(device);

            auto b = block{};
            while(queue.try_pop(b))
            {
                if(opts.verbose > 0)
                    BOOST_LOG_TRIVIAL(info) << "Processing subvolume #" << b.id << " on device #" << device;

                auto v = make_array<float>(cfg.vol_x, cfg.vol_y, b.last - b.first, memory_location::host);
                process_subvolume(sinogram, bases, v, b.first, b.last, cfg, opts);

                // subvolumes cover disjoint slices
                insert_z(volume, v, b.first);
            }
        };

        auto futures = std::vector<std::future<void>>{};
        for(auto&& d : devices)
            futures.emplace_back(std::async(std::launch::async, worker, d));

        auto error = std::exception_ptr{};
        for(auto&& f : futures)
        {
            try
            {
                f.get();
            }
            catch(...)
            {
                if(!error)
                    error = std::current_exception();
            }
        }

        if(error)
            std::rethrow_exception(error);

        return volume;
    }
}
