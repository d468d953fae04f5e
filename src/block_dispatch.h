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

#ifndef LAPIS_BLOCK_DISPATCH_H_
#define LAPIS_BLOCK_DISPATCH_H_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <utility>
#include <vector>

#include <boost/log/trivial.hpp>

#include "array.h"
#include "backend.h"
#include "exception.h"
#include "task_queue.h"

namespace lapis
{
    struct dispatch_options
    {
        std::vector<backend::device_handle> devices;   // empty -> default device
        int verbose = 1;
        std::uint32_t blocks = 1;
        bool use_device = true;                         // false forces host execution
    };

    struct block
    {
        std::uint32_t id;
        std::uint32_t first;    // first z slice
        std::uint32_t last;     // one past the last z slice
    };

    // contiguous z ranges of (almost) equal size, the leading blocks take the remainder
    inline auto make_blocks(std::uint32_t dim_z, std::uint32_t num) -> std::vector<block>
    {
        auto blocks = std::vector<block>{};
        if(dim_z == 0)
            return blocks;

        num = std::max(1u, std::min(num, dim_z));
        const auto size = dim_z / num;
        const auto remainder = dim_z % num;

        auto first = 0u;
        for(auto i = 0u; i < num; ++i)
        {
            const auto last = first + size + (i < remainder ? 1u : 0u);
            blocks.push_back(block{i, first, last});
            first = last;
        }

        return blocks;
    }

    /*
     * Applies fn(block_data, first_slice) to contiguous blocks along the z axis of `in` and reassembles
     * the results in order. fn has to return an array with the x and y extents of `in` and as many slices
     * as it was given. Blocks are distributed over one worker per device; the first failing block aborts
     * the whole run once all workers have stopped.
     */
    template <class T, class Fn>
    auto run_blocked(Fn&& fn, const array3d<T>& in, const dispatch_options& opts) -> array3d<T>
    {
        auto loc = opts.use_device ? in.loc : memory_location::host;
        auto out = make_array<T>(in.dim_x, in.dim_y, in.dim_z, loc);

        auto&& queue = task_queue<block>{};
        for(auto&& b : make_blocks(in.dim_z, opts.blocks))
            queue.push(b);

        const auto num_blocks = queue.size();

        auto devices = opts.devices;
        if(devices.empty() || !opts.use_device)
            devices = std::vector<backend::device_handle>{backend::get_devices().front()};

        if(opts.verbose > 1)
            BOOST_LOG_TRIVIAL(debug) << "Dispatching " << num_blocks << (num_blocks == 1 ? " block" : " blocks")
                                     << " to " << devices.size() << (devices.size() == 1 ? " device" : " devices");

        auto worker = [&](backend::device_handle device)
        {
            backend::set_device(device);

            auto b = block{};
            while(queue.try_pop(b))
            {
                if(opts.verbose > 1)
                    BOOST_LOG_TRIVIAL(debug) << "Processing block #" << b.id << " [" << b.first << ", " << b.last
                                             << ") on device #" << device;

                auto result = fn(slice_z(in, b.first, b.last), b.first);
                if(result.dim_x != in.dim_x || result.dim_y != in.dim_y || result.dim_z != b.last - b.first)
                    throw shape_mismatch{"run_blocked(): block function changed the block extents"};

                insert_z(out, result, b.first);
            }
        };

        if(devices.size() > 1)
        {
            // launch a worker thread for each device
            auto futures = std::vector<std::future<void>>{};
            for(auto&& d : devices)
                futures.emplace_back(std::async(std::launch::async, worker, d));

            // wait for the end of execution, keep the first error
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
        }
        else
            worker(devices.front());

        return out;
    }
}

#endif /* LAPIS_BLOCK_DISPATCH_H_ */
