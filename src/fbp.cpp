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
#include <complex>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/log/trivial.hpp>

#include "array.h"
#include "backend.h"
#include "backprojection.h"
#include "block_dispatch.h"
#include "exception.h"
#include "fbp.h"
#include "filter.h"
#include "filtering.h"
#include "geometry.h"
#include "phase_gradient.h"
#include "resources.h"
#include "scheduler.h"
#include "weighting.h"

namespace lapis
{
    namespace
    {
        auto log_state(const fbp_options& opts, const char* state) -> void
        {
            if(opts.verbose > 1)
                BOOST_LOG_TRIVIAL(debug) << "fbp(): " << state;
        }

        auto dims(std::uint32_t x, std::uint32_t y, std::uint32_t z) -> std::string
        {
            return std::to_string(x) + "x" + std::to_string(y) + "x" + std::to_string(z);
        }

        template <class T>
        auto validate(const array3d<T>& sinogram, const reconstruction_config& cfg,
                      const std::vector<projection_vector>& vectors, const fbp_options& opts) -> void
        {
            if(sinogram.empty())
                throw shape_mismatch{"fbp(): the sinogram is empty"};

            if(sinogram.dim_x % 2 != 0)
                throw shape_mismatch{"fbp(): the projection width " + std::to_string(sinogram.dim_x)
                                     + " has to be even"};

            if(sinogram.dim_x != cfg.proj_width || sinogram.dim_y != cfg.proj_height
               || sinogram.dim_z != cfg.proj_count)
                throw shape_mismatch{"fbp(): sinogram of " + dims(sinogram.dim_x, sinogram.dim_y, sinogram.dim_z)
                                     + " does not match the configured "
                                     + dims(cfg.proj_width, cfg.proj_height, cfg.proj_count)};

            if(vectors.size() != sinogram.dim_z)
                throw shape_mismatch{"fbp(): expected " + std::to_string(sinogram.dim_z)
                                     + " projection vectors, got " + std::to_string(vectors.size())};

            if(!opts.valid_angles.empty() && opts.valid_angles.size() != sinogram.dim_z)
                throw shape_mismatch{"fbp(): the valid angle mask has " + std::to_string(opts.valid_angles.size())
                                     + " entries for " + std::to_string(sinogram.dim_z) + " projections"};

            if(!opts.mask.empty())
            {
                if(opts.mask.dim_x != cfg.vol_x || opts.mask.dim_y != cfg.vol_y
                   || (opts.mask.dim_z != 1 && opts.mask.dim_z != cfg.vol_z))
                    throw shape_mismatch{"fbp(): mask of " + dims(opts.mask.dim_x, opts.mask.dim_y, opts.mask.dim_z)
                                         + " does not match the volume of " + dims(cfg.vol_x, cfg.vol_y, cfg.vol_z)};
            }

            if(!opts.deformation.empty())
            {
                auto fits = [&cfg](const array3d<float>& f)
                {
                    return f.dim_x == cfg.vol_x && f.dim_y == cfg.vol_y && f.dim_z == cfg.vol_z;
                };

                if(!fits(opts.deformation.x) || !fits(opts.deformation.y) || !fits(opts.deformation.z))
                    throw shape_mismatch{"fbp(): the deformation fields do not match the volume of "
                                         + dims(cfg.vol_x, cfg.vol_y, cfg.vol_z)};
            }
        }

        template <class T>
        auto select_angles(const array3d<T>& sinogram, reconstruction_config& cfg,
                           std::vector<projection_vector>& vectors, const fbp_options& opts) -> array3d<T>
        {
            const auto& valid = opts.valid_angles;
            const auto num = static_cast<std::uint32_t>(std::count(std::begin(valid), std::end(valid), true));
            if(num == 0)
                throw shape_mismatch{"fbp(): the valid angle mask excludes every projection"};

            auto ret = make_array<T>(sinogram.dim_x, sinogram.dim_y, num, sinogram.loc);
            auto selected = std::vector<projection_vector>{};
            selected.reserve(num);

            auto j = 0u;
            for(auto i = 0u; i < sinogram.dim_z; ++i)
            {
                if(!valid[i])
                    continue;

                std::copy_n(sinogram.buf.get() + i * sinogram.slice_size(), sinogram.slice_size(),
                            ret.buf.get() + j * ret.slice_size());
                selected.push_back(vectors[i]);
                ++j;
            }

            if(opts.verbose > 1)
                BOOST_LOG_TRIVIAL(debug) << "fbp(): using " << num << " of " << sinogram.dim_z << " projections";

            vectors = std::move(selected);
            cfg.proj_count = num;
            return ret;
        }

        auto all_valid(const std::vector<bool>& valid) -> bool
        {
            return std::all_of(std::begin(valid), std::end(valid), [](bool b) { return b; });
        }

        auto apply_mask(array3d<float> volume, const array3d<float>& mask, const fbp_options& opts,
                        const compute_resources& res) -> array3d<float>
        {
            const auto blocks = plan_blocks(volume.size(), std::min(res.host_memory, host_memory_cap),
                                            host_bytes_per_element, 1);
            if(opts.verbose > 1)
                BOOST_LOG_TRIVIAL(debug) << "fbp(): masking " << volume.size() << " voxels in " << blocks
                                         << (blocks == 1 ? " block" : " blocks") << " on the host";

            auto multiply = [&mask](const array3d<float>& b, std::uint32_t first)
            {
                auto out = copy_array(b);
                const auto broadcast = (mask.dim_z == 1);

                #pragma omp parallel for collapse(2)
                for(auto z = 0u; z < out.dim_z; ++z)
                {
                    for(auto y = 0u; y < out.dim_y; ++y)
                    {
                        const auto mz = broadcast ? 0u : first + z;
                        for(auto x = 0u; x < out.dim_x; ++x)
                            out(x, y, z) *= mask(x, y, mz);
                    }
                }
                return out;
            };

            return run_blocked(multiply, volume, dispatch_options{{}, opts.verbose, blocks, false});
        }

        template <class T>
        auto finalize(array3d<T> a, bool keep_on_device) -> array3d<T>
        {
            if(keep_on_device || a.loc == memory_location::host || a.empty())
                return a;
            return backend::copy_d2h(a);
        }

        auto reconstruct(array3d<float> sinogram, const reconstruction_config& cfg,
                         const std::vector<projection_vector>& vectors, const fbp_options& opts,
                         const compute_resources& res, bool derivative, bool keep_on_device) -> fbp_result
        {
            auto result = fbp_result{};
            const auto width = cfg.proj_width;

            if(opts.filter != filter_type::none)
            {
                auto weights = estimate_weights(vectors, opts.determine_weights);
                result.missing_wedge = weights.missing_wedge;
                if(weights.missing_wedge && opts.verbose > 1)
                    BOOST_LOG_TRIVIAL(debug) << "fbp(): too large angular jump for FBP weighting, "
                                                "assuming missing wedge tomography";
                log_state(opts, "weights computed");

                const auto kernel = make_filter(opts.filter, width, opts.filter_value, derivative);
                auto h = make_filter_matrix(kernel, weights.weights);
                log_state(opts, "kernel built");

                const auto elements = static_cast<std::uint64_t>(h.dim_x) * cfg.proj_height * cfg.proj_count;
                const auto budget = has_accelerator(res) ? memory_budget{true, accelerator_memory(res)}
                                                         : memory_budget{false, res.host_memory};
                const auto blocks = plan_filter_blocks(elements, budget, opts.devices.size());
                if(opts.verbose > 1)
                    BOOST_LOG_TRIVIAL(debug) << "fbp(): filtering " << elements << " elements in " << blocks
                                             << (blocks == 1 ? " block" : " blocks") << " on the "
                                             << (budget.accelerator ? "accelerator" : "host");

                auto filter_block = [&h, &opts, width](const array3d<float>& b, std::uint32_t first)
                {
                    const auto hb = slice_z(h, first, first + b.dim_z);
                    return filter_projections(b, hb, width, opts.padding);
                };

                sinogram = run_blocked(filter_block, sinogram,
                                       dispatch_options{opts.devices, opts.verbose, blocks, true});
                log_state(opts, "filtered");

                result.filter = std::move(h);
                result.weights = std::move(weights.weights);
            }

            if(!opts.only_filter_sinogram)
            {
                const auto bp_opts = backprojection_options{opts.split, opts.split_sub, opts.devices, opts.verbose,
                                                            opts.deformation.empty() ? nullptr : &opts.deformation};

                if(select_backprojection_path(sinogram, cfg, opts.devices.size()) == backprojection_path::single_device)
                {
                    log_state(opts, "single device back-projection");
                    result.volume = backproject(sinogram, cfg, vectors, bp_opts);
                }
                else
                {
                    log_state(opts, "partitioned back-projection");
                    if(sinogram.loc == memory_location::device)
                        sinogram = backend::copy_d2h(sinogram);
                    result.volume = backproject_partitioned(sinogram, cfg, vectors, bp_opts);
                }
                log_state(opts, "back-projected");

                if(!opts.mask.empty())
                {
                    result.volume = apply_mask(std::move(result.volume), opts.mask, opts, res);
                    log_state(opts, "masked");
                }
            }

            result.volume = finalize(std::move(result.volume), keep_on_device);
            result.sinogram = finalize(std::move(sinogram), keep_on_device);
            log_state(opts, "finalized");
            return result;
        }

        template <class Run>
        auto guarded(const char* what, Run&& run) -> fbp_result
        {
            try
            {
                return run();
            }
            catch(const shape_mismatch&)
            {
                throw;
            }
            catch(const invalid_filter_kind&)
            {
                throw;
            }
            catch(const std::invalid_argument& ia)
            {
                BOOST_LOG_TRIVIAL(fatal) << what << ": " << ia.what();
                throw reconstruction_error{std::string{what} + ": " + ia.what()};
            }
            catch(const reconstruction_error& e)
            {
                BOOST_LOG_TRIVIAL(fatal) << what << ": " << e.what();
                throw;
            }
            catch(const std::bad_alloc& ba)
            {
                BOOST_LOG_TRIVIAL(fatal) << what << ": Out of memory: " << ba.what();
                throw reconstruction_error{std::string{what} + ": out of memory"};
            }
            catch(const std::runtime_error& re)
            {
                BOOST_LOG_TRIVIAL(fatal) << what << ": " << re.what();
                throw reconstruction_error{std::string{what} + ": " + re.what()};
            }
        }
    }

    auto fbp(const array3d<float>& sinogram, const reconstruction_config& cfg,
             const std::vector<projection_vector>& vectors, const fbp_options& opts,
             const compute_resources& res) -> fbp_result
    {
        return guarded("fbp()", [&]()
        {
            log_state(opts, "init");
            validate(sinogram, cfg, vectors, opts);

            const auto keep = opts.keep_on_device.value_or(sinogram.loc == memory_location::device);
            auto c = cfg;
            auto v = vectors;

            auto p = array3d<float>{};
            if(!opts.valid_angles.empty() && !all_valid(opts.valid_angles))
            {
                p = select_angles(sinogram, c, v, opts);
                log_state(opts, "angles filtered");
            }
            else
                p = copy_array(sinogram);

            return reconstruct(std::move(p), c, v, opts, res, opts.use_derivative, keep);
        });
    }

    auto fbp(const array3d<std::complex<float>>& sinogram, const reconstruction_config& cfg,
             const std::vector<projection_vector>& vectors, const fbp_options& opts,
             const compute_resources& res) -> fbp_result
    {
        return guarded("fbp()", [&]()
        {
            log_state(opts, "init");
            validate(sinogram, cfg, vectors, opts);

            const auto keep = opts.keep_on_device.value_or(sinogram.loc == memory_location::device);
            auto c = cfg;
            auto v = vectors;

            auto p = array3d<float>{};
            if(!opts.valid_angles.empty() && !all_valid(opts.valid_angles))
            {
                const auto subset = select_angles(sinogram, c, v, opts);
                log_state(opts, "angles filtered");
                p = phase_gradient(subset);
            }
            else
                p = phase_gradient(sinogram);
            log_state(opts, "phase gradient computed, derivative mode");

            return reconstruct(std::move(p), c, v, opts, res, true, keep);
        });
    }
}
