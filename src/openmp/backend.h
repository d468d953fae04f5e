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

#ifndef LAPIS_OPENMP_BACKEND_H_
#define LAPIS_OPENMP_BACKEND_H_

#include <complex>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <fftw3.h>

#include "../array.h"

namespace lapis
{
    enum class padding_mode;

    namespace openmp
    {
        /*
         * Runtime management
         * */
        // exceptions
        using bad_alloc = std::bad_alloc;
        using invalid_argument = std::invalid_argument;
        using runtime_error = std::runtime_error;

        constexpr auto name = "OpenMP";

        /*
         * Device management
         * */
        using device_handle = int;

        struct device_info
        {
            device_handle id;
            bool accelerator;
            std::size_t available_memory;
        };

        auto set_device(const device_handle&) noexcept -> void;
        auto get_devices() -> std::vector<device_handle>;
        auto get_device_info(const device_handle& device) -> device_info;

        /*
         * Memory management
         * */
        // free physical memory as reported by the operating system
        auto available_host_memory() noexcept -> std::size_t;

        // host and device memory are the same for this backend, transfers only change the location tag
        template <class T>
        auto copy_h2d(const array3d<T>& h_a) -> array3d<T>
        {
            auto d_a = copy_array(h_a);
            d_a.loc = memory_location::device;
            return d_a;
        }

        template <class T>
        auto copy_d2h(const array3d<T>& d_a) -> array3d<T>
        {
            auto h_a = copy_array(d_a);
            h_a.loc = memory_location::host;
            return h_a;
        }

        template <class T>
        auto to_host(array3d<T> a) noexcept -> array3d<T>
        {
            a.loc = memory_location::host;
            return a;
        }

        /*
         * Filtering
         * */
        namespace fft
        {
            constexpr auto name = "FFTW";

            using bad_alloc = std::bad_alloc;
            using invalid_argument = std::invalid_argument;
            using runtime_error = std::runtime_error;

            using complex_type = fftwf_complex;

            struct deleter
            {
                auto operator()(void* p) noexcept -> void
                {
                    fftwf_free(p);
                }
            };

            template <class T>
            using pointer = std::unique_ptr<T[], deleter>;

            template <class T>
            auto make_ptr(std::size_t n) -> pointer<T>
            {
                auto p = reinterpret_cast<T*>(fftwf_malloc(n * sizeof(T)));
                if(p == nullptr)
                    throw bad_alloc{};
                return pointer<T>{p};
            }

            // the FFTW planner is not thread-safe, plan creation and destruction are serialized
            class plan
            {
                public:
                    plan(int n, int batch, complex_type* data, int sign);
                    ~plan();

                    plan(const plan&) = delete;
                    auto operator=(const plan&) -> plan& = delete;

                    auto execute() noexcept -> void;

                private:
                    fftwf_plan plan_;
            };
        }

        /*
         * Filters all rows of the projections in `in` (dim_x = width) with the frequency response `h`
         * (dim_x = filter size, one column per projection). `out` has the shape of `in`.
         */
        auto apply_filter(const array3d<float>& in, const array3d<std::complex<float>>& h,
                          padding_mode padding, array3d<float>& out) -> void;

        auto phase_gradient(const array3d<std::complex<float>>& in, float step, array3d<float>& out) -> void;

        /*
         * Reconstruction
         * */
        struct detector_basis
        {
            // detector axes in volume coordinates
            float u_x, u_y, u_z;
            float v_x, v_y, v_z;

            float delta_s;
            float delta_t;
        };

        struct volume_region
        {
            // voxel range in full volume coordinates
            std::uint32_t x1, x2;
            std::uint32_t y1, y2;
            std::uint32_t z1, z2;

            // full volume extents
            std::uint32_t dim_x, dim_y, dim_z;
        };

        /*
         * Accumulates all projections of `p` into the region `roi` of `v`. `v` holds only the z range
         * [roi.z1 - offset, ...) of the full volume, offset being the first slice of the subvolume.
         * `dx`, `dy` and `dz` are optional per-voxel displacements of full volume size.
         */
        auto backproject(const array3d<float>& p, const std::vector<detector_basis>& bases,
                         array3d<float>& v, std::uint32_t offset, const volume_region& roi,
                         const float* dx, const float* dy, const float* dz) noexcept -> void;
    }
}

#endif /* LAPIS_OPENMP_BACKEND_H_ */
