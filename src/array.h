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

#ifndef LAPIS_ARRAY_H_
#define LAPIS_ARRAY_H_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

namespace lapis
{
    enum class memory_location
    {
        host,
        device
    };

    /*
     * Dense 3D array. For sinograms dim_x is the detector column, dim_y the layer and dim_z the
     * projection index; for volumes the axes are x, y and z. Elements are stored with x running fastest,
     * so every z slice (one projection or one volume slice) is contiguous.
     */
    template <typename T>
    struct array3d
    {
        array3d() = default;

        array3d(std::unique_ptr<T[]> b, std::uint32_t x, std::uint32_t y, std::uint32_t z,
                memory_location l = memory_location::host)
        : buf(std::move(b)), dim_x{x}, dim_y{y}, dim_z{z}, loc{l}
        {}

        auto size() const noexcept -> std::size_t
        {
            return static_cast<std::size_t>(dim_x) * static_cast<std::size_t>(dim_y) * static_cast<std::size_t>(dim_z);
        }

        auto slice_size() const noexcept -> std::size_t
        {
            return static_cast<std::size_t>(dim_x) * static_cast<std::size_t>(dim_y);
        }

        auto empty() const noexcept -> bool
        {
            return buf == nullptr || size() == 0;
        }

        auto operator()(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept -> T&
        {
            return buf[x + y * static_cast<std::size_t>(dim_x) + z * slice_size()];
        }

        auto operator()(std::uint32_t x, std::uint32_t y, std::uint32_t z) const noexcept -> const T&
        {
            return buf[x + y * static_cast<std::size_t>(dim_x) + z * slice_size()];
        }

        std::unique_ptr<T[]> buf = nullptr;
        std::uint32_t dim_x = 0;
        std::uint32_t dim_y = 0;
        std::uint32_t dim_z = 0;
        memory_location loc = memory_location::host;
    };

    template <typename T>
    auto make_array(std::uint32_t x, std::uint32_t y, std::uint32_t z,
                    memory_location loc = memory_location::host) -> array3d<T>
    {
        auto n = static_cast<std::size_t>(x) * static_cast<std::size_t>(y) * static_cast<std::size_t>(z);
        auto ptr = std::make_unique<T[]>(n);
        std::fill_n(ptr.get(), n, T{});
        return array3d<T>{std::move(ptr), x, y, z, loc};
    }

    template <typename T>
    auto copy_array(const array3d<T>& a) -> array3d<T>
    {
        auto ret = make_array<T>(a.dim_x, a.dim_y, a.dim_z, a.loc);
        std::copy_n(a.buf.get(), a.size(), ret.buf.get());
        return ret;
    }

    // copies the z slices [first, last)
    template <typename T>
    auto slice_z(const array3d<T>& a, std::uint32_t first, std::uint32_t last) -> array3d<T>
    {
        auto ret = make_array<T>(a.dim_x, a.dim_y, last - first, a.loc);
        std::copy_n(a.buf.get() + first * a.slice_size(), ret.size(), ret.buf.get());
        return ret;
    }

    // writes src into dst starting at z slice offset, x and y extents have to match
    template <typename T>
    auto insert_z(array3d<T>& dst, const array3d<T>& src, std::uint32_t offset) noexcept -> void
    {
        std::copy_n(src.buf.get(), src.size(), dst.buf.get() + offset * dst.slice_size());
    }
}

#endif /* LAPIS_ARRAY_H_ */
