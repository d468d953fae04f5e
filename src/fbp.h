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

#ifndef LAPIS_FBP_H_
#define LAPIS_FBP_H_

#include <complex>
#include <cstdint>
#include <vector>

#include <boost/optional.hpp>

#include "array.h"
#include "backend.h"
#include "backprojection.h"
#include "filter.h"
#include "filtering.h"
#include "geometry.h"
#include "resources.h"

namespace lapis
{
    struct fbp_options
    {
        split_factors split;                            // subvolumes for the partitioned projector
        std::vector<bool> valid_angles;                 // empty -> all projections are used
        filter_type filter = filter_type::ram_lak;
        float filter_value = 1.f;
        deformation_fields deformation;
        std::vector<backend::device_handle> devices;    // empty -> default device
        split_factors split_sub;                        // tiles per (sub)volume
        int verbose = 1;                                // > 1 emits debug diagnostics
        bool use_derivative = false;
        boost::optional<bool> keep_on_device;           // unset -> keep where the sinogram was
        bool determine_weights = true;
        array3d<float> mask;                            // (vol_x, vol_y, 1) or (vol_x, vol_y, vol_z)
        padding_mode padding = padding_mode::zero;
        bool only_filter_sinogram = false;
    };

    struct fbp_result
    {
        array3d<float> volume;          // empty in filter-only mode
        array3d<float> sinogram;        // filtered, angle-subset sinogram
        filter_matrix_type filter;      // empty if filtering was skipped
        std::vector<float> weights;     // empty if filtering was skipped
        bool missing_wedge = false;
    };

    /*
     * Filtered back-projection of a tomography or laminography sinogram. `cfg` describes the full
     * (not angle-subset) sinogram and the volume, `vectors` holds one ray direction per projection.
     *
     * Throws shape_mismatch for inconsistent inputs and invalid_filter_kind for unusable filters.
     * Failures during processing are logged and reported as reconstruction_error.
     */
    auto fbp(const array3d<float>& sinogram, const reconstruction_config& cfg,
             const std::vector<projection_vector>& vectors, const fbp_options& opts,
             const compute_resources& res) -> fbp_result;

    // complex sinograms are converted to phase gradients and reconstructed in derivative mode
    auto fbp(const array3d<std::complex<float>>& sinogram, const reconstruction_config& cfg,
             const std::vector<projection_vector>& vectors, const fbp_options& opts,
             const compute_resources& res) -> fbp_result;
}

#endif /* LAPIS_FBP_H_ */
