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

#ifndef LAPIS_WEIGHTING_H_
#define LAPIS_WEIGHTING_H_

#include <vector>

#include "geometry.h"

namespace lapis
{
    struct angular_weights
    {
        std::vector<float> weights;

        // set if an angular gap larger than twice the median spacing had to be clamped
        bool missing_wedge = false;
    };

    /*
     * Per-projection integration weights. With determine_weights every projection is weighted by
     * the angular range it covers (projections at theta and theta + pi are equivalent), which corrects
     * for non-equidistant sampling. The weights are normalized to mean 1 and finally scaled by
     * pi / (2 N) * sin(lamino) to account for the laminography tilt.
     */
    auto estimate_weights(const std::vector<projection_vector>& vectors, bool determine_weights)
        -> angular_weights;
}

#endif /* LAPIS_WEIGHTING_H_ */
