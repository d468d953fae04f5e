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
#include <numeric>
#include <vector>

#include <boost/log/trivial.hpp>

#include "geometry.h"
#include "weighting.h"

namespace lapis
{
    namespace
    {
        auto median(std::vector<double> v) -> double
        {
            const auto n = v.size();
            std::sort(std::begin(v), std::end(v));
            if(n % 2 == 1)
                return v[n / 2];
            return (v[n / 2 - 1] + v[n / 2]) / 2.;
        }

        auto sampling_weights(const std::vector<projection_angles>& angles, bool& missing_wedge) -> std::vector<double>
        {
            const auto n = angles.size();
            auto weights = std::vector<double>(n, 1.);
            if(n < 2)
                return weights;

            // the first projection is the reference, theta and theta + pi are the same projection
            auto theta = std::vector<double>(n);
            for(auto i = 0u; i < n; ++i)
            {
                auto t = std::fmod(angles[i].theta - angles[0].theta, M_PI);
                if(t < 0.)
                    t += M_PI;
                theta[i] = t;
            }

            auto idx = std::vector<std::size_t>(n);
            std::iota(std::begin(idx), std::end(idx), 0u);
            std::stable_sort(std::begin(idx), std::end(idx),
                             [&theta](std::size_t a, std::size_t b) { return theta[a] < theta[b]; });

            auto sorted = std::vector<double>(n);
            for(auto i = 0u; i < n; ++i)
                sorted[i] = theta[idx[i]];

            weights[idx[0]] = sorted[1] - sorted[0];
            weights[idx[n - 1]] = sorted[n - 1] - sorted[n - 2];
            for(auto i = 1u; i < n - 1; ++i)
                weights[idx[i]] = (sorted[i + 1] - sorted[i - 1]) / 2.;

            const auto med = median(weights);
            for(auto&& w : weights)
            {
                if(w > 2. * med)
                {
                    w = med;
                    missing_wedge = true;
                }
            }

            const auto mean = std::accumulate(std::begin(weights), std::end(weights), 0.) / static_cast<double>(n);
            if(!(mean > 0.))
            {
                BOOST_LOG_TRIVIAL(warning) << "All projection angles coincide, using constant angular weights";
                missing_wedge = false;
                std::fill(std::begin(weights), std::end(weights), 1.);
                return weights;
            }

            for(auto&& w : weights)
                w /= mean;

            return weights;
        }
    }

    auto estimate_weights(const std::vector<projection_vector>& vectors, bool determine_weights)
        -> angular_weights
    {
        auto ret = angular_weights{};
        const auto n = vectors.size();
        if(n == 0)
            return ret;

        const auto angles = calculate_angles(vectors);

        auto weights = std::vector<double>(n, 1.);
        if(determine_weights)
            weights = sampling_weights(angles, ret.missing_wedge);

        // account for the laminography tilt
        const auto scale = M_PI / 2. / static_cast<double>(n);

        ret.weights.resize(n);
        for(auto i = 0u; i < n; ++i)
            ret.weights[i] = static_cast<float>(weights[i] * scale * std::sin(angles[i].lamino));

        return ret;
    }
}
