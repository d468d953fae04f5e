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

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include "logging.h"

namespace lapis
{
    auto init_log(int verbose) -> void
    {
        if(verbose <= 0)
            boost::log::core::get()->set_filter(boost::log::trivial::severity >= boost::log::trivial::warning);
        else if(verbose == 1)
            boost::log::core::get()->set_filter(boost::log::trivial::severity >= boost::log::trivial::info);
        else
            boost::log::core::get()->set_filter(boost::log::trivial::severity >= boost::log::trivial::debug);
    }
}
