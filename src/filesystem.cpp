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

#include <stdexcept>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/log/trivial.hpp>

#include "filesystem.h"

namespace lapis
{
    auto create_directory(const std::string& path) -> bool
    {
        try
        {
            auto p = boost::filesystem::path{path};
            if(boost::filesystem::exists(p))
            {
                if(boost::filesystem::is_directory(p))
                    return true;
                else
                    throw std::runtime_error(path + " exists but is not a directory.");
            }
            else
                return boost::filesystem::create_directories(p);
        }
        catch(const boost::filesystem::filesystem_error& err)
        {
            BOOST_LOG_TRIVIAL(fatal) << path << " could not be created: " << err.what();
            return false;
        }
    }

    auto join_path(const std::string& dir, const std::string& name) -> std::string
    {
        return (boost::filesystem::path{dir} / name).string();
    }
}
