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

#include <functional>
#include <locale>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <tiffio.h>

#include "array.h"
#include "tiff_saver.h"

namespace lapis
{
    namespace
    {
        template <class T, bool = std::is_integral<T>::value, bool = std::is_unsigned<T>::value> struct sample_format {};
        template <class T> struct sample_format<T, true, true> { static constexpr auto value = SAMPLEFORMAT_UINT; };
        template <class T> struct sample_format<T, true, false> { static constexpr auto value = SAMPLEFORMAT_INT; };
        template <> struct sample_format<float> { static constexpr auto value = SAMPLEFORMAT_IEEEFP; };

        template <class T> struct bits_per_sample { static constexpr auto value = (sizeof(T) * 8); };

        auto timestamp() -> std::string
        {
            auto&& ss = std::stringstream{};
            // the locale will take ownership so plain new is okay here
            auto output_facet = new boost::posix_time::time_facet{"%Y:%m:%d %H:%M:%S"};
            ss.imbue(std::locale{std::locale::classic(), output_facet});
            ss << boost::posix_time::second_clock::local_time();
            return ss.str();
        }
    }

    auto tiff_saver::save(const array3d<float>& a, const std::string& path) const -> void
    {
        if(a.loc != memory_location::host)
            throw std::runtime_error{"tiff_saver::save() needs host data"};

        auto full_path = path;
        full_path.append(".tif");

        auto tif = std::unique_ptr<TIFF, std::function<void(TIFF*)>>{TIFFOpen(full_path.c_str(), "w8"), [](TIFF* p) { TIFFClose(p); }};
        if(tif == nullptr)
            throw std::runtime_error{"tiff_saver::save() failed to open " + full_path + " for writing"};

        const auto date = timestamp();
        auto tifp = tif.get();
        for(auto i = 0u; i < a.dim_z; ++i)
        {
            TIFFSetField(tifp, TIFFTAG_IMAGEWIDTH, a.dim_x);
            TIFFSetField(tifp, TIFFTAG_IMAGELENGTH, a.dim_y);
            TIFFSetField(tifp, TIFFTAG_BITSPERSAMPLE, bits_per_sample<float>::value);
            TIFFSetField(tifp, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
            TIFFSetField(tifp, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_MINISBLACK);
            TIFFSetField(tifp, TIFFTAG_SAMPLESPERPIXEL, 1);
            TIFFSetField(tifp, TIFFTAG_SOFTWARE, "LAPIS");
            TIFFSetField(tifp, TIFFTAG_DATETIME, date.c_str());
            TIFFSetField(tifp, TIFFTAG_SAMPLEFORMAT, sample_format<float>::value);
            TIFFSetField(tifp, TIFFTAG_PAGENUMBER, i, a.dim_z);

            auto slice_ptr = a.buf.get() + i * a.slice_size();
            for(auto row = 0u; row < a.dim_y; ++row)
            {
                if(TIFFWriteScanline(tifp, reinterpret_cast<void*>(const_cast<float*>(slice_ptr)), row) != 1)
                    throw std::runtime_error{"tiff_saver::save() failed to write row " + std::to_string(row)
                                             + " of slice " + std::to_string(i) + " to " + full_path};
                slice_ptr += a.dim_x;
            }

            if(TIFFWriteDirectory(tifp) != 1)
                throw std::runtime_error{"tiff_saver::save() encountered an I/O error while writing to " + full_path};
        }
    }
}
