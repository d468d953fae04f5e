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

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include <unistd.h>
#include <execinfo.h>

#include <boost/log/trivial.hpp>

#include "exception.h"
#include "fbp.h"
#include "filesystem.h"
#include "logging.h"
#include "program_options.h"
#include "resources.h"
#include "source.h"
#include "tiff_saver.h"

namespace
{
    [[noreturn]] auto signal_handler(int sig) -> void
    {
        void* array[10];
        auto size = backtrace(array, 10);

        BOOST_LOG_TRIVIAL(error) << "Signal " << sig;
        backtrace_symbols_fd(array, size, STDERR_FILENO);
        std::exit(EXIT_FAILURE);
    }

    auto run(const lapis::program_options& po) -> void
    {
        auto opts = lapis::make_fbp_options(po);

        if(!po.valid_angles_path.empty())
            opts.valid_angles = lapis::load_valid_angles(po.valid_angles_path);

        if(!po.mask_path.empty())
            opts.mask = lapis::load_mask(po.mask_path, po.cfg);

        const auto vectors = lapis::load_vectors(po.vectors_path);
        const auto res = lapis::make_compute_resources();

        if(!lapis::create_directory(po.output_path))
            throw std::runtime_error{"failed to create output directory at " + po.output_path};

        auto result = lapis::fbp_result{};
        if(po.complex_input)
            result = lapis::fbp(lapis::load_complex_sinogram(po.input_path, po.cfg), po.cfg, vectors, opts, res);
        else
            result = lapis::fbp(lapis::load_sinogram(po.input_path, po.cfg), po.cfg, vectors, opts, res);

        if(result.missing_wedge)
            BOOST_LOG_TRIVIAL(warning) << "The projection angles contain a missing wedge";

        auto saver = lapis::tiff_saver{};
        if(po.save_sinogram || po.only_filter_sinogram)
            saver.save(result.sinogram, lapis::join_path(po.output_path, po.prefix + "_sino"));

        if(!result.volume.empty())
            saver.save(result.volume, lapis::join_path(po.output_path, po.prefix));
    }
}

auto main(int argc, char** argv) -> int
{
    std::cout << "LAPIS - LAminography Projection Inversion Software" << std::endl;
    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGABRT, signal_handler);

    auto po = lapis::make_program_options(argc, argv);
    lapis::init_log(po.verbose);

    try
    {
        auto start = std::chrono::high_resolution_clock::now();

        run(po);

        auto stop = std::chrono::high_resolution_clock::now();

        auto duration = stop - start;
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
        auto minutes = std::chrono::duration_cast<std::chrono::minutes>(duration);

        BOOST_LOG_TRIVIAL(info) << "Program terminated. Time elapsed: "
                << minutes.count() << ":" << std::setfill('0') << std::setw(2) << seconds.count() % 60 << " minutes";
    }
    catch(const lapis::shape_mismatch& sm)
    {
        BOOST_LOG_TRIVIAL(fatal) << "main(): Invalid input: " << sm.what();
        BOOST_LOG_TRIVIAL(fatal) << "Aborting.";
        std::exit(EXIT_FAILURE);
    }
    catch(const lapis::reconstruction_error& re)
    {
        BOOST_LOG_TRIVIAL(fatal) << "main(): Reconstruction failed: " << re.what();
        BOOST_LOG_TRIVIAL(fatal) << "Aborting.";
        std::exit(EXIT_FAILURE);
    }
    catch(const std::invalid_argument& ia)
    {
        BOOST_LOG_TRIVIAL(fatal) << "main(): " << ia.what();
        BOOST_LOG_TRIVIAL(fatal) << "Aborting.";
        std::exit(EXIT_FAILURE);
    }
    catch(const std::runtime_error& err)
    {
        BOOST_LOG_TRIVIAL(fatal) << "main(): " << err.what();
        BOOST_LOG_TRIVIAL(fatal) << "Aborting.";
        std::exit(EXIT_FAILURE);
    }

    return 0;
}
