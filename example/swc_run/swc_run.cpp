#include <cstddef>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <cellsim/circuit.hpp>
#include <cellsim/csimexcept.hpp>
#include <cellsim/run_concurrently.hpp>
#include <cellsim/stimulus.hpp>

#include <cellsimio/jsonio.hpp>
#include <cellsimio/swcio.hpp>

// Simulate every cell in an SWC file, with a 0.5 ms, 0.2 nA current pulse
// into each soma at 1 ms, and print the somatic membrane potential.
//
// usage: swc-run SWCFILE [PARAMFILE]

int main(int argc, char** argv) {
    if (argc<2 || argc>3) {
        std::cerr << "usage: " << argv[0] << " SWCFILE [PARAMFILE]\n";
        return 1;
    }

    try {
        csim::circuit_parameters params;
        if (argc==3) {
            std::ifstream fid(argv[2]);
            if (!fid) throw csim::file_not_found_error(argv[2]);
            params = cellsimio::load_circuit_parameters(fid);
        }
        params.simulation.sample_interval = 0.1;

        auto data = cellsimio::load_swc(argv[1]);
        auto set = csim::build_circuits(data.records(), params);

        for (const auto& w: set.warnings) {
            std::cerr << "warning: " << w << "\n";
        }

        for (auto& c: set.circuits) {
            c.set_stimulus(csim::i_clamp(0, 1.0, 0.5, 0.2));
        }

        auto errors = csim::run_concurrently(set.circuits, csim::default_thread_count());

        for (std::size_t i = 0; i<set.circuits.size(); ++i) {
            const auto& c = set.circuits[i];
            std::cout << fmt::format("circuit {}: {} compartments, source id {}\n",
                                     i, c.compartments().size(), c.morphology()[0].source_id);

            if (errors[i]) {
                try {
                    std::rethrow_exception(errors[i]);
                }
                catch (std::exception& e) {
                    std::cerr << fmt::format("circuit {} failed: {}\n", i, e.what());
                }
                continue;
            }

            const auto& trace = c.trace();
            std::cout << "      t,       Um\n";
            for (std::size_t ix = 0; ix<trace.n_sample(); ++ix) {
                std::cout << fmt::format("{:7.3f}, {:-8.4f}\n", trace.time[ix], trace.voltage[0][ix]);
            }
        }
    }
    catch (std::exception& e) {
        std::cerr << "caught exception: " << e.what() << "\n";
        return -2;
    }
}
