#include <common/types.hpp>
#include <modal/beam_modal_solver.hpp>
#include <modal/boundary_condition.hpp>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>

#include <cmath>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    const common::BeamParams defaults;

    // Command-line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("output,o", po::value<std::string>()->default_value("beam_modes.json"), "Output JSON file with frequencies and mode shapes")
        ("boundary-condition,b", po::value<modal::BoundaryCondition>()->default_value(modal::BoundaryCondition::CLAMPED_FREE),
            "Boundary condition (free-free, clamped-free, clamped-pinned, clamped-sliding, clamped-clamped, pinned-pinned or 1-6)")
        ("count,n", po::value<int>()->default_value(10), "Number of modes, starting from mode 1")
        ("modes", po::value<std::vector<int>>()->multitoken(), "Explicit mode indices (overrides --count)")
        ("points,p", po::value<int>()->default_value(2001), "Number of sample points along the beam")
        ("youngs-modulus", po::value<double>()->default_value(defaults.E), "Young's modulus E (Pa)")
        ("area-moment", po::value<double>()->default_value(defaults.I), "Second moment of area I (m^4)")
        ("density", po::value<double>()->default_value(defaults.rho), "Density rho (kg/m^3)")
        ("area", po::value<double>()->default_value(defaults.A), "Cross-section area A (m^2)")
        ("length", po::value<double>()->default_value(defaults.L), "Beam length L (m)");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    common::BeamParams beam;
    beam.E = vm["youngs-modulus"].as<double>();
    beam.I = vm["area-moment"].as<double>();
    beam.rho = vm["density"].as<double>();
    beam.A = vm["area"].as<double>();
    beam.L = vm["length"].as<double>();
    auto bc = vm["boundary-condition"].as<modal::BoundaryCondition>();

    std::optional<modal::ModeSet> modes = std::nullopt;
    try {
        auto selection = vm.count("modes")
            ? modal::ModeSelection::indices(vm["modes"].as<std::vector<int>>())
            : modal::ModeSelection::first(vm["count"].as<int>());

        modal::BeamModalSolver solver(beam, bc, vm["points"].as<int>());
        modes = solver.solve(selection);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::ostringstream bc_name;
    bc_name << bc;
    std::cout << "Boundary condition: " << bc_name.str() << std::endl;

    nlohmann::json modes_json = nlohmann::json::array();
    for (int j = 0; j < modes->size(); ++j) {
        double frequency_hz = modes->omega(j) / (2.0 * M_PI);
        std::cout << "Mode " << modes->indices[j] << "     Natural Frequency = " << modes->omega(j)
                  << " rad/s (" << frequency_hz << " Hz)" << std::endl;

        const Eigen::VectorXd shape = modes->U.col(j);
        nlohmann::json mode;
        mode["index"] = modes->indices[j];
        mode["beta"] = modes->beta(j);
        mode["omega"] = modes->omega(j);
        mode["frequency_hz"] = frequency_hz;
        mode["shape"] = std::vector<double>(shape.data(), shape.data() + shape.size());
        modes_json.push_back(mode);
    }

    nlohmann::json data_json = {};
    data_json["positions"] = std::vector<double>(modes->x.data(), modes->x.data() + modes->x.size());
    data_json["modes"] = modes_json;
    data_json["summary"]["boundary_condition"] = bc_name.str();
    data_json["summary"]["beam"] = {
        {"E", beam.E}, {"I", beam.I}, {"rho", beam.rho}, {"A", beam.A}, {"L", beam.L}
    };
    data_json["summary"]["points"] = static_cast<int>(modes->x.size());

    // Write JSON to file
    auto output_file = vm["output"].as<std::string>();
    std::ofstream outFile(output_file);
    if (!outFile.is_open()) {
        std::cerr << "Error opening output file!" << std::endl;
        return 1;
    }
    outFile << data_json.dump(4); // Pretty-print with 4-space indentation
    outFile.close();
    std::cout << "Mode shapes written to " << output_file << std::endl;

    return 0;
}
