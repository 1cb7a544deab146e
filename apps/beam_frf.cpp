#include <common/types.hpp>
#include <frf/beam_frf.hpp>
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

namespace {

/// @brief Magnitude in dB of each FRF value
std::vector<double> magnitude_db(const Eigen::VectorXcd& h) {
    std::vector<double> db(h.size());
    for (Eigen::Index i = 0; i < h.size(); ++i) {
        db[i] = 20.0 * std::log10(std::abs(h(i)));
    }
    return db;
}

/// @brief Phase in degrees, unwrapped along the frequency axis
std::vector<double> phase_deg(const Eigen::VectorXcd& h) {
    std::vector<double> phase(h.size());
    double offset = 0.0;
    double previous = 0.0;
    for (Eigen::Index i = 0; i < h.size(); ++i) {
        double angle = std::arg(h(i));
        if (i > 0) {
            double jump = angle - previous;
            if (jump > M_PI) {
                offset -= 2.0 * M_PI;
            } else if (jump < -M_PI) {
                offset += 2.0 * M_PI;
            }
        }
        previous = angle;
        phase[i] = (angle + offset) * 180.0 / M_PI;
    }
    return phase;
}

} // namespace

int main(int argc, char* argv[]) {
    const common::BeamParams beam_defaults;
    const frf::BeamFrfConfig config_defaults;

    // Command-line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("output,o", po::value<std::string>()->default_value("beam_frf.json"), "Output JSON file with the FRF")
        ("boundary-condition,b", po::value<modal::BoundaryCondition>()->default_value(modal::BoundaryCondition::CLAMPED_FREE),
            "Boundary condition (free-free, clamped-free, clamped-pinned, clamped-sliding, clamped-clamped, pinned-pinned or 1-6)")
        ("x-in", po::value<double>()->default_value(config_defaults.x_in), "Excitation position (m)")
        ("x-out", po::value<double>()->default_value(config_defaults.x_out), "Response position (m)")
        ("f-min", po::value<double>()->default_value(config_defaults.f_min), "Lowest frequency (Hz)")
        ("f-max", po::value<double>()->default_value(config_defaults.f_max), "Highest frequency (Hz)")
        ("zeta,z", po::value<double>()->default_value(config_defaults.zeta), "Modal damping ratio")
        ("frequencies", po::value<int>()->default_value(config_defaults.num_frequencies), "Number of frequencies")
        ("mode-points", po::value<int>()->default_value(config_defaults.mode_points), "Samples per mode shape")
        ("max-modes", po::value<int>()->default_value(config_defaults.max_modes), "Maximum number of modes")
        ("youngs-modulus", po::value<double>()->default_value(beam_defaults.E), "Young's modulus E (Pa)")
        ("area-moment", po::value<double>()->default_value(beam_defaults.I), "Second moment of area I (m^4)")
        ("density", po::value<double>()->default_value(beam_defaults.rho), "Density rho (kg/m^3)")
        ("area", po::value<double>()->default_value(beam_defaults.A), "Cross-section area A (m^2)")
        ("length", po::value<double>()->default_value(beam_defaults.L), "Beam length L (m)");

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

    frf::BeamFrfConfig config;
    config.x_in = vm["x-in"].as<double>();
    config.x_out = vm["x-out"].as<double>();
    config.f_min = vm["f-min"].as<double>();
    config.f_max = vm["f-max"].as<double>();
    config.zeta = vm["zeta"].as<double>();
    config.num_frequencies = vm["frequencies"].as<int>();
    config.mode_points = vm["mode-points"].as<int>();
    config.max_modes = vm["max-modes"].as<int>();

    std::optional<frf::BeamFrf> result = std::nullopt;
    try {
        frf::BeamFrfAssembler assembler(beam, bc);
        result = assembler.assemble(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::ostringstream bc_name;
    bc_name << bc;
    std::cout << result->mode_count() << " modes contribute to the " << bc_name.str() << " FRF" << std::endl;

    nlohmann::json modes_json = nlohmann::json::array();
    for (int j = 0; j < result->mode_count(); ++j) {
        const Eigen::VectorXcd contribution = result->contributions.col(j);
        nlohmann::json mode;
        mode["index"] = j + 1;
        mode["natural_frequency"] = result->natural_frequencies(j);
        mode["magnitude_db"] = magnitude_db(contribution);
        mode["phase_deg"] = phase_deg(contribution);
        modes_json.push_back(mode);
    }

    nlohmann::json data_json = {};
    data_json["frequencies"] = std::vector<double>(result->frequencies.data(), result->frequencies.data() + result->frequencies.size());
    data_json["total"]["magnitude_db"] = magnitude_db(result->total);
    data_json["total"]["phase_deg"] = phase_deg(result->total);
    data_json["modes"] = modes_json;
    data_json["summary"]["boundary_condition"] = bc_name.str();
    data_json["summary"]["beam"] = {
        {"E", beam.E}, {"I", beam.I}, {"rho", beam.rho}, {"A", beam.A}, {"L", beam.L}
    };
    data_json["summary"]["x_in"] = config.x_in;
    data_json["summary"]["x_out"] = config.x_out;
    data_json["summary"]["zeta"] = config.zeta;

    // Write JSON to file
    auto output_file = vm["output"].as<std::string>();
    std::ofstream outFile(output_file);
    if (!outFile.is_open()) {
        std::cerr << "Error opening output file!" << std::endl;
        return 1;
    }
    outFile << data_json.dump(4); // Pretty-print with 4-space indentation
    outFile.close();
    std::cout << "FRF written to " << output_file << std::endl;

    return 0;
}
