#include <common/types.hpp>
#include <response/response_curves.hpp>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>

#include <cmath>
#include <complex>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

/// @brief Response curves this tool can compute
enum class CurveKind { STEADY_STATE, TRANSMISSIBILITY, UNBALANCE, IMPULSE, STEP, SPECTRUM };

std::istream& operator>>(std::istream& is, CurveKind& kind) {
    std::string s;
    is >> s;
    if (s == "steady-state") {
        kind = CurveKind::STEADY_STATE;
    } else if (s == "transmissibility") {
        kind = CurveKind::TRANSMISSIBILITY;
    } else if (s == "unbalance") {
        kind = CurveKind::UNBALANCE;
    } else if (s == "impulse") {
        kind = CurveKind::IMPULSE;
    } else if (s == "step") {
        kind = CurveKind::STEP;
    } else if (s == "spectrum") {
        kind = CurveKind::SPECTRUM;
    } else {
        throw std::invalid_argument("Invalid CurveKind: " + s);
    }
    return is;
}

std::ostream& operator<<(std::ostream& os, const CurveKind& kind) {
    switch (kind) {
        case CurveKind::STEADY_STATE: os << "steady-state"; break;
        case CurveKind::TRANSMISSIBILITY: os << "transmissibility"; break;
        case CurveKind::UNBALANCE: os << "unbalance"; break;
        case CurveKind::IMPULSE: os << "impulse"; break;
        case CurveKind::STEP: os << "step"; break;
        case CurveKind::SPECTRUM: os << "spectrum"; break;
    }
    return os;
}

std::vector<double> to_vector(const Eigen::VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

/// @brief One JSON object per damping ratio with the magnitude and phase (deg) of its row
nlohmann::json complex_rows(const response::RatioResponse& curve) {
    nlohmann::json rows = nlohmann::json::array();
    for (Eigen::Index row = 0; row < curve.values.rows(); ++row) {
        std::vector<double> magnitude(curve.values.cols());
        std::vector<double> phase(curve.values.cols());
        for (Eigen::Index col = 0; col < curve.values.cols(); ++col) {
            magnitude[col] = std::abs(curve.values(row, col));
            phase[col] = std::arg(curve.values(row, col)) * 180.0 / M_PI;
        }
        rows.push_back({{"zeta", curve.zetas(row)}, {"magnitude", magnitude}, {"phase_deg", phase}});
    }
    return rows;
}

} // namespace

int main(int argc, char* argv[]) {
    // Command-line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("output,o", po::value<std::string>()->default_value("response_curves.json"), "Output JSON file with the curve")
        ("curve", po::value<CurveKind>()->default_value(CurveKind::STEADY_STATE), "Curve (steady-state, transmissibility, unbalance, impulse, step, spectrum)")
        ("zetas,z", po::value<std::vector<double>>()->multitoken()->default_value(std::vector<double>{0.1, 0.3, 0.8}, "0.1 0.3 0.8"), "Damping ratios")
        ("r-min", po::value<double>()->default_value(0.0), "Lowest frequency ratio")
        ("r-max", po::value<double>()->default_value(2.0), "Highest frequency ratio")
        ("mass,m", po::value<double>()->default_value(100.0), "Mass (kg)")
        ("damping,c", po::value<double>()->default_value(20.0), "Viscous damping (N*s/m)")
        ("stiffness,k", po::value<double>()->default_value(2000.0), "Stiffness (N/m)")
        ("force", po::value<double>()->default_value(10.0), "Impulse (N*s) or step force (N)")
        ("max-time", po::value<double>()->default_value(100.0), "End time (seconds)")
        ("unbalance-mass", po::value<double>()->default_value(0.5), "Unbalance mass m0 (kg)")
        ("eccentricity", po::value<double>()->default_value(0.1), "Unbalance eccentricity e (m)")
        ("dimensional", "Report the unbalance response in metres instead of m*X/(m0*e)")
        ("natural-frequency", po::value<double>()->default_value(10.0), "Natural frequency for the response spectrum (Hz)");

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

    auto kind = vm["curve"].as<CurveKind>();
    auto zetas = vm["zetas"].as<std::vector<double>>();
    double rmin = vm["r-min"].as<double>();
    double rmax = vm["r-max"].as<double>();

    nlohmann::json data_json = {};
    try {
        switch (kind) {
            case CurveKind::STEADY_STATE: {
                auto curve = response::steady_state_response(zetas, rmin, rmax);
                data_json["r"] = to_vector(curve.r);
                data_json["curves"] = complex_rows(curve);
                break;
            }
            case CurveKind::TRANSMISSIBILITY: {
                auto curve = response::transmissibility(zetas, rmin, rmax);
                data_json["r"] = to_vector(curve.r);
                data_json["curves"] = nlohmann::json::array();
                for (Eigen::Index row = 0; row < curve.zetas.size(); ++row) {
                    const Eigen::VectorXd displacement = curve.displacement.row(row).transpose();
                    const Eigen::VectorXd force = curve.force.row(row).transpose();
                    data_json["curves"].push_back({
                        {"zeta", curve.zetas(row)},
                        {"displacement", to_vector(displacement)},
                        {"force", to_vector(force)}
                    });
                }
                break;
            }
            case CurveKind::UNBALANCE: {
                response::UnbalanceParams unbalance{vm["mass"].as<double>(), vm["unbalance-mass"].as<double>(), vm["eccentricity"].as<double>()};
                bool normalized = vm.count("dimensional") == 0;
                auto curve = response::rotating_unbalance(unbalance, zetas, rmin, rmax, normalized);
                data_json["r"] = to_vector(curve.r);
                data_json["curves"] = complex_rows(curve);
                data_json["summary"]["normalized"] = normalized;
                break;
            }
            case CurveKind::IMPULSE:
            case CurveKind::STEP: {
                common::OscillatorParams params(vm["mass"].as<double>(), vm["damping"].as<double>(), vm["stiffness"].as<double>());
                double force = vm["force"].as<double>();
                double max_time = vm["max-time"].as<double>();
                auto curve = (kind == CurveKind::IMPULSE)
                    ? response::impulse_response(params, force, max_time)
                    : response::step_response(params, force, max_time);
                data_json["time"] = to_vector(curve.t);
                data_json["displacement"] = to_vector(curve.x);
                data_json["summary"]["oscillator"] = {{"mass", params.m}, {"damping", params.c}, {"stiffness", params.k}};
                data_json["summary"]["force"] = force;
                break;
            }
            case CurveKind::SPECTRUM: {
                double f = vm["natural-frequency"].as<double>();
                auto curve = response::response_spectrum(f);
                data_json["ramp_time"] = to_vector(curve.t);
                data_json["spectrum"] = to_vector(curve.x);
                data_json["summary"]["natural_frequency"] = f;
                break;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::ostringstream kind_name;
    kind_name << kind;
    data_json["summary"]["curve"] = kind_name.str();

    // Write JSON to file
    auto output_file = vm["output"].as<std::string>();
    std::ofstream outFile(output_file);
    if (!outFile.is_open()) {
        std::cerr << "Error opening output file!" << std::endl;
        return 1;
    }
    outFile << data_json.dump(4); // Pretty-print with 4-space indentation
    outFile.close();
    std::cout << kind_name.str() << " curve written to " << output_file << std::endl;

    return 0;
}
