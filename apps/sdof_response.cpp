#include <common/types.hpp>
#include <sdof/solvers.hpp>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    // Command-line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("output,o", po::value<std::string>()->default_value("sdof_response.json"), "Output JSON file with the response samples")
        ("method", po::value<sdof::SdofMethod>()->default_value(sdof::SdofMethod::RK4), "Solution method (euler, rk4, analytical, free, forced, forced-analytical, step)")
        ("mass,m", po::value<double>()->default_value(1.0), "Mass (kg)")
        ("damping,c", po::value<double>()->default_value(0.1), "Viscous damping (N*s/m)")
        ("stiffness,k", po::value<double>()->default_value(1.0), "Stiffness (N/m)")
        ("x0", po::value<double>()->default_value(1.0), "Initial displacement (m)")
        ("v0", po::value<double>()->default_value(0.0), "Initial velocity (m/s)")
        ("steps,n", po::value<int>()->default_value(8), "Number of steps (euler, rk4, analytical)")
        ("timestep,t", po::value<double>()->default_value(0.05), "Step size (seconds) (euler, rk4, analytical)")
        ("max-time", po::value<double>()->default_value(10.0), "End time (seconds) (free, forced, forced-analytical, step)")
        ("force-amplitude", po::value<double>()->default_value(10.0), "Forcing amplitude F0 (N) (forced, forced-analytical, step)")
        ("drive-frequency", po::value<double>()->default_value(0.5), "Drive frequency (rad/s) (forced, forced-analytical)")
        ("sample-spacing", po::value<double>()->default_value(1.25e-4), "Sample spacing (seconds) (forced-analytical)");

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

    auto method = vm["method"].as<sdof::SdofMethod>();
    common::InitialConditions ic{vm["x0"].as<double>(), vm["v0"].as<double>()};

    common::TimeSeries series;
    nlohmann::json summary = {};
    try {
        common::OscillatorParams params(vm["mass"].as<double>(), vm["damping"].as<double>(), vm["stiffness"].as<double>());
        sdof::ForcingParams forcing{vm["force-amplitude"].as<double>(), vm["drive-frequency"].as<double>()};
        int n = vm["steps"].as<int>();
        double dt = vm["timestep"].as<double>();
        double max_time = vm["max-time"].as<double>();

        switch (method) {
            case sdof::SdofMethod::EULER:
                series = sdof::euler_response(params, ic, n, dt);
                break;
            case sdof::SdofMethod::RK4:
                series = sdof::rk4_response(params, ic, n, dt);
                break;
            case sdof::SdofMethod::ANALYTICAL:
                series = sdof::analytical_response(params, ic, n, dt);
                break;
            case sdof::SdofMethod::FREE:
                series = sdof::free_response(params, ic, max_time).series;
                break;
            case sdof::SdofMethod::FORCED:
                series = sdof::forced_response(params, ic, forcing, max_time);
                break;
            case sdof::SdofMethod::FORCED_ANALYTICAL:
                series = sdof::forced_analytical(params, ic, forcing, max_time, vm["sample-spacing"].as<double>());
                break;
            case sdof::SdofMethod::STEP:
                series = sdof::step_forced_response(params, ic, forcing.amplitude, max_time);
                break;
        }

        // Diagnostic printout
        auto props = sdof::sdof_properties(params, ic);
        std::ostringstream regime;
        regime << props.regime;
        std::cout << "The natural frequency is " << props.natural_frequency << " rad/s." << std::endl;
        std::cout << "The damping ratio is " << props.damping_ratio << " (" << regime.str() << ")" << std::endl;
        if (props.damped_frequency.has_value()) {
            std::cout << "The damped natural frequency is " << props.damped_frequency.value() << " rad/s." << std::endl;
        }

        std::ostringstream method_name;
        method_name << method;
        summary["method"] = method_name.str();
        summary["oscillator"]["mass"] = params.m;
        summary["oscillator"]["damping"] = params.c;
        summary["oscillator"]["stiffness"] = params.k;
        summary["oscillator"]["natural_frequency"] = props.natural_frequency;
        summary["oscillator"]["damping_ratio"] = props.damping_ratio;
        summary["oscillator"]["regime"] = regime.str();
        if (props.damped_frequency.has_value()) {
            summary["oscillator"]["damped_frequency"] = props.damped_frequency.value();
        }
        if (props.amplitude.has_value()) {
            summary["oscillator"]["amplitude"] = props.amplitude.value();
        }
        summary["initial_conditions"]["x0"] = ic.x0;
        summary["initial_conditions"]["v0"] = ic.v0;
        if (method == sdof::SdofMethod::FORCED || method == sdof::SdofMethod::FORCED_ANALYTICAL) {
            summary["forcing"]["amplitude"] = forcing.amplitude;
            summary["forcing"]["drive_frequency"] = forcing.drive_frequency;
        } else if (method == sdof::SdofMethod::STEP) {
            summary["forcing"]["amplitude"] = forcing.amplitude;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // JSON array to store response samples
    nlohmann::json points_json = nlohmann::json::array();
    for (int i = 0; i < series.size(); ++i) {
        nlohmann::json point;
        point["time"] = series.t(i);
        point["state"] = {series.x(i), series.v(i)};
        points_json.push_back(point);
    }

    nlohmann::json data_json = {};
    data_json["points"] = points_json;
    data_json["summary"] = summary;

    // Write JSON to file
    auto output_file = vm["output"].as<std::string>();
    std::ofstream outFile(output_file);
    if (!outFile.is_open()) {
        std::cerr << "Error opening output file!" << std::endl;
        return 1;
    }
    outFile << data_json.dump(4); // Pretty-print with 4-space indentation
    outFile.close();
    std::cout << series.size() << " response samples written to " << output_file << std::endl;

    return 0;
}
