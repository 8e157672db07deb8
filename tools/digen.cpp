/// digen command line: read a declaration snapshot, write the generated
/// constructor fragments and registration entry point, print diagnostics.
///
///   digen --input snapshot.yaml --output gen/ [--config digen.yaml]
///
/// Exit status: 0 on success, 1 when an error-level diagnostic was
/// reported, 2 when the run could not start (bad options or snapshot).

#include <digen.hpp>
#include <digen/log.hpp>

#include <boost/program_options.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

void write_source(const fs::path& directory, const digen::generated_source& source) {
    const auto path = directory / source.path;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open " + path.string() + " for writing");
    }
    out << source.content;
    if (!out) {
        throw std::runtime_error("failed writing " + path.string());
    }
    DIGEN_LOG_DEBUG << "Wrote " << path.string();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    po::options_description desc("Allowed options");
    desc.add_options()
        ("input,i", po::value<std::string>(), "Declaration snapshot (YAML)")
        ("output,o", po::value<std::string>()->default_value("."), "Output directory")
        ("config,c", po::value<std::string>(), "Options file (YAML)")
        ("log-level", po::value<std::string>()->default_value("warning"),
         "trace, debug, info, warning, error or fatal")
        ("help,h", "Print help information")
    ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error parsing options: " << e.what() << "\n" << desc << std::endl;
        return 2;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    auto level = digen::log::level_from_string(vm["log-level"].as<std::string>());
    if (!level) {
        std::cerr << "Unknown log level: " << vm["log-level"].as<std::string>() << std::endl;
        return 2;
    }
    digen::log::init(*level);

    if (!vm.count("input")) {
        std::cerr << "Missing --input\n" << desc << std::endl;
        return 2;
    }

    digen::generation_result result;
    try {
        digen::analysis_options options;
        if (vm.count("config")) {
            options = digen::load_options(vm["config"].as<std::string>());
        }
        auto snapshot = digen::load_snapshot(vm["input"].as<std::string>());
        result = digen::generator(std::move(options)).run(snapshot);

        const fs::path output = vm["output"].as<std::string>();
        fs::create_directories(output);
        for (auto& source : result.sources) {
            write_source(output, source);
        }
    } catch (const digen::digen_error& e) {
        DIGEN_LOG_FATAL << e.full_diagnostic();
        std::cerr << "digen: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        DIGEN_LOG_FATAL << e.what();
        std::cerr << "digen: " << e.what() << std::endl;
        return 2;
    }

    for (auto& d : result.diagnostics) {
        std::cerr << d.to_string() << "\n";
        if (!d.detail.empty()) std::cerr << d.detail << "\n";
    }
    return result.has_errors() ? 1 : 0;
}
