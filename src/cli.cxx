#include "fitsmeta/cli.hxx"

// Local headers
#include "fitsmeta/json_report.hxx"
#include "fitsmeta/logging.hxx"
#include "fitsmeta/normalize.hxx"
#include "fitsmeta_filesystem.hxx"

// Third-party headers
#include <boost/program_options.hpp>

// Standard library
#include <ostream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace fitsmeta {
namespace {
void write_usage(std::ostream& stream, const std::string& program,
                 const po::options_description& options) {
    stream << "Usage: " << program << " [options] [--] <file.fits>" << std::endl
           << options;
}

// File arguments in command-line order. Unregistered single-dash tokens such as
// "-dark.fits" are file names; unknown long options are errors.
std::vector<std::string> file_arguments(const po::parsed_options& parsed) {
    std::vector<std::string> result;
    for (const po::option& option : parsed.options) {
        if (option.unregistered) {
            const std::string& token = option.original_tokens.front();
            if (token.compare(0, 2, "--") == 0) throw po::unknown_option(token);
            result.push_back(token);
        } else if (option.string_key == "file") {
            result.insert(result.end(), option.value.begin(), option.value.end());
        }
    }
    return result;
}
}  // namespace

int run(int argc, char const* const* argv, std::ostream& out, std::ostream& err) {
    std::string program = "fitsmeta";
    if (argc > 0 && argv[0] != nullptr && *argv[0] != '\0') {
        program = fs::path(argv[0]).filename().string();
    }

    po::options_description visible("Options");
    visible.add_options()
        ("help,h", "print this message and exit")
        ("verbose,v", "log progress to standard error")
        ("indent", po::value<int>()->default_value(2),
         "JSON indentation width; negative prints compact JSON");

    po::options_description hidden;
    hidden.add_options()("file", po::value<std::vector<std::string>>(),
                         "FITS file to describe");

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("file", -1);

    po::variables_map vm;
    std::vector<std::string> files;
    try {
        po::parsed_options parsed = po::command_line_parser(argc, argv)
                                            .options(all)
                                            .positional(positional)
                                            .allow_unregistered()
                                            .run();
        files = file_arguments(parsed);
        po::store(parsed, vm);
        po::notify(vm);
    } catch (const po::error& e) {
        err << program << ": " << e.what() << std::endl;
        write_usage(err, program, visible);
        return 1;
    }

    if (vm.count("help")) {
        write_usage(out, program, visible);
        return 0;
    }
    if (files.empty()) {
        write_usage(out, program, visible);
        return 1;
    }

    set_log_level(vm.count("verbose") ? spdlog::level::debug
                                      : log_level_from_env(spdlog::level::warn));
    if (files.size() > 1) {
        logger()->info("describing {}; ignoring {} more file arguments", files.front(),
                       files.size() - 1);
    }

    // Failures are reported inside the JSON document; the exit status stays 0.
    Report report = normalize(files.front());
    write_report(out, report, vm["indent"].as<int>());
    return 0;
}
}  // namespace fitsmeta
