#include <glog/logging.h>
#include <signal.h>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/compiler.hpp"
#include "project/config.hpp"
#include "project/discovery.hpp"
#include "report/report.hpp"
#include "worker.hpp"
using namespace std;

void sigintHandler(int /* signum */) {
    atst::stop_workers();
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = 1;  // WARNING

    signal(SIGINT, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("atst options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("project", po::value<string>(), "project directory, every sub-directory of which is a solution")
        ("config", po::value<string>(), "configuration file, relative to the project directory")
        ("solution,s", po::value<string>(), "evaluate only the solution in the given sub-directory")
        ("jobs,j", po::value<unsigned>(), "number of solutions evaluated in parallel, default to the number of CPU cores")
        ("timeout", po::value<unsigned>(), "time limit of a single test case in milliseconds, overrides the configuration")
        ("format", po::value<string>()->default_value("text"), "report format: text or json")
        ("output,o", po::value<string>(), "write the report to the given file instead of stdout")
        ("work-dir", po::value<string>(), "set the directory to store compiled solutions. You can either pass it from environ WORKDIR")
        ("clamp-to-zero", "never report a negative score")
        ("no-penalty-on-compile-error", "do not apply analyser penalties to solutions that failed to compile")
        ("verbose,v", "print results of every test and analyser, and log every command")
        ("debug", "turn on the debug mode to keep the compiled solutions in the work directory.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("project", 1).add("config", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 2;
    }

    if (vm.count("help")) {
        cout << "atst: Automatic testing of student tasks" << endl
             << "Compiles every solution in the project directory, runs the configured tests and analysers, and reports the scores" << endl
             << "Usage: " << argv[0] << " [options] <project> <config>" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "atst 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("project") || !vm.count("config")) {
        cerr << "the project directory and the configuration file are required" << endl
             << endl;
        cerr << desc << endl;
        return 2;
    }

    atst::report_format format;
    if (vm["format"].as<string>() == "text") {
        format = atst::report_format::TEXT;
    } else if (vm["format"].as<string>() == "json") {
        format = atst::report_format::JSON;
    } else {
        cerr << "unrecognized report format " << vm["format"].as<string>() << endl
             << endl;
        cerr << desc << endl;
        return 2;
    }

    bool verbose = vm.count("verbose");
    if (verbose) FLAGS_minloglevel = 0;  // INFO

    if (vm.count("debug")) {
        atst::DEBUG = true;
    } else if (!atst::get_env("DEBUG", "").empty()) {
        atst::DEBUG = true;
    }

    if (vm.count("work-dir")) {
        atst::WORK_DIR = filesystem::path(vm.at("work-dir").as<string>());
    } else if (!atst::get_env("WORKDIR", "").empty()) {
        atst::WORK_DIR = filesystem::path(atst::get_env("WORKDIR", ""));
    } else {
        atst::WORK_DIR = filesystem::temp_directory_path() / "atst";
    }

    unsigned jobs = thread::hardware_concurrency();
    if (vm.count("jobs")) jobs = vm["jobs"].as<unsigned>();
    if (jobs == 0) jobs = 1;

    filesystem::path project(vm["project"].as<string>());
    CHECK(filesystem::is_directory(project))
        << "Project directory " << project << " does not exist";

    try {
        atst::project_config config = atst::load_config(project, vm["config"].as<string>());
        if (vm.count("timeout"))
            config.evaluation.timeout = chrono::milliseconds(vm["timeout"].as<unsigned>());
        if (vm.count("clamp-to-zero"))
            config.evaluation.scoring.clamp_to_zero = true;
        if (vm.count("no-penalty-on-compile-error"))
            config.evaluation.scoring.penalties_on_compile_error = false;

        atst::check_compiler(config.evaluation.compiler);

        vector<atst::solution> solutions;
        if (vm.count("solution"))
            solutions = atst::discover_solution(project, config.source, vm["solution"].as<string>());
        else
            solutions = atst::discover_solutions(project, config.source, config.exclude_dirs);
        LOG(INFO) << "Found " << solutions.size() << " solutions in " << project;

        auto results = atst::evaluate_solutions(solutions, config.evaluation, jobs);
        vector<atst::solution_report> reports;
        for (auto& result : results)
            if (result) reports.push_back(move(*result));

        if (vm.count("output")) {
            ofstream fout(vm["output"].as<string>());
            if (!fout)
                throw atst::environment_error("unable to write report to " + vm["output"].as<string>());
            atst::write_report(fout, reports, format, verbose);
        } else {
            atst::write_report(cout, reports, format, verbose);
        }

        if (atst::workers_stopped()) {
            LOG(ERROR) << "Received SIGINT, " << solutions.size() - reports.size() << " solutions were not evaluated";
            return EXIT_FAILURE;
        }
    } catch (atst::configuration_error& e) {
        LOG(ERROR) << e.what();
        return EXIT_FAILURE;
    } catch (atst::environment_error& e) {
        LOG(ERROR) << "Fatal error: " << e.what() << endl
                   << e;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
