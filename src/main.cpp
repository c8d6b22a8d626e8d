#include <glog/logging.h>
#include <signal.h>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include "common/cancellation.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"
#include "config.hpp"
#include "judge/executor.hpp"
#include "judge/grader.hpp"
#include "judge/validator.hpp"
#include "server/protocol.hpp"
#include "worker.hpp"
using namespace std;
using namespace pysandbox;

const int E_SUCCESS = 0;
const int E_FAILURE = 1;
const int E_INTERNAL_ERROR = 2;

static cancellation_token *shutdown_token = nullptr;

static void shutdown_handler(int /* signum */) {
    if (shutdown_token) shutdown_token->cancel();
}

static void install_shutdown_handler(cancellation_token &token) {
    shutdown_token = &token;

    struct sigaction sigact;
    sigact.sa_handler = shutdown_handler;
    // no SA_RESTART: a blocking read of the batch input returns on the signal
    sigact.sa_flags = 0;
    sigemptyset(&sigact.sa_mask);
    CHECK(sigaction(SIGINT, &sigact, nullptr) == 0) << "installing SIGINT handler";
    CHECK(sigaction(SIGTERM, &sigact, nullptr) == 0) << "installing SIGTERM handler";
}

static string read_input(const boost::program_options::variables_map &vm, const char *option) {
    if (vm.count(option)) return read_file_content(vm[option].as<string>());
    ostringstream buffer;
    buffer << cin.rdbuf();
    return buffer.str();
}

static void print(const nlohmann::json &j) {
    cout << protocol::dump(j) << endl;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("pysandbox options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "validate, execute, grade, batch, limits or policy")
        ("file,f", po::value<string>(), "read the Python source from file instead of stdin (validate, execute)")
        ("stdin-file,i", po::value<string>(), "feed file to the standard input of the program (execute)")
        ("request,r", po::value<string>(), "read the grade request JSON from file instead of stdin (grade)")
        ("workers,w", po::value<size_t>(), "number of worker threads (batch), default to the number of cores. You can either pass it from environ SANDBOX_WORKERS")
        ("cpu-time,t", po::value<double>(), "default CPU time limit in seconds")
        ("wall-time,T", po::value<double>(), "default wall clock time limit in seconds")
        ("memory-limit,m", po::value<int64_t>(), "default address space limit in bytes")
        ("output-limit", po::value<int64_t>(), "default cap of captured stdout and stderr in bytes, each")
        ("open-files", po::value<int>(), "default limit of open file descriptors")
        ("processes", po::value<int>(), "default limit of processes")
        ("file-limit", po::value<int64_t>(), "default limit of the size of written files in bytes")
        ("policy", po::value<string>(), "JSON file replacing the built-in deny-lists. You can either pass it from environ SANDBOX_POLICY_FILE")
        ("python", po::value<string>(), "Python interpreter running submissions. You can either pass it from environ SANDBOX_PYTHON")
        ("scratch-dir", po::value<string>(), "directory holding the per-execution scratch directories. You can either pass it from environ SANDBOX_SCRATCH_DIR")
        ("reveal-hidden", "keep input and output of hidden test cases in grade responses")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    pos.add("command", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return E_FAILURE;
    }

    if (vm.count("version")) {
        cout << "pysandbox 1.0" << endl;
        return E_SUCCESS;
    }

    if (vm.count("help") || !vm.count("command")) {
        cout << "pysandbox: validate, execute and grade untrusted Python submissions" << endl
             << "Usage: " << argv[0] << " <command> [options]" << endl;
        cout << desc << endl;
        return vm.count("help") ? E_SUCCESS : E_FAILURE;
    }

    string command = vm["command"].as<string>();

    sandbox_config config;
    validation_policy policy;
    try {
        config = load_config_from_env();

        if (vm.count("cpu-time")) config.default_limits.cpu_time_seconds = vm["cpu-time"].as<double>();
        if (vm.count("wall-time")) config.default_limits.wall_clock_seconds = vm["wall-time"].as<double>();
        if (vm.count("memory-limit")) config.default_limits.max_memory_bytes = vm["memory-limit"].as<int64_t>();
        if (vm.count("output-limit")) config.default_limits.max_output_bytes = vm["output-limit"].as<int64_t>();
        if (vm.count("open-files")) config.default_limits.max_open_files = vm["open-files"].as<int>();
        if (vm.count("processes")) config.default_limits.max_processes = vm["processes"].as<int>();
        if (vm.count("file-limit")) config.default_limits.max_file_bytes = vm["file-limit"].as<int64_t>();
        config.fit_ceilings();
        if (vm.count("workers")) config.workers = vm["workers"].as<size_t>();
        if (vm.count("policy")) config.policy_file = filesystem::path(vm["policy"].as<string>());
        if (vm.count("python")) config.python_executable = vm["python"].as<string>();
        if (vm.count("scratch-dir")) config.scratch_root = vm["scratch-dir"].as<string>();
        config.verify();

        policy = config.policy_file ? load_policy(*config.policy_file) : default_policy();
    } catch (config_error &e) {
        cerr << "configuration error: " << e.what() << endl;
        return E_FAILURE;
    }

    if (command == "limits") {
        print(protocol::limits_response(config));
        return E_SUCCESS;
    }
    if (command == "policy") {
        print(protocol::policy_response(policy));
        return E_SUCCESS;
    }
    if (command != "validate" && command != "execute" && command != "grade" && command != "batch") {
        cerr << "unknown command " << command << endl
             << endl;
        cerr << desc << endl;
        return E_FAILURE;
    }

    python_runtime python;
    cancellation_token cancel;
    install_shutdown_handler(cancel);

    validator check(policy);
    sandbox_executor exec(config);

    try {
        if (command == "validate") {
            print(protocol::validation_response(check.inspect(read_input(vm, "file"))));
            return E_SUCCESS;
        }

        if (command == "execute") {
            execution_request request;
            request.source = read_input(vm, "file");
            if (vm.count("stdin-file")) request.stdin_data = read_file_content(vm["stdin-file"].as<string>());
            request.limits = config.default_limits;

            // the command line never runs code the validator rejects
            execution_result result;
            auto violations = check.validate(request.source);
            if (!violations.empty()) {
                result.outcome = outcome::REJECTED;
                result.violations = move(violations);
            } else {
                result = exec.execute(request, &cancel);
            }
            print(protocol::execution_response(result));
            return result.outcome == outcome::SANDBOX_ERROR ? E_INTERNAL_ERROR : E_SUCCESS;
        }

        if (command == "grade") {
            auto request = protocol::parse_grade_request(nlohmann::json::parse(read_input(vm, "request")));
            grader g(check, exec, config.retry_backoff);
            auto submit = g.grade(request.source, request.test_cases,
                                  request.limits.apply(config.default_limits), &cancel);
            print(protocol::submission_response(submit, request, vm.count("reveal-hidden") > 0));

            bool sandbox_failed = submit.status == submission_status::ERRORED && !submit.test_results.empty() &&
                                  submit.test_results.back().result.outcome == outcome::SANDBOX_ERROR;
            return sandbox_failed ? E_INTERNAL_ERROR : E_SUCCESS;
        }

        // batch
        mutex out_mutex;
        worker_context ctx = {check, exec, config, &cancel, vm.count("reveal-hidden") > 0, cout, out_mutex};
        auto summary = run_batch(cin, config.workers, ctx);
        if (summary.sandbox_errors > 0) return E_INTERNAL_ERROR;
        return summary.cancelled ? E_FAILURE : E_SUCCESS;
    } catch (nlohmann::json::exception &e) {
        cerr << "malformed request: " << e.what() << endl;
        return E_FAILURE;
    } catch (invalid_argument &e) {
        cerr << "malformed request: " << e.what() << endl;
        return E_FAILURE;
    } catch (system_error &e) {
        cerr << e.what() << endl;
        return E_FAILURE;
    } catch (execution_cancelled &e) {
        cerr << e.what() << endl;
        return E_FAILURE;
    } catch (sandbox_error &e) {
        LOG(ERROR) << "Sandbox error: " << e;
        cerr << "internal error: " << e.what() << endl;
        return E_INTERNAL_ERROR;
    }
}
