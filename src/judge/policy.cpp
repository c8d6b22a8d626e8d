#include "judge/policy.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace pysandbox {
using namespace std;
using namespace nlohmann;

const validation_policy &default_policy() {
    static const validation_policy policy = {
        {"os", "subprocess", "socket", "sys", "shutil", "pathlib", "glob", "tempfile",
         "multiprocessing", "threading", "ctypes", "importlib", "builtins", "pickle",
         "marshal", "shelve", "dbm", "sqlite3", "urllib", "http", "ftplib", "smtplib",
         "telnetlib", "ssl", "asyncio", "concurrent", "signal", "resource", "pty", "tty",
         "termios", "fcntl", "pipes", "posix", "pwd", "grp", "crypt", "spwd", "syslog",
         "commands", "popen2", "io", "inspect", "gc", "code", "codeop", "runpy",
         "selectors", "select", "mmap", "webbrowser", "_thread"},
        {"eval", "exec", "compile", "open", "__import__", "globals", "locals", "vars",
         "dir", "getattr", "setattr", "delattr", "hasattr", "breakpoint", "memoryview"},
        {"__class__", "__bases__", "__subclasses__", "__mro__", "__globals__", "__code__",
         "__builtins__", "__import__", "__loader__", "__spec__", "__dict__",
         "__getattribute__", "__closure__", "__func__", "__self__", "f_globals",
         "f_locals", "f_builtins", "gi_frame", "cr_frame", "tb_frame"}};
    return policy;
}

static void read_list(const json &j, const char *key, set<string> &target) {
    if (!j.count(key)) return;
    if (!j.at(key).is_array())
        throw config_error(fmt::format("policy key {} must be an array of strings", key));
    set<string> names;
    for (auto &item : j.at(key)) {
        if (!item.is_string() || item.get<string>().empty())
            throw config_error(fmt::format("policy key {} must be an array of strings", key));
        names.insert(item.get<string>());
    }
    target = move(names);
}

validation_policy load_policy(const filesystem::path &path) {
    string content;
    try {
        content = read_file_content(path);
    } catch (system_error &e) {
        throw config_error(fmt::format("cannot read policy file {}: {}", path.string(), e.what()));
    }

    json j;
    try {
        j = json::parse(content);
    } catch (json::exception &e) {
        throw config_error(fmt::format("policy file {} is not valid JSON: {}", path.string(), e.what()));
    }
    if (!j.is_object())
        throw config_error(fmt::format("policy file {} must contain a JSON object", path.string()));

    validation_policy policy = default_policy();
    read_list(j, "forbidden_modules", policy.forbidden_modules);
    read_list(j, "forbidden_builtins", policy.forbidden_builtins);
    read_list(j, "forbidden_attributes", policy.forbidden_attributes);

    LOG(INFO) << "Loaded validation policy from " << path << ": "
              << policy.forbidden_modules.size() << " modules, "
              << policy.forbidden_builtins.size() << " builtins, "
              << policy.forbidden_attributes.size() << " attributes";
    return policy;
}

}  // namespace pysandbox
