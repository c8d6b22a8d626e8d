#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>

namespace pysandbox {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

optional<string> get_env(const string &key) {
    char *result = getenv(key.c_str());
    if (!result || !*result) return nullopt;
    return string(result);
}

vector<string> split_list(const string &text) {
    vector<string> items, result;
    boost::split(items, text, boost::is_any_of(","));
    for (auto &item : items) {
        boost::trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

filesystem::path find_executable(const string &name) {
    if (name.find('/') != string::npos) return name;

    for (auto &dir : split_list(boost::replace_all_copy(get_env("PATH", "/usr/bin:/bin"), ":", ","))) {
        filesystem::path candidate = filesystem::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return {};
}

}  // namespace pysandbox
