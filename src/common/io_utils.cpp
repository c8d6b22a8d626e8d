#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"

namespace pysandbox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw system_error(errno, generic_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, generic_category(), "unable to create " + path.string());
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout) throw system_error(errno, generic_category(), "unable to write " + path.string());
}

scratch_directory::scratch_directory(const fs::path &root) {
    string templ = (root / "pysandbox-XXXXXX").string();
    // mkdtemp creates the directory with mode 0700
    if (!mkdtemp(templ.data()))
        throw sandbox_error("unable to create scratch directory under " + root.string() + ": " + strerror(errno));
    dir = templ;
}

scratch_directory::scratch_directory(scratch_directory &&other) : dir(move(other.dir)) {
    other.dir.clear();
}

scratch_directory::~scratch_directory() {
    release();
}

const fs::path &scratch_directory::path() const {
    return dir;
}

bool scratch_directory::release() {
    if (dir.empty()) return true;

    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        // the child may have revoked permissions on files it created
        for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
        ec.clear();
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, ec);
        ec.clear();
        fs::remove_all(dir, ec);
    }
    if (ec) {
        LOG(WARNING) << "unable to remove scratch directory " << dir << ": " << ec.message();
        return false;
    }
    dir.clear();
    return true;
}

}  // namespace pysandbox
