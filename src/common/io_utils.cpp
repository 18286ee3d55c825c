#include "common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace arbiter {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string assert_safe_path(const string &name) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != string::npos)
        throw invalid_argument("file name is not safe: " + name);
    return name;
}

}  // namespace arbiter
