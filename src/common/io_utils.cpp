#include "common/io_utils.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::trunc | ios::binary);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string() + " for writing");
    fout << content;
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string truncate_message(const string &text, size_t limit) {
    if (text.length() <= limit) return text;
    size_t end = limit;
    // 不要把多字节字符截成两半
    while (end > 0 && ((unsigned char)text[end] & 0xC0) == 0x80) --end;
    return text.substr(0, end) + "\n... (truncated)";
}

int count_entries_in_directory(const fs::path &dir) {
    if (!fs::is_directory(dir))
        return -1;
    return (int)distance(fs::directory_iterator(dir), fs::directory_iterator());
}

}  // namespace codejudge
