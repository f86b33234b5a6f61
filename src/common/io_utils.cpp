#include "common/io_utils.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace coderun {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

/**
 * @brief 计算 UTF-8 字符从 i 开始占用多少字节
 * @return 字节数，若 i 处不是合法的 UTF-8 字符则返回 0
 */
static size_t utf8_sequence_length(const string &s, size_t i) {
    unsigned char c = s[i];
    size_t n;
    if (c <= 0x7f)
        return 1;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0)
        n = 1;  // 110bbbbb
    else if (c == 0xed && i + 1 < s.length() && ((unsigned char)s[i + 1] & 0xa0) == 0xa0)
        return 0;  // U+d800 to U+dfff
    else if ((c & 0xF0) == 0xE0)
        n = 2;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0)
        n = 3;  // 11110bbb
    else
        return 0;
    for (size_t j = 1; j <= n; ++j) {  // n bytes matching 10bbbbbb follow ?
        if (i + j >= s.length() || ((unsigned char)s[i + j] & 0xC0) != 0x80)
            return 0;
    }
    return n + 1;
}

string sanitize_utf8(const string &s) {
    string result;
    result.reserve(s.length());
    for (size_t i = 0; i < s.length();) {
        size_t len = utf8_sequence_length(s, i);
        if (len == 0) {
            result += '?';
            ++i;
        } else {
            result.append(s, i, len);
            i += len;
        }
    }
    return result;
}

string truncate_output(const string &s, size_t limit) {
    if (s.size() <= limit) return s;
    size_t cut = limit;
    // 不要把一个 UTF-8 字符截成两半
    for (int k = 0; k < 3 && cut > 0 && ((unsigned char)s[cut] & 0xC0) == 0x80; ++k) --cut;
    return s.substr(0, cut) + fmt::format("\n[output truncated: {} bytes omitted]\n", s.size() - cut);
}

fs::path create_unique_directory(const fs::path &root) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path dir = root / uuid;
    fs::create_directories(dir);
    return dir;
}

bool remove_directory_quietly(const fs::path &dir) noexcept {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(ERROR) << "Unable to delete directory " << dir << ": " << ec.message();
        return false;
    }
    return true;
}

}  // namespace coderun
