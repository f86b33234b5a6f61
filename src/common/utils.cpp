#include "common/utils.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdlib>
#include <ctime>
#include <stdexcept>

namespace coderun {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string trim(const string &str) {
    return boost::algorithm::trim_copy(str);
}

vector<string> split_lines(const string &str) {
    vector<string> lines;
    if (str.empty()) return lines;
    boost::algorithm::split(lines, str, boost::is_any_of("\n"));
    for (auto &line : lines)
        if (!line.empty() && line.back() == '\r') line.pop_back();
    // "a\nb\n" 切分后最后会多出一个空行
    if (lines.size() > 1 && lines.back().empty()) lines.pop_back();
    return lines;
}

string shell_quote(const string &arg) {
    string result = "'";
    for (char c : arg) {
        if (c == '\'')
            result += "'\\''";
        else
            result += c;
    }
    result += '\'';
    return result;
}

string generate_id() {
    static thread_local boost::uuids::random_generator generator;
    return boost::lexical_cast<string>(generator());
}

string format_timestamp(const timestamp &time) {
    auto millis = chrono::duration_cast<chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    if (millis < 0) millis += 1000;
    time_t t = chrono::system_clock::to_time_t(time);
    tm utc;
    gmtime_r(&t, &utc);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    return fmt::format("{}.{:03}Z", buf, millis);
}

timestamp parse_timestamp(const string &text) {
    tm utc = {};
    int millis = 0;
    const char *rest = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &utc);
    if (!rest)
        throw invalid_argument("malformed timestamp " + text);
    if (*rest == '.') {
        string fraction;
        for (++rest; *rest >= '0' && *rest <= '9'; ++rest)
            if (fraction.size() < 3) fraction += *rest;
        while (fraction.size() < 3) fraction += '0';
        millis = boost::lexical_cast<int>(fraction);
    }
    time_t t = timegm(&utc);
    return chrono::system_clock::from_time_t(t) + chrono::milliseconds(millis);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace coderun
