#include "engine/policy_audit.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <regex>
#include <set>
#include "common/utils.hpp"

namespace coderun {
using namespace std;

enum class import_syntax {
    NONE,
    PYTHON,
    JAVASCRIPT,
    JAVA,
    C_INCLUDE
};

static import_syntax syntax_of(const string &language) {
    string lang = boost::to_lower_copy(language);
    if (lang == "python" || lang == "python3") return import_syntax::PYTHON;
    if (lang == "javascript" || lang == "typescript" || lang == "node") return import_syntax::JAVASCRIPT;
    if (lang == "java") return import_syntax::JAVA;
    if (lang == "c" || lang == "cpp" || lang == "c++") return import_syntax::C_INCLUDE;
    return import_syntax::NONE;
}

static void extract_python(const string &line, vector<string> &imports) {
    static regex import_matcher(R"(^\s*import\s+(.+)$)");
    static regex from_matcher(R"(^\s*from\s+([\w\.]+)\s+import\b)");
    smatch matches;
    if (regex_search(line, matches, from_matcher)) {
        imports.push_back(matches[1].str());
    } else if (regex_search(line, matches, import_matcher)) {
        // import a.b as c, d
        string list = matches[1].str();
        auto comment = list.find('#');
        if (comment != string::npos) list = list.substr(0, comment);
        vector<string> names;
        boost::split(names, list, boost::is_any_of(",;"));
        for (auto &name : names) {
            vector<string> parts;
            string trimmed = trim(name);
            boost::split(parts, trimmed, boost::is_space(), boost::token_compress_on);
            if (!parts.empty() && !parts[0].empty()) imports.push_back(parts[0]);
        }
    }
}

static void extract_javascript(const string &line, vector<string> &imports) {
    static regex require_matcher(R"(\brequire\s*\(\s*['"`]([^'"`]+)['"`]\s*\))");
    static regex import_matcher(R"(^\s*import\s+(?:[^'"]*?\s+from\s+)?['"]([^'"]+)['"])");
    static regex dynamic_import_matcher(R"(\bimport\s*\(\s*['"`]([^'"`]+)['"`]\s*\))");

    auto add = [&](string name) {
        if (boost::starts_with(name, "node:")) name = name.substr(5);
        imports.push_back(name);
    };

    smatch matches;
    if (regex_search(line, matches, import_matcher)) add(matches[1].str());
    for (auto *matcher : {&require_matcher, &dynamic_import_matcher}) {
        for (sregex_iterator it(line.begin(), line.end(), *matcher), end; it != end; ++it)
            add((*it)[1].str());
    }
}

static void extract_java(const string &line, vector<string> &imports) {
    static regex matcher(R"(^\s*import\s+(?:static\s+)?([\w\.]+(?:\.\*)?)\s*;)");
    smatch matches;
    if (regex_search(line, matches, matcher)) imports.push_back(matches[1].str());
}

static void extract_include(const string &line, vector<string> &imports) {
    static regex matcher(R"(^\s*#\s*include\s*[<"]([^>"]+)[>"])");
    smatch matches;
    if (regex_search(line, matches, matcher)) imports.push_back(matches[1].str());
}

vector<string> extract_imports(const string &language, const string &source) {
    vector<string> imports;
    import_syntax syntax = syntax_of(language);
    if (syntax == import_syntax::NONE) return imports;

    for (auto &line : split_lines(source)) {
        switch (syntax) {
            case import_syntax::PYTHON:
                extract_python(line, imports);
                break;
            case import_syntax::JAVASCRIPT:
                extract_javascript(line, imports);
                break;
            case import_syntax::JAVA:
                extract_java(line, imports);
                break;
            case import_syntax::C_INCLUDE:
                extract_include(line, imports);
                break;
            case import_syntax::NONE:
                break;
        }
    }
    return imports;
}

bool import_matches(const string &name, const string &rule) {
    if (rule.empty()) return false;
    if (name == rule) return true;
    if (name.size() > rule.size() && boost::starts_with(name, rule)) {
        char next = name[rule.size()];
        return next == '.' || next == '/';
    }
    return false;
}

static string escape_regex(const string &text) {
    static const string special = R"(\^$.|?*+()[]{})";
    string escaped;
    for (char c : text) {
        if (special.find(c) != string::npos) escaped += '\\';
        escaped += c;
    }
    return escaped;
}

string strip_literals(const string &language, const string &source) {
    import_syntax syntax = syntax_of(language);
    bool hash_comment = syntax == import_syntax::PYTHON;
    bool slash_comment = syntax == import_syntax::JAVASCRIPT || syntax == import_syntax::JAVA ||
                         syntax == import_syntax::C_INCLUDE;
    bool backtick = syntax == import_syntax::JAVASCRIPT;

    string stripped;
    stripped.reserve(source.size());
    size_t i = 0, n = source.size();
    while (i < n) {
        char c = source[i];
        if (hash_comment && c == '#') {
            while (i < n && source[i] != '\n') ++i;
        } else if (slash_comment && c == '/' && i + 1 < n && source[i + 1] == '/') {
            while (i < n && source[i] != '\n') ++i;
        } else if (slash_comment && c == '/' && i + 1 < n && source[i + 1] == '*') {
            size_t end = source.find("*/", i + 2);
            end = end == string::npos ? n : end + 2;
            // 保留换行，行号仍然对应
            for (; i < end; ++i)
                if (source[i] == '\n') stripped += '\n';
        } else if (c == '"' || c == '\'' || (backtick && c == '`')) {
            // python 的三引号字符串
            string quote(1, c);
            if (hash_comment && source.compare(i, 3, string(3, c)) == 0) quote = string(3, c);
            size_t j = i + quote.size();
            while (j < n && source.compare(j, quote.size(), quote) != 0) {
                if (source[j] == '\\') ++j;
                else if (source[j] == '\n' && quote.size() == 1 && c != '`') break;
                ++j;
            }
            j = min(n, j + quote.size());
            stripped += quote + quote;
            for (size_t k = i; k < j; ++k)
                if (source[k] == '\n') stripped += '\n';
            i = j;
        } else {
            stripped += c;
            ++i;
        }
    }
    return stripped;
}

vector<string> audit_source(const execution_environment &env, const string &source) {
    vector<string> violations;
    set<string> reported;
    auto report = [&](const string &violation) {
        if (reported.insert(violation).second) violations.push_back(violation);
    };

    for (auto &name : extract_imports(env.language, source)) {
        bool blocked = false;
        for (auto &rule : env.policy.blocked_imports) {
            if (import_matches(name, rule)) {
                report("blocked import: " + name);
                blocked = true;
                break;
            }
        }
        if (blocked || env.policy.allowed_imports.empty()) continue;

        bool allowed = false;
        for (auto &rule : env.policy.allowed_imports)
            if (import_matches(name, rule)) allowed = true;
        if (!allowed) report("import not allowed: " + name);
    }

    string code = strip_literals(env.language, source);
    for (auto &function : env.policy.blocked_functions) {
        if (function.empty()) continue;
        // 函数名前面不能是标识符字符或者 "."，避免 safe_eval( 和 re.compile( 命中
        regex matcher("(^|[^\\w.])" + escape_regex(function) + "\\s*\\(");
        if (regex_search(code, matcher))
            report("blocked function: " + function);
    }
    return violations;
}

}  // namespace coderun
