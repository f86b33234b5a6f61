#include "common/diff.hpp"
#include <vector>
#include "common/utils.hpp"

namespace coderun {
using namespace std;

line_diff diff_lines(const string &expected, const string &actual) {
    vector<string> a = split_lines(expected), b = split_lines(actual);
    size_t n = a.size(), m = b.size();

    line_diff result;
    if (n == 0 && m == 0) return result;

    // lcs[i][j] 表示 a[i..] 和 b[j..] 的最长公共子序列长度
    vector<vector<size_t>> lcs(n + 1, vector<size_t>(m + 1, 0));
    for (size_t i = n; i-- > 0;)
        for (size_t j = m; j-- > 0;)
            lcs[i][j] = a[i] == b[j] ? lcs[i + 1][j + 1] + 1 : max(lcs[i + 1][j], lcs[i][j + 1]);

    bool identical = n == m && lcs[0][0] == n;
    result.similarity = 2.0 * lcs[0][0] / (n + m);
    if (identical) return result;

    size_t i = 0, j = 0;
    while (i < n || j < m) {
        if (i < n && j < m && a[i] == b[j]) {
            result.text += "  " + a[i] + "\n";
            ++i, ++j;
        } else if (i < n && (j == m || lcs[i + 1][j] >= lcs[i][j + 1])) {
            result.text += "- " + a[i] + "\n";
            ++i;
        } else {
            result.text += "+ " + b[j] + "\n";
            ++j;
        }
    }
    return result;
}

}  // namespace coderun
