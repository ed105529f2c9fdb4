#include "common/stl_utils.hpp"

using namespace std;

vector<string> split_lines(const string &text) {
    vector<string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == string::npos) end = text.size();
        size_t len = end - start;
        if (len > 0 && text[start + len - 1] == '\r') --len;
        lines.push_back(text.substr(start, len));
        start = end + 1;
    }
    return lines;
}
