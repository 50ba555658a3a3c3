#pragma once
#include <sstream>
#include <string>
#include <vector>

// Keeps the text of one source unit so diagnostics can show the offending line.
class SourceManager {
   public:
    std::string filename;
    std::string source;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname), source(src) {
        split_lines();
    }

    int line_count() const { return static_cast<int>(lines.size()); }

    // 1-based; out of range gives ""
    std::string get_line(int line_num) const {
        if (line_num < 1 || line_num > line_count()) return "";
        return lines[line_num - 1];
    }

    //  * 3 | print a + nil;
    //              ^~~~~~~
    std::string format_error_context(int line, int col, int length = 1) const {
        std::stringstream ss;
        ss << " * " << line << " | ";
        std::string prefix = ss.str();
        ss << get_line(line) << "\n";
        ss << std::string(prefix.size() + (col > 0 ? col - 1 : 0), ' ') << "^";
        if (length > 1) ss << std::string(length - 1, '~');
        return ss.str();
    }

   private:
    std::vector<std::string> lines;

    void split_lines() {
        std::string current_line;
        for (char c : source) {
            if (c == '\n') {
                lines.push_back(current_line);
                current_line.clear();
            } else if (c != '\r') {
                current_line += c;
            }
        }
        if (!current_line.empty()) {
            lines.push_back(current_line);
        }
    }
};
