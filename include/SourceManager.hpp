#pragma once
#include <sstream>
#include <string>
#include <vector>

// Source text of one unit, split into lines for diagnostics.
class SourceManager {
   public:
    std::string filename;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname) {
        std::istringstream in(src);
        std::string text;
        while (std::getline(in, text)) {
            if (!text.empty() && text.back() == '\r') text.pop_back();
            lines.push_back(text);
        }
    }

    // 1-based; empty for lines past the end
    std::string get_line(int line_num) const {
        if (line_num < 1 || static_cast<size_t>(line_num) > lines.size()) return "";
        return lines[line_num - 1];
    }

    // Quotes the line with a caret under col, widened to a '^~~' span for
    // multi-character tokens. col and length count code points.
    std::string format_error_context(int line, int col, int length = 1) const {
        std::string gutter = " * " + std::to_string(line) + " | ";
        std::string marker = "^";
        if (length > 1) marker += std::string(length - 1, '~');

        std::ostringstream ss;
        ss << gutter << get_line(line) << "\n"
           << std::string(gutter.size() + (col > 1 ? col - 1 : 0), ' ') << marker;
        return ss.str();
    }

   private:
    std::vector<std::string> lines;
};
