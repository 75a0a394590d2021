#include "rtvoice/utils/text.hpp"

#include <algorithm>
#include <cctype>

namespace rtvoice::utils {

std::string trim(const std::string& text) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    const auto begin = std::find_if(text.begin(), text.end(),
                                    [&](unsigned char ch) { return !is_space(ch); });
    const auto end = std::find_if(text.rbegin(), text.rend(),
                                  [&](unsigned char ch) { return !is_space(ch); }).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

bool is_e164_number(const std::string& text) {
    if (text.size() < 2 || text.size() > 16 || text.front() != '+') {
        return false;
    }
    return std::all_of(text.begin() + 1, text.end(),
                       [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

std::string truncate_for_log(const std::string& text, size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "...";
}

}
