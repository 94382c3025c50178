#include "strings.hpp"

std::string trim(std::string_view s) {
    constexpr std::string_view ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(ws);
    return std::string(s.substr(start, end - start + 1));
}

std::vector<std::string> split_list(std::string_view s, char sep) {
    std::vector<std::string> items;
    size_t pos = 0;
    while (pos <= s.size()) {
        auto next = s.find(sep, pos);
        if (next == std::string_view::npos) next = s.size();
        auto item = trim(s.substr(pos, next - pos));
        if (!item.empty()) items.push_back(std::move(item));
        pos = next + 1;
    }
    return items;
}
