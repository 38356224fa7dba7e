#pragma once
#include <algorithm>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "model.hpp"

inline char tolower_ascii(char c) {
    return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c;
}

inline bool contains_icase_ascii(std::string_view haystack, std::string_view needle) {
    auto eq = [](char a, char b) { return tolower_ascii(a) == tolower_ascii(b); };
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), eq) != haystack.end();
}

// Filter shared by the long tasks table and the timeline.
// A row passes on its url or group; a task on its group, event name or any candidate URL.
class RowFilter {
public:
    enum class Mode { Substring, SubstringIcase, Regex };

    // False when the regex does not compile (see error()); every row then passes.
    bool compile(std::string pattern, bool caseSensitive, bool regex) {
        _pattern = std::move(pattern);
        _rx.reset();
        _error.clear();
        _mode = regex ? Mode::Regex : (caseSensitive ? Mode::Substring : Mode::SubstringIcase);

        if (_mode != Mode::Regex || _pattern.empty()) return true;
        auto flags = std::regex::ECMAScript;
        if (!caseSensitive) flags |= std::regex::icase;
        try {
            _rx.emplace(_pattern, flags);
        }
        catch (const std::regex_error& e) {
            _error = e.what();
            return false;
        }
        return true;
    }

    bool active() const { return !_pattern.empty() && (_mode != Mode::Regex || _rx); }
    const std::string& pattern() const { return _pattern; }
    const std::string& error() const { return _error; }

    bool match(std::string_view s) const {
        if (!active()) return true;
        switch (_mode) {
            case Mode::Substring:      return s.find(_pattern) != std::string_view::npos;
            case Mode::SubstringIcase: return contains_icase_ascii(s, _pattern);
            case Mode::Regex:          return std::regex_search(s.begin(), s.end(), *_rx);
        }
        return true;
    }

    bool match(const AttributedRow& row) const {
        return match(row.url) || match(row.group);
    }

    bool match(const TaskNode& task) const {
        if (!active()) return true;
        if (match(task.group) || match(task.eventName)) return true;
        return std::any_of(task.attributableURLs.begin(), task.attributableURLs.end(),
            [&](const std::string& u) { return match(u); });
    }

private:
    std::string _pattern;
    Mode _mode = Mode::SubstringIcase;
    std::optional<std::regex> _rx;
    std::string _error;
};
