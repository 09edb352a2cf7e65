#include "connection_string.hpp"
#include "string_utils.hpp"
#include <vector>

namespace sproc_mapper::core {

namespace {

bool is_secret_key(std::string_view key) {
    auto lower = to_lower(trim(key));
    return lower == "pwd" || lower == "password";
}

// Split on ';' outside of braced values, keeping each segment verbatim.
// A value is braced only when '{' is its first non-blank character; inside
// it "}}" stands for a literal '}'.
std::vector<std::string> split_segments(std::string_view conn_str) {
    enum class State { Key, ValueStart, Value, Braced };

    std::vector<std::string> segments;
    std::string current;
    State state = State::Key;

    for (size_t i = 0; i < conn_str.size(); ++i) {
        char c = conn_str[i];

        if (state == State::Braced) {
            current += c;
            if (c == '}') {
                if (i + 1 < conn_str.size() && conn_str[i + 1] == '}') {
                    current += '}';
                    ++i;
                } else {
                    state = State::Value;
                }
            }
            continue;
        }

        if (c == ';') {
            segments.push_back(current);
            current.clear();
            state = State::Key;
            continue;
        }

        current += c;
        if (state == State::Key && c == '=') {
            state = State::ValueStart;
        } else if (state == State::ValueStart && c != ' ' && c != '\t') {
            state = c == '{' ? State::Braced : State::Value;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

// "{a}}b}" -> "a}b"; unbraced values are returned as they are
std::string unbrace(const std::string& value) {
    if (value.size() < 2 || value.front() != '{' || value.back() != '}') {
        return value;
    }
    std::string result;
    for (size_t i = 1; i + 1 < value.size(); ++i) {
        result += value[i];
        if (value[i] == '}' && i + 2 < value.size() && value[i + 1] == '}') {
            ++i;
        }
    }
    return result;
}

} // anonymous namespace

std::unordered_map<std::string, std::string> parse_connection_string_pairs(
    std::string_view conn_str) {
    std::unordered_map<std::string, std::string> result;

    for (const auto& segment : split_segments(conn_str)) {
        auto eq_pos = segment.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        std::string key(trim(std::string_view(segment).substr(0, eq_pos)));
        std::string value(trim(std::string_view(segment).substr(eq_pos + 1)));

        result[to_lower(key)] = unbrace(value);
    }

    return result;
}

std::string get_string_value(const std::unordered_map<std::string, std::string>& pairs,
                             const std::string& key,
                             const std::string& default_value) {
    auto it = pairs.find(to_lower(key));
    if (it != pairs.end()) {
        return it->second;
    }
    return default_value;
}

std::string redact_connection_string(std::string_view conn_str) {
    std::string result;

    for (const auto& segment : split_segments(conn_str)) {
        if (!result.empty()) {
            result += ';';
        }
        auto eq_pos = segment.find('=');
        if (eq_pos != std::string::npos && is_secret_key(std::string_view(segment).substr(0, eq_pos))) {
            result += segment.substr(0, eq_pos + 1) + "***";
        } else {
            result += segment;
        }
    }

    return result;
}

bool looks_like_connection_string(std::string_view text) noexcept {
    return text.find('=') != std::string_view::npos;
}

} // namespace sproc_mapper::core
