//
//  strutil.h
//  minipy
//
#pragma once

#include <cctype>
#include <initializer_list>
#include <string>
#include <vector>

static inline std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

static inline bool contains_all(const std::string& s, std::initializer_list<const char*> parts) {
    for (const char* p : parts) {
        if (s.find(p) == std::string::npos) return false;
    }
    return true;
}

static inline bool contains_any(const std::string& s, std::initializer_list<const char*> parts) {
    for (const char* p : parts) {
        if (s.find(p) != std::string::npos) return true;
    }
    return false;
}

static inline std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::string cur;
    for (char c : s) {
        if (c == '\n') { lines.push_back(cur); cur.clear(); }
        else if (c != '\r') cur.push_back(c);
    }
    lines.push_back(cur);
    return lines;
}

static inline std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out.push_back('\n');
        out += lines[i];
    }
    return out;
}
