//
//  editor.cpp
//  minipy
//

#include "editor.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <vector>
#include <termios.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include "strutil.h"

namespace {

struct RawMode {
    termios orig{};
    bool active = false;

    void enable() {
        if (active || !isatty(STDIN_FILENO)) return;
        tcgetattr(STDIN_FILENO, &orig);
        termios raw = orig;
        raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
        raw.c_iflag &= ~(IXON | ICRNL);
        raw.c_oflag &= ~(OPOST);
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 1;
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
        active = true;
    }

    void disable() {
        if (!active) return;
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &orig);
        active = false;
    }

    ~RawMode() { disable(); }
};

void clear_screen() {
    std::cout << "\033[2J\033[H";
}

void move_cursor(int r, int c) {
    std::cout << "\033[" << r << ";" << c << "H";
}

int terminal_rows() {
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 2) return ws.ws_row;
    return 24;
}

bool peek_input(int ms) {
    fd_set set;
    FD_ZERO(&set);
    FD_SET(STDIN_FILENO, &set);
    timeval tv{ ms / 1000, (ms % 1000) * 1000 };
    return select(STDIN_FILENO + 1, &set, nullptr, nullptr, &tv) > 0;
}

enum class Key { None, Up, Down, Left, Right, Home, End, Enter, Backspace, Tab, Esc, Char };

Key read_key(char& out) {
    char c;
    if (read(STDIN_FILENO, &c, 1) <= 0) return Key::None;

    if (c == 27) {
        if (!peek_input(20)) return Key::Esc;
        char seq[2];
        if (read(STDIN_FILENO, &seq[0], 1) != 1) return Key::Esc;
        if (read(STDIN_FILENO, &seq[1], 1) != 1) return Key::Esc;
        if (seq[0] == '[') {
            if (seq[1] == 'A') return Key::Up;
            if (seq[1] == 'B') return Key::Down;
            if (seq[1] == 'C') return Key::Right;
            if (seq[1] == 'D') return Key::Left;
            if (seq[1] == 'H') return Key::Home;
            if (seq[1] == 'F') return Key::End;
        }
        return Key::Esc;
    }

    if (c == 127 || c == 8) return Key::Backspace;
    if (c == '\n' || c == '\r') return Key::Enter;
    if (c == '\t') return Key::Tab;

    out = c;
    return Key::Char;
}

void read_lines_until_dot(std::string& source) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (trim(line) == ".") break;
        lines.push_back(line);
    }
    source = join_lines(lines);
}

} // namespace

void run_editor(std::string& source) {
    if (!isatty(STDIN_FILENO)) {
        std::cout << "Enter program, end with a line holding a single '.':\n";
        read_lines_until_dot(source);
        return;
    }

    RawMode rm;
    rm.enable();

    std::vector<std::string> lines = split_lines(source);
    if (lines.empty()) lines.push_back("");

    int row = 0, col = 0;
    int top = 0;

    while (true) {
        const int rows = terminal_rows();
        const int visible = rows - 1; // last row is the status line
        if (row < top) top = row;
        if (row >= top + visible) top = row - visible + 1;

        clear_screen();
        for (int i = 0; i < visible && top + i < (int)lines.size(); ++i) {
            move_cursor(i + 1, 1);
            std::cout << lines[(size_t)(top + i)];
        }
        move_cursor(rows, 1);
        std::cout << "\033[7m ESC: done  line " << (row + 1) << "/" << lines.size()
                  << "  statements are separated by ';' \033[0m";
        move_cursor(row - top + 1, col + 1);
        std::cout.flush();

        char ch = 0;
        Key k = read_key(ch);

        if (k == Key::Esc) break;
        if (k == Key::Up && row > 0) { row--; col = std::min(col, (int)lines[row].size()); }
        if (k == Key::Down && row + 1 < (int)lines.size()) { row++; col = std::min(col, (int)lines[row].size()); }
        if (k == Key::Left && col > 0) col--;
        if (k == Key::Right && col < (int)lines[row].size()) col++;
        if (k == Key::Home) col = 0;
        if (k == Key::End) col = (int)lines[row].size();

        if (k == Key::Backspace) {
            if (col > 0) {
                lines[row].erase(col - 1, 1);
                col--;
            } else if (row > 0) {
                // join with the previous line
                col = (int)lines[row - 1].size();
                lines[row - 1] += lines[row];
                lines.erase(lines.begin() + row);
                row--;
            }
        }

        if (k == Key::Enter) {
            lines.insert(lines.begin() + row + 1,
                         lines[row].substr(col));
            lines[row].erase(col);
            row++; col = 0;
        }

        if (k == Key::Tab) {
            lines[row].insert((size_t)col, "  ");
            col += 2;
        }

        if (k == Key::Char && std::isprint((unsigned char)ch)) {
            lines[row].insert(lines[row].begin() + col, ch);
            col++;
        }
    }

    rm.disable();
    clear_screen();

    // Drop trailing blank lines
    while (lines.size() > 1 && trim(lines.back()).empty()) lines.pop_back();
    source = join_lines(lines);
}
