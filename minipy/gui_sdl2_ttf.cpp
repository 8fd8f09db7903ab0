//
//  gui_sdl2_ttf.cpp
//  minipy
//

#include "gui.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#if defined(__APPLE__)
#include <pthread.h>
#endif

#include "SDL.h"
#include "SDL_ttf.h"

#include "lexer.h"
#include "menu.h"
#include "parser.h"
#include "printer.h"
#include "strutil.h"

namespace {

// Palette indices, EGA order.
const uint8_t kEditorBg = 0;
const uint8_t kOutputBg = 1;
const uint8_t kPlain = 7;
const uint8_t kKeyword = 14;
const uint8_t kString = 10;
const uint8_t kNumber = 11;
const uint8_t kBright = 15;

SDL_Color palette(uint8_t idx) {
    static const SDL_Color pal[16] = {
        {0,0,0,255},{0,0,170,255},{0,170,0,255},{0,170,170,255},
        {170,0,0,255},{170,0,170,255},{170,85,0,255},{170,170,170,255},
        {85,85,85,255},{85,85,255,255},{85,255,85,255},{85,255,255,255},
        {255,85,85,255},{255,85,255,255},{255,255,85,255},{255,255,255,255}
    };
    return pal[idx & 15];
}

// Scrolling text area for results. Long lines wrap at the pane width.
struct OutputPane {
    std::deque<std::string> lines{""};
    size_t maxLines = 5000;
    int scroll = 0; // rows scrolled back from the bottom

    void clear() {
        lines.assign(1, "");
        scroll = 0;
    }

    void newline() {
        lines.push_back("");
        if (lines.size() > maxLines) lines.pop_front();
    }

    void putChar(char c) {
        if (c == '\r') return;
        if (c == '\n') { newline(); return; }
        if (c == '\t') { lines.back() += "  "; return; }
        if ((unsigned char)c < 32) return;
        lines.back().push_back(c);
    }

    void write(const std::string& s) {
        for (char c : s) putChar(c);
        scroll = 0;
    }

    void pushLine(const std::string& s) {
        write(s);
        if (s.empty() || s.back() != '\n') putChar('\n');
    }

    // The lines as they appear on screen, wrapped to cols.
    std::vector<std::string> wrapped(int cols) const {
        std::vector<std::string> rows;
        for (const std::string& l : lines) {
            if (l.empty()) { rows.push_back(""); continue; }
            for (size_t p = 0; p < l.size(); p += (size_t)cols) rows.push_back(l.substr(p, (size_t)cols));
        }
        return rows;
    }
};

// Editable program text with a cursor.
struct EditorPane {
    std::vector<std::string> lines{""};
    int row = 0;
    int col = 0;
    int top = 0;
    int left = 0;

    void load(const std::string& source) {
        lines = split_lines(source);
        if (lines.empty()) lines.push_back("");
        row = col = top = left = 0;
    }

    std::string text() const { return join_lines(lines); }

    void insert(const std::string& s) {
        for (char c : s) {
            if ((unsigned char)c < 32 || (unsigned char)c > 126) continue;
            lines[(size_t)row].insert((size_t)col, 1, c);
            col++;
        }
    }

    void newline() {
        std::string& cur = lines[(size_t)row];
        std::string rest = cur.substr((size_t)col);
        cur.erase((size_t)col);
        lines.insert(lines.begin() + row + 1, rest);
        row++;
        col = 0;
    }

    void backspace() {
        if (col > 0) {
            lines[(size_t)row].erase((size_t)(col - 1), 1);
            col--;
        } else if (row > 0) {
            // join with the previous line
            col = (int)lines[(size_t)(row - 1)].size();
            lines[(size_t)(row - 1)] += lines[(size_t)row];
            lines.erase(lines.begin() + row);
            row--;
        }
    }

    void up() { if (row > 0) { row--; clampCol(); } }
    void down() { if (row + 1 < (int)lines.size()) { row++; clampCol(); } }
    void leftKey() {
        if (col > 0) col--;
        else if (row > 0) { row--; col = (int)lines[(size_t)row].size(); }
    }
    void rightKey() {
        if (col < (int)lines[(size_t)row].size()) col++;
        else if (row + 1 < (int)lines.size()) { row++; col = 0; }
    }
    void home() { col = 0; }
    void end() { col = (int)lines[(size_t)row].size(); }
    void clampCol() { col = std::min(col, (int)lines[(size_t)row].size()); }

    // Keeps the cursor inside a visible window of rows x cols.
    void follow(int rows, int cols) {
        if (row < top) top = row;
        if (row >= top + rows) top = row - rows + 1;
        if (col < left) left = col;
        if (col >= left + cols) left = col - cols + 1;
    }
};

// One colour per character, keywords and literals picked out by the lexer.
std::vector<uint8_t> highlight_line(const std::string& text) {
    std::vector<uint8_t> colors(text.size(), kPlain);
    Lexer lx(text);
    while (true) {
        Token t = lx.next();
        if (t.kind == TokenKind::End) break;
        uint8_t c = kPlain;
        if (is_keyword(t.kind)) c = kKeyword;
        else if (t.kind == TokenKind::String) c = kString;
        else if (t.kind == TokenKind::Number) c = kNumber;
        if (c == kPlain) continue;
        for (size_t k = lx.tokenStart; k < lx.tokenEnd && k < colors.size(); ++k) colors[k] = c;
    }
    return colors;
}

bool sdl_try_open_font(TTF_Font*& font, int ptSize) {
    if (const char* custom = std::getenv("MINIPY_FONT")) {
        font = TTF_OpenFont(custom, ptSize);
        if (font) return true;
        std::cout << "Cannot open MINIPY_FONT " << custom << ": " << TTF_GetError() << "\n";
    }
    const char* candidates[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
        "/usr/share/fonts/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
        "/usr/share/fonts/truetype/freefont/FreeMono.ttf",
        "/System/Library/Fonts/Menlo.ttc",
        "/Library/Fonts/Courier New.ttf",
        nullptr
    };
    for (int i = 0; candidates[i]; ++i) {
        font = TTF_OpenFont(candidates[i], ptSize);
        if (font) return true;
    }
    return false;
}

SDL_Texture* sdl_make_text_texture(SDL_Renderer* r,
                                   TTF_Font* font,
                                   const std::string& text,
                                   SDL_Color color,
                                   int& outW,
                                   int& outH) {
    outW = outH = 0;
    if (!font) return nullptr;
    SDL_Surface* surf = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surf) return nullptr;
    SDL_Texture* tex = SDL_CreateTextureFromSurface(r, surf);
    outW = surf->w;
    outH = surf->h;
    SDL_FreeSurface(surf);
    return tex;
}

void measure_cell(TTF_Font* f, int& outCharW, int& outCharH) {
    int minx=0,maxx=0,miny=0,maxy=0,advance=0;
    outCharW = (TTF_GlyphMetrics(f, 'M', &minx,&maxx,&miny,&maxy,&advance) == 0 && advance > 0) ? advance : 10;
    int ls = TTF_FontLineSkip(f);
    outCharH = (ls > 0) ? ls : 18;
}

struct Cells {
    int x = 0;
    int y = 0;
    int w = 10;
    int h = 18;
};

// Draws text at a cell position in runs of equal colour.
void draw_row(SDL_Renderer* renderer, TTF_Font* font, const Cells& cell,
              int r, const std::string& text, const std::vector<uint8_t>& colors) {
    size_t c = 0;
    while (c < text.size()) {
        uint8_t fg = c < colors.size() ? colors[c] : kPlain;
        size_t start = c;
        std::string run;
        while (c < text.size() && (c < colors.size() ? colors[c] : kPlain) == fg) run.push_back(text[c++]);

        if (trim(run).empty()) continue;
        int tw = 0, th = 0;
        SDL_Texture* tex = sdl_make_text_texture(renderer, font, run, palette(fg), tw, th);
        if (tex) {
            SDL_Rect dst{ cell.x + (int)start * cell.w, cell.y + r * cell.h, tw, th };
            SDL_RenderCopy(renderer, tex, nullptr, &dst);
            SDL_DestroyTexture(tex);
        }
    }
}

void fill_rows(SDL_Renderer* renderer, const Cells& cell, int r0, int rows, int cols, uint8_t bg) {
    SDL_Color c = palette(bg);
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, 255);
    SDL_Rect rect{ cell.x, cell.y + r0 * cell.h, cols * cell.w, rows * cell.h };
    SDL_RenderFillRect(renderer, &rect);
}

void fall_back_to_menu(const std::string& source) {
    std::cout << "Falling back to console menu.\n";
    Menu menu;
    menu.program = source;
    menu.run();
}

} // namespace

void run_gui_shell(const std::string& source) {
#if defined(__APPLE__)
    // SDL's Cocoa backend requires event pumping on the main thread.
    if (pthread_main_np() == 0) {
        std::cout << "SDL window must run on the main thread on macOS.\n";
        fall_back_to_menu(source);
        return;
    }
#endif

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cout << "SDL_Init failed: " << SDL_GetError() << "\n";
        fall_back_to_menu(source);
        return;
    }
    if (TTF_Init() != 0) {
        std::cout << "TTF_Init failed: " << TTF_GetError() << "\n";
        SDL_Quit();
        fall_back_to_menu(source);
        return;
    }

    SDL_Window* win = SDL_CreateWindow(
        "minipy",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        960, 720,
        SDL_WINDOW_ALLOW_HIGHDPI | SDL_WINDOW_RESIZABLE
    );
    if (!win) {
        std::cout << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        TTF_Quit();
        SDL_Quit();
        fall_back_to_menu(source);
        return;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(win, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        std::cout << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(win);
        TTF_Quit();
        SDL_Quit();
        fall_back_to_menu(source);
        return;
    }

    SDL_ShowWindow(win);
    SDL_RaiseWindow(win);
    SDL_PumpEvents();

    // Fonts are sized in output pixels, which differ from window points on HiDPI.
    int winW_pts = 0, winH_pts = 0, outW_px = 0, outH_px = 0;
    SDL_GetWindowSize(win, &winW_pts, &winH_pts);
    SDL_GetRendererOutputSize(renderer, &outW_px, &outH_px);
    float scale = (winH_pts > 0) ? ((float)outH_px / (float)winH_pts) : 1.0f;
    if (scale <= 0.0f) scale = 1.0f;

    TTF_Font* font = nullptr;
    if (!sdl_try_open_font(font, (int)lroundf(16.0f * scale))) {
        std::cout << "Could not open a monospace font. TTF error: " << TTF_GetError() << "\n";
        std::cout << "Set MINIPY_FONT to a TrueType font path.\n";
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(win);
        TTF_Quit();
        SDL_Quit();
        fall_back_to_menu(source);
        return;
    }

    Cells cell;
    measure_cell(font, cell.w, cell.h);
    int cols = 80;
    int rows = 30;

    auto recompute_layout = [&]() {
        SDL_GetWindowSize(win, &winW_pts, &winH_pts);
        SDL_GetRendererOutputSize(renderer, &outW_px, &outH_px);
        float sx = (winW_pts > 0) ? ((float)outW_px / (float)winW_pts) : 1.0f;
        float sy = (winH_pts > 0) ? ((float)outH_px / (float)winH_pts) : 1.0f;
        cell.x = (int)lroundf(12.0f * (sx > 0.0f ? sx : 1.0f));
        cell.y = (int)lroundf(12.0f * (sy > 0.0f ? sy : 1.0f));
        cols = std::max(20, (outW_px - cell.x * 2) / cell.w);
        rows = std::max(8, (outH_px - cell.y * 2) / cell.h);
    };
    recompute_layout();

    EditorPane editor;
    editor.load(source);
    OutputPane output;
    output.pushLine("minipy. F5 run, F6 syntax tree, Ctrl+L clear output, ESC break or quit.");

    // Program runs happen on a worker so a runaway loop can be broken from here.
    std::thread programThread;
    std::atomic<bool> programRunning{false};
    std::atomic<bool> programDone{false};
    std::atomic<bool> breakRequested{false};
    std::string programReport;
    Env runEnv;

    auto startRun = [&]() {
        if (programRunning.load(std::memory_order_relaxed)) return;
        if (programThread.joinable()) programThread.join();
        std::string program = editor.text();
        if (trim(program).empty()) {
            output.pushLine("Empty program.");
            return;
        }
        runEnv.clearVars();
        programReport.clear();
        breakRequested.store(false, std::memory_order_relaxed);
        programDone.store(false, std::memory_order_relaxed);
        programRunning.store(true, std::memory_order_relaxed);
        programThread = std::thread([&, program]() {
            std::string report = run_and_report(program, runEnv, [&]() {
                if (breakRequested.load(std::memory_order_relaxed)) throw BreakRequested();
            });
            std::vector<std::string> vars = runEnv.dumpVars();
            if (!vars.empty()) {
                report += "--- Variables ---\n";
                for (const std::string& v : vars) report += v + "\n";
            }
            programReport = std::move(report);
            programDone.store(true, std::memory_order_release);
        });
    };

    auto showAst = [&]() {
        ParseResult parsed = parse_program(editor.text());
        output.pushLine("--- Abstract Syntax Tree (AST) ---");
        if (parsed.ok()) output.write(render_ast(*parsed.ast));
        else output.pushLine(parsed.diagnostic->message);
    };

    SDL_StartTextInput();

    bool running = true;
    while (running) {
        const int editorRows = std::max(3, (rows - 1) * 2 / 5);
        const int statusRow = editorRows;
        const int outputRow = editorRows + 1;
        const int outputRows = std::max(1, rows - outputRow);

        SDL_Event e;
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) { running = false; break; }
            if (e.type == SDL_WINDOWEVENT) {
                if (e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) recompute_layout();
                continue;
            }

            const bool busy = programRunning.load(std::memory_order_relaxed);

            if (e.type == SDL_TEXTINPUT) {
                if (!busy) editor.insert(e.text.text);
                continue;
            }

            if (e.type != SDL_KEYDOWN) continue;
            SDL_Keycode sym = e.key.keysym.sym;
            SDL_Keymod mod = (SDL_Keymod)e.key.keysym.mod;

            if (sym == SDLK_ESCAPE) {
                if (busy) breakRequested.store(true, std::memory_order_relaxed);
                else { running = false; break; }
                continue;
            }
            if ((mod & KMOD_CTRL) && sym == SDLK_l) { output.clear(); continue; }
            if (sym == SDLK_PAGEUP) { output.scroll += outputRows - 1; continue; }
            if (sym == SDLK_PAGEDOWN) { output.scroll = std::max(0, output.scroll - (outputRows - 1)); continue; }
            if (busy) continue;

            if (sym == SDLK_F5) { startRun(); continue; }
            if (sym == SDLK_F6) { showAst(); continue; }

            switch (sym) {
                case SDLK_RETURN: case SDLK_KP_ENTER: editor.newline(); break;
                case SDLK_BACKSPACE: editor.backspace(); break;
                case SDLK_TAB: editor.insert("  "); break;
                case SDLK_UP: editor.up(); break;
                case SDLK_DOWN: editor.down(); break;
                case SDLK_LEFT: editor.leftKey(); break;
                case SDLK_RIGHT: editor.rightKey(); break;
                case SDLK_HOME: editor.home(); break;
                case SDLK_END: editor.end(); break;
                default: break;
            }
        }

        // If a background run finished, join and show its report.
        if (programRunning.load(std::memory_order_relaxed) && programDone.load(std::memory_order_acquire)) {
            if (programThread.joinable()) programThread.join();
            output.write(programReport);
            programRunning.store(false, std::memory_order_relaxed);
        }

        // Render
        SDL_Color bgc = palette(kEditorBg);
        SDL_SetRenderDrawColor(renderer, bgc.r, bgc.g, bgc.b, 255);
        SDL_RenderClear(renderer);

        editor.follow(editorRows, cols);
        for (int r = 0; r < editorRows && editor.top + r < (int)editor.lines.size(); ++r) {
            const std::string& full = editor.lines[(size_t)(editor.top + r)];
            std::vector<uint8_t> colors = highlight_line(full);
            if ((size_t)editor.left >= full.size()) continue;
            std::string shown = full.substr((size_t)editor.left, (size_t)cols);
            std::vector<uint8_t> shownColors(colors.begin() + editor.left,
                                             colors.begin() + editor.left + (int)shown.size());
            draw_row(renderer, font, cell, r, shown, shownColors);
        }

        const bool busy = programRunning.load(std::memory_order_relaxed);
        fill_rows(renderer, cell, statusRow, 1, cols, kPlain);
        std::string status = busy ? " running... ESC: break"
                                  : " line " + std::to_string(editor.row + 1) + "/" + std::to_string(editor.lines.size()) +
                                    "  F5 run  F6 AST  Ctrl+L clear  ESC quit";
        if ((int)status.size() > cols) status.resize((size_t)cols);
        draw_row(renderer, font, cell, statusRow, status, std::vector<uint8_t>(status.size(), kEditorBg));

        fill_rows(renderer, cell, outputRow, outputRows, cols, kOutputBg);
        std::vector<std::string> shown = output.wrapped(cols);
        int maxScroll = std::max(0, (int)shown.size() - outputRows);
        output.scroll = std::min(output.scroll, maxScroll);
        int first = std::max(0, (int)shown.size() - outputRows - output.scroll);
        for (int r = 0; r < outputRows && first + r < (int)shown.size(); ++r) {
            const std::string& text = shown[(size_t)(first + r)];
            draw_row(renderer, font, cell, outputRow + r, text, std::vector<uint8_t>(text.size(), kBright));
        }

        if (!busy) {
            SDL_Color cc = palette(kBright);
            SDL_SetRenderDrawColor(renderer, cc.r, cc.g, cc.b, 255);
            SDL_Rect curRect{ cell.x + (editor.col - editor.left) * cell.w,
                              cell.y + (editor.row - editor.top) * cell.h, cell.w, cell.h };
            SDL_RenderDrawRect(renderer, &curRect);
        }

        SDL_RenderPresent(renderer);
    }

    if (programThread.joinable()) {
        // Request stop and wait.
        breakRequested.store(true, std::memory_order_relaxed);
        programThread.join();
    }

    SDL_StopTextInput();
    TTF_CloseFont(font);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(win);
    TTF_Quit();
    SDL_Quit();
}
