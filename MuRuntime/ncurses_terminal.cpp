#include "MuRuntime.h"

#ifdef MURUNTIME_UI_NCURSES
#include <ncurses.h>

namespace MuRuntime {

namespace {

enum ColorPair : short {
    PAIR_ERROR = 1,
    PAIR_SUCCESS = 2,
    PAIR_NOTICE = 3,
    PAIR_META = 4
};

short pair_for(Style style) {
    switch (style) {
        case Style::ERROR: return PAIR_ERROR;
        case Style::SUCCESS: return PAIR_SUCCESS;
        case Style::NOTICE: return PAIR_NOTICE;
        case Style::META: return PAIR_META;
        case Style::NORMAL:
        case Style::OUTPUT: break;
    }
    return 0;
}

} // namespace

class NcursesTerminal::Impl {
public:
    Impl()
        : output_win_(nullptr)
        , input_win_(nullptr)
        , active_(false)
        , colors_(false)
        , quit_(false)
    {}

    void draw_input(const std::string& text, size_t cursor_col) {
        werase(input_win_);
        box(input_win_, 0, 0);
        int width = getmaxx(input_win_) - 4;
        std::string shown = text;
        size_t col = cursor_col;
        // Keep the cursor visible on long lines
        if (width > 0 && shown.size() > static_cast<size_t>(width)) {
            size_t start = col > static_cast<size_t>(width) ? col - static_cast<size_t>(width) : 0;
            shown = shown.substr(start, static_cast<size_t>(width));
            col -= start;
        }
        mvwaddstr(input_win_, 1, 2, shown.c_str());
        wmove(input_win_, 1, 2 + static_cast<int>(col));
        wrefresh(input_win_);
    }

    WINDOW* output_win_;
    WINDOW* input_win_;
    bool active_;
    bool colors_;
    bool quit_;
};

NcursesTerminal::NcursesTerminal() : impl_(std::make_unique<Impl>()) {}

NcursesTerminal::~NcursesTerminal() {
    close();
}

bool NcursesTerminal::open() {
    if (impl_->active_) return true;
    if (!initscr()) return false;

    // raw() so Ctrl-C and Ctrl-D reach us as keys
    raw();
    noecho();
    keypad(stdscr, TRUE);

    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    int output_height = max_y - 3;
    impl_->output_win_ = newwin(output_height, max_x, 0, 0);
    impl_->input_win_ = newwin(3, max_x, output_height, 0);
    if (!impl_->output_win_ || !impl_->input_win_) {
        endwin();
        return false;
    }

    scrollok(impl_->output_win_, TRUE);
    keypad(impl_->input_win_, TRUE);
    nodelay(impl_->input_win_, TRUE);

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(PAIR_ERROR, COLOR_RED, -1);
        init_pair(PAIR_SUCCESS, COLOR_GREEN, -1);
        init_pair(PAIR_NOTICE, COLOR_YELLOW, -1);
        init_pair(PAIR_META, COLOR_CYAN, -1);
        impl_->colors_ = true;
    }

    wrefresh(impl_->output_win_);
    impl_->active_ = true;
    return true;
}

void NcursesTerminal::close() {
    if (!impl_->active_) return;
    delwin(impl_->output_win_);
    delwin(impl_->input_win_);
    impl_->output_win_ = nullptr;
    impl_->input_win_ = nullptr;
    endwin();
    impl_->active_ = false;
}

int NcursesTerminal::input_fd() const {
    return STDIN_FILENO;
}

bool NcursesTerminal::read_keys(std::vector<KeyEvent>& out) {
    if (!impl_->active_) return false;

    int ch;
    while ((ch = wgetch(impl_->input_win_)) != ERR) {
        switch (ch) {
            case KEY_UP: out.push_back(KeyEvent::of(Key::UP)); break;
            case KEY_DOWN: out.push_back(KeyEvent::of(Key::DOWN)); break;
            case KEY_LEFT: out.push_back(KeyEvent::of(Key::LEFT)); break;
            case KEY_RIGHT: out.push_back(KeyEvent::of(Key::RIGHT)); break;
            case KEY_BACKSPACE:
            case 127:
            case 8: out.push_back(KeyEvent::of(Key::BACKSPACE)); break;
            case KEY_ENTER:
            case '\n':
            case '\r': out.push_back(KeyEvent::of(Key::ENTER)); break;
            case '\t': out.push_back(KeyEvent::of(Key::TAB)); break;
            case 3: out.push_back(KeyEvent::of(Key::CTRL_C)); break;
            case 4: out.push_back(KeyEvent::of(Key::CTRL_D)); break;
            case 5: out.push_back(KeyEvent::of(Key::CTRL_E)); break;
            case 0x1d: impl_->quit_ = true; break;
            default:
                if (ch >= 0x20 && ch < 0x100 && ch != 0x7f) {
                    out.push_back(KeyEvent::character(static_cast<char>(ch)));
                }
                break;
        }
    }
    return true;
}

bool NcursesTerminal::quit_requested() const {
    return impl_->quit_;
}

void NcursesTerminal::write(const std::string& text, Style style) {
    if (!impl_->active_) return;
    short pair = impl_->colors_ ? pair_for(style) : 0;
    if (pair) wattron(impl_->output_win_, COLOR_PAIR(pair));
    for (char c : text) {
        // carriage returns from pass-through output would overwrite lines
        if (c == '\r') continue;
        waddch(impl_->output_win_, static_cast<unsigned char>(c));
    }
    if (pair) wattroff(impl_->output_win_, COLOR_PAIR(pair));
    wrefresh(impl_->output_win_);
    wrefresh(impl_->input_win_);
}

void NcursesTerminal::render_prompt(const std::string& prompt, const std::string& line, size_t cursor) {
    if (!impl_->active_) return;
    impl_->draw_input(prompt + line, prompt.size() + cursor);
}

void NcursesTerminal::render_progress(int percent, const std::string& message) {
    if (!impl_->active_) return;
    std::string bar = progress_bar(percent, message);
    impl_->draw_input(bar, bar.size());
}

} // namespace MuRuntime

#endif
