#include "duet/view.hpp"
#include "duet/log.hpp"

#include <echo/format.hpp>
#include <scan/input/reader.hpp>
#include <scan/terminal/raw_mode.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>

namespace duet {

    namespace {

        // =========================================================================================
        // Constants
        // =========================================================================================

        constexpr const char *ICON_FOLDER = "\xee\x97\xbf";
        constexpr const char *ICON_FILE = "\xee\x98\x92";
        constexpr const char *ICON_FOLDER_SYMLINK = "\xef\x92\x82";
        constexpr const char *ICON_FILE_SYMLINK = "\xef\x92\x81";

        constexpr const char *MARK_MOVE = "M";
        constexpr const char *MARK_COPY = "C";
        constexpr const char *MARK_DELETE = "D";

        constexpr const char *SEPARATOR = " │ ";
        constexpr int HEADER_LINES = 6;

        enum class Side : dp::u8 { Left, Right };

        // =========================================================================================
        // ViewState - what the screen shows besides the panes themselves
        // =========================================================================================

        struct ViewState {
            Pane *left = nullptr;
            Pane *right = nullptr;
            Side active = Side::Left;

            dp::usize left_top = 0;
            dp::usize right_top = 0;

            bool show_size = false;
            bool use_ansi = true;
            bool alt_screen = false;

            dp::String message;
            dp::Vector<dp::String> report; // failures of the last commit
            dp::String progress;
        };

        Pane &active_pane(ViewState &s) { return s.active == Side::Left ? *s.left : *s.right; }

        // =========================================================================================
        // Terminal helpers
        // =========================================================================================

        void terminal_size(int &cols, int &rows) {
            struct winsize w;
            if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
                cols = w.ws_col;
                rows = w.ws_row;
                return;
            }
            cols = 80;
            rows = 24;
        }

        // Calculate visible width (excluding ANSI escape codes)
        int visible_width(const std::string &s) {
            int width = 0;
            bool in_escape = false;
            for (size_t i = 0; i < s.size(); ++i) {
                if (s[i] == '\x1b') {
                    in_escape = true;
                } else if (in_escape) {
                    if (s[i] == 'm')
                        in_escape = false;
                } else {
                    unsigned char c = static_cast<unsigned char>(s[i]);
                    if ((c & 0xC0) != 0x80) {
                        ++width;
                    }
                }
            }
            return width;
        }

        // Cuts a plain (unstyled) UTF-8 string to at most max codepoints
        std::string clip(const std::string &s, int max) {
            if (max <= 0)
                return "";
            int width = 0;
            for (size_t i = 0; i < s.size(); ++i) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if ((c & 0xC0) != 0x80) {
                    if (width == max)
                        return s.substr(0, i);
                    ++width;
                }
            }
            return s;
        }

        std::string pad_to(const std::string &s, int width) {
            int missing = width - visible_width(s);
            if (missing <= 0)
                return s;
            return s + std::string(static_cast<size_t>(missing), ' ');
        }

        dp::String format_size(dp::u64 bytes) {
            const char *units[] = {"B", "K", "M", "G", "T"};
            int unit = 0;
            double size = static_cast<double>(bytes);
            while (size >= 1024.0 && unit < 4) {
                size /= 1024.0;
                unit++;
            }
            std::ostringstream oss;
            if (unit == 0) {
                oss << bytes << units[unit];
            } else {
                oss << std::fixed << std::setprecision(1) << size << units[unit];
            }
            return dp::String(oss.str().c_str());
        }

        std::string styled(const std::string &text, const char *color, bool enabled, bool bold = false) {
            if (!enabled)
                return text;
            auto s = echo::format::String(text.c_str()).fg(color);
            if (bold)
                s = s.bold();
            return s.to_string();
        }

        // =========================================================================================
        // Rendering
        // =========================================================================================

        std::string mark_cell(const ViewState &s, const Pane &pane, const Entry &e) {
            auto m = pane.mark_of(e);
            if (!m.has_value())
                return " ";
            switch (m.value()) {
            case Action::Move:
                return styled(MARK_MOVE, "#fabd2f", s.use_ansi, true);
            case Action::Copy:
                return styled(MARK_COPY, "#b8bb26", s.use_ansi, true);
            case Action::Delete:
                return styled(MARK_DELETE, "#fb4934", s.use_ansi, true);
            default:
                return " ";
            }
        }

        std::string render_cell(const ViewState &s, const Pane &pane, dp::usize index, bool active, int width) {
            const auto &entries = pane.entries();
            if (index >= entries.size())
                return std::string(static_cast<size_t>(width), ' ');

            const Entry &e = entries[index];
            bool is_cursor = active && index == pane.cursor();
            std::string line;

            line += is_cursor ? styled("> ", "#FFFFFF", s.use_ansi, true) : "  ";
            line += mark_cell(s, pane, e);
            line += " ";
            if (e.is_directory())
                line += styled(e.is_symlink ? ICON_FOLDER_SYMLINK : ICON_FOLDER, "#00afaf", s.use_ansi);
            else
                line += styled(e.is_symlink ? ICON_FILE_SYMLINK : ICON_FILE, "#928374", s.use_ansi);
            line += " ";

            std::string size_col;
            if (s.show_size && !e.is_directory())
                size_col = std::string("  ") + format_size(e.size).c_str();

            std::string name = e.name.c_str();
            if (e.is_directory())
                name += "/";
            int room = width - visible_width(line) - static_cast<int>(size_col.size());
            name = clip(name, room);

            const char *color = e.is_directory() ? "#689FB6" : (pane.mark_of(e).has_value() ? "#b8bb26" : "#F09F17");
            line += styled(name, color, s.use_ansi, is_cursor);
            if (!size_col.empty())
                line += styled(size_col, "#928374", s.use_ansi);
            return pad_to(line, width);
        }

        void keep_cursor_visible(const Pane &pane, dp::usize &top, dp::usize rows) {
            if (rows == 0)
                return;
            if (pane.cursor() < top)
                top = pane.cursor();
            else if (pane.cursor() >= top + rows)
                top = pane.cursor() - rows + 1;
        }

        void render(ViewState &s) {
            int cols = 80;
            int rows = 24;
            terminal_size(cols, rows);

            int half = (cols - visible_width(SEPARATOR)) / 2;
            if (half < 10)
                half = 10;

            std::cout << "\x1b[2J\x1b[H";
            std::cout << "duet - two-pane browser\r\n";

            std::string left_title = clip(s.left->title().c_str(), half - 2);
            std::string right_title = clip(s.right->title().c_str(), half - 2);
            bool left_active = s.active == Side::Left;
            std::cout << pad_to(styled(left_title, left_active ? "#FFFFFF" : "#928374", s.use_ansi, left_active), half)
                      << SEPARATOR
                      << styled(right_title, left_active ? "#928374" : "#FFFFFF", s.use_ansi, !left_active) << "\r\n";
            std::cout << "j/k:move l/enter:open h/bksp:up w:switch m:move c:copy d:delete u:unmark\r\n";
            std::cout << "x:commit r:refresh .:hidden S:size q:quit";
            if (s.left->mark_count() + s.right->mark_count() > 0)
                std::cout << "  [" << s.left->mark_count() + s.right->mark_count() << " marked]";
            std::cout << "\r\n";

            if (!s.progress.empty())
                std::cout << styled(s.progress.c_str(), "#83a598", s.use_ansi) << "\r\n";
            else if (!s.message.empty())
                std::cout << styled(s.message.c_str(), "#fabd2f", s.use_ansi) << "\r\n";
            else
                std::cout << "\r\n";
            std::cout << "\r\n";

            dp::usize body = rows > HEADER_LINES + 1 ? static_cast<dp::usize>(rows - HEADER_LINES - 1) : 1;
            dp::usize report_lines = s.report.size() < body / 2 ? s.report.size() : body / 2;
            body -= report_lines;

            keep_cursor_visible(*s.left, s.left_top, body);
            keep_cursor_visible(*s.right, s.right_top, body);

            for (dp::usize row = 0; row < body; ++row) {
                dp::usize li = s.left_top + row;
                dp::usize ri = s.right_top + row;
                if (li >= s.left->entries().size() && ri >= s.right->entries().size())
                    break;
                std::cout << render_cell(s, *s.left, li, left_active, half) << SEPARATOR
                          << render_cell(s, *s.right, ri, !left_active, half) << "\r\n";
            }

            for (dp::usize i = 0; i < report_lines; ++i)
                std::cout << styled(clip(s.report[i].c_str(), cols), "#fb4934", s.use_ansi) << "\r\n";
            std::cout << std::flush;
        }

        // =========================================================================================
        // Pane actions
        // =========================================================================================

        void load(ViewState &s, Pane &pane) {
            if (pane.is_loaded())
                return;
            auto status = pane.refresh();
            if (!status)
                s.message = "Error: " + describe(status.error());
        }

        void toggle_mark(ViewState &s, Action action) {
            Pane &pane = active_pane(s);
            auto e = pane.selected();
            if (!e.has_value())
                return;
            auto current = pane.mark_of(e.value());
            if (current.has_value() && current.value() == action)
                pane.unmark(e.value());
            else
                pane.mark(e.value(), action);
            pane.move_cursor(1);
        }

        void open_selected(ViewState &s) {
            Pane &pane = active_pane(s);
            auto e = pane.selected();
            if (!e.has_value() || !e.value().is_directory())
                return;
            auto moved = pane.navigate_into(e.value());
            if (!moved)
                s.message = "Error: " + describe(moved.error());
        }

        void go_up(ViewState &s) {
            auto moved = active_pane(s).navigate_up();
            if (!moved)
                s.message = "Error: " + describe(moved.error());
        }

        void run_commit(ViewState &s, BatchRunner &runner) {
            s.report.clear();
            if (!runner.start(*s.left, *s.right)) {
                s.message = "Nothing marked";
                return;
            }

            while (!runner.poll()) {
                auto p = runner.progress();
                std::ostringstream oss;
                oss << "[" << (p.task_index + 1) << "/" << p.task_count << "] " << p.file.path.c_str();
                if (p.file.bytes_total > 0)
                    oss << "  " << format_size(p.file.bytes_done).c_str() << "/" << format_size(p.file.bytes_total).c_str();
                s.progress = dp::String(oss.str().c_str());
                render(s);
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

            BatchResult result = runner.finish(*s.left, *s.right);
            s.progress.clear();
            auto lines = summarize(result);
            if (!lines.empty()) {
                s.message = lines[0];
                for (dp::usize i = 1; i < lines.size(); ++i)
                    s.report.push_back(lines[i]);
            }
            load(s, *s.left);
            load(s, *s.right);
        }

    } // namespace

    dp::Vector<dp::String> summarize(const BatchResult &result) {
        dp::Vector<dp::String> lines;
        dp::String head = dp::String(std::to_string(result.size()).c_str()) + " task(s): " +
                          std::to_string(result.succeeded()).c_str() + " ok, " +
                          std::to_string(result.failed()).c_str() + " failed";
        lines.push_back(head);
        for (const auto &r : result.results) {
            if (r.outcome.succeeded())
                continue;
            dp::String line = dp::String(action_name(r.task.action)) + " " + r.task.entry.name + ": " +
                              describe(r.outcome.failure.value());
            lines.push_back(line);
        }
        return lines;
    }

    // =============================================================================================
    // Main event loop
    // =============================================================================================

    dp::Result<bool, dp::String> run_view(Session &session, const Config &config) {
        ViewState s;
        s.left = session.left.get();
        s.right = session.right.get();
        s.show_size = config.show_size;
        s.use_ansi = config.use_ansi;
        s.alt_screen = config.alt_screen;

        BatchRunner runner(config.transfer_options());

        // Console logging would tear the raw-mode screen
        auto saved_level = log::level();
        if (!config.verbose)
            log::set_level(log::Level::Off);

        if (s.alt_screen)
            std::cout << "\x1b[?1049h" << std::flush;

        scan::terminal::RawMode raw;

        load(s, *s.left);
        load(s, *s.right);
        render(s);

        auto leave = [&]() {
            if (s.alt_screen)
                std::cout << "\x1b[?1049l" << std::flush;
            log::set_level(saved_level);
        };

        for (;;) {
            auto key = scan::input::read_key();
            if (!key) {
                leave();
                return dp::result::Err(dp::String("failed to read key"));
            }

            s.message.clear();
            s.report.clear();

            Pane &pane = active_pane(s);
            using scan::input::Key;
            switch (key->key) {
            case Key::Up:
            case Key::CtrlP:
                pane.move_cursor(-1);
                break;
            case Key::Down:
            case Key::CtrlN:
                pane.move_cursor(1);
                break;
            case Key::Right:
            case Key::Enter:
                open_selected(s);
                break;
            case Key::Left:
            case Key::Backspace:
                go_up(s);
                break;
            case Key::Escape:
            case Key::CtrlC:
                leave();
                return dp::result::Ok(true);
            case Key::Rune:
                switch (key->rune) {
                case 'q':
                case 'Q':
                    leave();
                    return dp::result::Ok(true);
                case 'j':
                    pane.move_cursor(1);
                    break;
                case 'k':
                    pane.move_cursor(-1);
                    break;
                case 'g': // Go to top
                    pane.set_cursor(0);
                    break;
                case 'G': // Go to bottom
                    if (!pane.entries().empty())
                        pane.set_cursor(pane.entries().size() - 1);
                    break;
                case 'l':
                    open_selected(s);
                    break;
                case 'h':
                case '-':
                    go_up(s);
                    break;
                case 'w': // Switch pane
                    s.active = s.active == Side::Left ? Side::Right : Side::Left;
                    break;
                case 'm':
                    toggle_mark(s, Action::Move);
                    break;
                case 'c':
                    toggle_mark(s, Action::Copy);
                    break;
                case 'd':
                    toggle_mark(s, Action::Delete);
                    break;
                case 'u': {
                    auto e = pane.selected();
                    if (e.has_value())
                        pane.unmark(e.value());
                } break;
                case 'U': // Clear all marks
                    s.left->clear_marks();
                    s.right->clear_marks();
                    break;
                case 'x': // Commit
                    run_commit(s, runner);
                    break;
                case 'r':
                case 'R':
                    s.left->invalidate();
                    s.right->invalidate();
                    load(s, *s.left);
                    load(s, *s.right);
                    s.message = "Refreshed";
                    break;
                case '.':
                    s.left->set_show_hidden(!s.left->show_hidden());
                    s.right->set_show_hidden(!s.right->show_hidden());
                    load(s, *s.left);
                    load(s, *s.right);
                    break;
                case 'S':
                    s.show_size = !s.show_size;
                    break;
                }
                break;
            default:
                break;
            }

            render(s);
        }
    }

} // namespace duet
