#include "duet/pane.hpp"
#include "duet/log.hpp"

#include <algorithm>
#include <utility>

namespace duet {

    namespace {
        bool is_hidden_name(const dp::String &name) { return !name.empty() && name[0] == '.'; }
    } // namespace

    Pane::Pane(std::shared_ptr<Provider> provider, Location start)
        : provider_(std::move(provider)), location_(std::move(start)) {}

    void Pane::set_show_hidden(bool show) {
        if (show_hidden_ == show)
            return;
        show_hidden_ = show;
        invalidate();
    }

    // =============================================================================================
    // Listing cache
    // =============================================================================================

    Result<dp::Vector<Entry>> Pane::fetch(const Location &location) const {
        auto listed = provider_->list(location);
        if (!listed)
            return listed;
        if (show_hidden_)
            return listed;

        dp::Vector<Entry> visible;
        for (auto &e : listed.value()) {
            if (!is_hidden_name(e.name))
                visible.push_back(std::move(e));
        }
        return dp::result::Ok(std::move(visible));
    }

    Result<dp::Vector<Entry>> Pane::current_entries() {
        if (!loaded_) {
            auto status = refresh();
            if (!status)
                return dp::result::Err(status.error());
        }
        return dp::result::Ok(entries_);
    }

    Status Pane::refresh() {
        auto listed = fetch(location_);
        if (!listed) {
            entries_.clear();
            loaded_ = false;
            clamp_cursor();
            return dp::result::Err(listed.error());
        }
        entries_ = std::move(listed.value());
        loaded_ = true;
        clamp_cursor();
        return ok();
    }

    void Pane::invalidate() {
        entries_.clear();
        loaded_ = false;
    }

    // =============================================================================================
    // Cursor
    // =============================================================================================

    void Pane::clamp_cursor() {
        if (entries_.empty()) {
            cursor_ = 0;
        } else if (cursor_ >= entries_.size()) {
            cursor_ = entries_.size() - 1;
        }
    }

    void Pane::move_cursor(dp::i32 delta) {
        if (entries_.empty())
            return;
        dp::i32 last = static_cast<dp::i32>(entries_.size()) - 1;
        dp::i32 next = static_cast<dp::i32>(cursor_) + delta;
        next = std::clamp(next, 0, last);
        cursor_ = static_cast<dp::usize>(next);
    }

    void Pane::set_cursor(dp::usize index) {
        cursor_ = index;
        clamp_cursor();
    }

    dp::Optional<Entry> Pane::selected() const {
        if (entries_.empty() || cursor_ >= entries_.size())
            return dp::Optional<Entry>{};
        return dp::Optional<Entry>(entries_[cursor_]);
    }

    // =============================================================================================
    // Marks
    // =============================================================================================

    void Pane::mark(const Entry &entry, Action action) {
        auto it = marks_.find(entry.raw_key);
        if (it != marks_.end() && it->second.action == action)
            return;
        MarkedEntry m;
        m.entry = entry;
        m.location = location_;
        m.action = action;
        m.seq = next_seq_++;
        marks_[entry.raw_key] = std::move(m);
        log::trace("marked ", entry.raw_key, " for ", action_name(action));
    }

    void Pane::unmark(const Entry &entry) { marks_.erase(entry.raw_key); }

    dp::Optional<Action> Pane::mark_of(const Entry &entry) const {
        auto it = marks_.find(entry.raw_key);
        if (it == marks_.end())
            return dp::Optional<Action>{};
        return dp::Optional<Action>(it->second.action);
    }

    dp::Vector<MarkedEntry> Pane::marked(Action action) const {
        dp::Vector<MarkedEntry> out;
        for (const auto &kv : marks_) {
            if (kv.second.action == action)
                out.push_back(kv.second);
        }
        std::sort(out.begin(), out.end(), [](const MarkedEntry &a, const MarkedEntry &b) { return a.seq < b.seq; });
        return out;
    }

    void Pane::clear_marks() { marks_.clear(); }

    // =============================================================================================
    // Navigation
    // =============================================================================================

    Status Pane::navigate_to(const Location &location) {
        if (location == location_ && loaded_)
            return dp::result::Ok(false);
        auto listed = fetch(location);
        if (!listed)
            return dp::result::Err(listed.error());
        location_ = location;
        entries_ = std::move(listed.value());
        loaded_ = true;
        cursor_ = 0;
        return dp::result::Ok(true);
    }

    Status Pane::navigate_into(const Entry &entry) {
        if (!entry.is_directory())
            return fail(ErrorKind::Unsupported, "not a directory: " + entry.name);
        return navigate_to(location_.child(entry.name));
    }

    Status Pane::navigate_up() {
        if (location_.is_root())
            return dp::result::Ok(false);
        dp::String came_from = location_.name();
        auto moved = navigate_to(location_.parent());
        if (!moved)
            return moved;
        for (dp::usize i = 0; i < entries_.size(); ++i) {
            if (entries_[i].name == came_from && entries_[i].is_directory()) {
                cursor_ = i;
                break;
            }
        }
        return moved;
    }

} // namespace duet
