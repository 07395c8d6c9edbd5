#pragma once

#include "duet/action.hpp"
#include "duet/provider.hpp"

#include <datapod/datapod.hpp>

#include <map>
#include <memory>

namespace duet {

    struct MarkedEntry {
        Entry entry;
        Location location; // directory the entry was listed in when marked
        Action action{};
        dp::u64 seq{};
    };

    // =============================================================================================
    // Pane - one side of the browser: provider, current location, cached listing, cursor, marks
    // =============================================================================================
    //
    // Not thread-safe; only the view thread touches a Pane. The cached listing and the cursor are
    // dropped together whenever the location changes.

    class Pane {
      public:
        Pane(std::shared_ptr<Provider> provider, Location start);

        const std::shared_ptr<Provider> &provider() const { return provider_; }
        const Location &location() const { return location_; }
        dp::String title() const { return provider_->display(location_); }

        void set_show_hidden(bool show);
        bool show_hidden() const { return show_hidden_; }

        // Listing of the current location; lists through the provider when the cache is invalid
        Result<dp::Vector<Entry>> current_entries();

        // Cached listing as last loaded (empty while invalid)
        const dp::Vector<Entry> &entries() const { return entries_; }
        bool is_loaded() const { return loaded_; }

        Status refresh();
        void invalidate();

        // Cursor
        dp::usize cursor() const { return cursor_; }
        void move_cursor(dp::i32 delta);
        void set_cursor(dp::usize index);
        dp::Optional<Entry> selected() const;

        // Marks. An entry belongs to at most one action; marking again for another action moves it.
        void mark(const Entry &entry, Action action);
        void unmark(const Entry &entry);
        dp::Optional<Action> mark_of(const Entry &entry) const;
        dp::Vector<MarkedEntry> marked(Action action) const; // insertion order
        dp::usize mark_count() const { return marks_.size(); }
        void clear_marks();

        // Navigation; Ok(false) when nothing changed
        Status navigate_into(const Entry &entry);
        Status navigate_up();
        Status navigate_to(const Location &location);

      private:
        Result<dp::Vector<Entry>> fetch(const Location &location) const;
        void clamp_cursor();

        std::shared_ptr<Provider> provider_;
        Location location_;

        dp::Vector<Entry> entries_;
        bool loaded_ = false;
        dp::usize cursor_ = 0;
        bool show_hidden_ = false;

        std::map<dp::String, MarkedEntry> marks_; // raw_key -> mark
        dp::u64 next_seq_ = 1;
    };

} // namespace duet
