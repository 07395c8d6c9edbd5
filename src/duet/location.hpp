#pragma once

#include <datapod/datapod.hpp>

namespace duet {

    // =============================================================================================
    // Location - a position inside exactly one provider's namespace
    // =============================================================================================

    class Location {
      public:
        Location() = default;
        Location(dp::String provider, dp::Vector<dp::String> segments);

        // Splits on '/', dropping empty segments
        static Location parse(const dp::String &provider, const dp::String &path);

        const dp::String &provider() const { return provider_; }
        const dp::Vector<dp::String> &segments() const { return segments_; }

        bool is_root() const { return segments_.empty(); }
        dp::usize depth() const { return segments_.size(); }

        // Last segment, empty at the root
        dp::String name() const;

        Location child(const dp::String &name) const;
        Location parent() const;

        // Segments joined by sep, no leading or trailing separator
        dp::String join(char sep = '/') const;

        // Ancestor-or-self test; false across providers
        bool contains(const Location &other) const;

        bool operator==(const Location &other) const;
        bool operator!=(const Location &other) const { return !(*this == other); }

      private:
        dp::String provider_;
        dp::Vector<dp::String> segments_;
    };

} // namespace duet
