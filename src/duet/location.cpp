#include "duet/location.hpp"

#include <utility>

namespace duet {

    Location::Location(dp::String provider, dp::Vector<dp::String> segments)
        : provider_(std::move(provider)), segments_(std::move(segments)) {}

    Location Location::parse(const dp::String &provider, const dp::String &path) {
        dp::Vector<dp::String> segments;
        dp::String current;
        for (dp::usize i = 0; i < path.size(); ++i) {
            char c = path[i];
            if (c == '/') {
                if (!current.empty())
                    segments.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        if (!current.empty())
            segments.push_back(current);
        return Location(provider, std::move(segments));
    }

    dp::String Location::name() const {
        if (segments_.empty())
            return "";
        return segments_.back();
    }

    Location Location::child(const dp::String &name) const {
        auto segments = segments_;
        segments.push_back(name);
        return Location(provider_, std::move(segments));
    }

    Location Location::parent() const {
        auto segments = segments_;
        if (!segments.empty())
            segments.pop_back();
        return Location(provider_, std::move(segments));
    }

    dp::String Location::join(char sep) const {
        dp::String out;
        for (dp::usize i = 0; i < segments_.size(); ++i) {
            if (i > 0)
                out += sep;
            out += segments_[i];
        }
        return out;
    }

    bool Location::contains(const Location &other) const {
        if (!(provider_ == other.provider_))
            return false;
        if (other.segments_.size() < segments_.size())
            return false;
        for (dp::usize i = 0; i < segments_.size(); ++i) {
            if (!(segments_[i] == other.segments_[i]))
                return false;
        }
        return true;
    }

    bool Location::operator==(const Location &other) const {
        if (!(provider_ == other.provider_) || segments_.size() != other.segments_.size())
            return false;
        for (dp::usize i = 0; i < segments_.size(); ++i) {
            if (!(segments_[i] == other.segments_[i]))
                return false;
        }
        return true;
    }

} // namespace duet
