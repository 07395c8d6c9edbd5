#pragma once

#include "duet/object_store.hpp"
#include "duet/provider.hpp"

#include <memory>

namespace duet {

    // =============================================================================================
    // ObjectStoreProvider - flat key namespace presented as a tree
    // =============================================================================================
    //
    // A Location maps to the key formed by joining its segments with '/'. Pseudo-directories are
    // never stored: a directory exists while at least one key lives under "<path>/". Objects whose
    // key ends in '/' (markers left by other tools) are honoured but never written.

    class ObjectStoreProvider : public Provider {
      public:
        explicit ObjectStoreProvider(std::shared_ptr<ObjectStoreClient> client);

        dp::String id() const override;
        dp::String display(const Location &location) const override;
        Location root() const override;

        Result<dp::Vector<Entry>> list(const Location &location) const override;
        Result<Entry> stat(const Location &location) const override;

        Result<std::unique_ptr<ReadStream>> open_read(const Location &location) const override;
        Result<std::unique_ptr<WriteStream>> open_write(const Location &location) override;

        Status remove(const Location &location) override;
        Status make_container(const Location &location) override;
        Status remove_container(const Location &location) override;

        ObjectStoreClient &client() { return *client_; }

        static dp::String key_of(const Location &location);
        // "" at the root, "<key>/" elsewhere
        static dp::String prefix_of(const Location &location);

      private:
        // True when any key (marker included) lives under prefix
        Result<bool> has_children(const dp::String &prefix) const;

        std::shared_ptr<ObjectStoreClient> client_;
    };

} // namespace duet
