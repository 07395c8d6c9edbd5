// Scripted walk through a commit: marks a local directory for Copy into an in-memory bucket,
// commits, and prints both panes before and after.
#include "duet/batch.hpp"
#include "duet/local_provider.hpp"
#include "duet/memory_bucket.hpp"
#include "duet/object_store_provider.hpp"
#include "duet/view.hpp"

#include <datapod/datapod.hpp>
#include <echo/format.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

static void print_pane(const char *label, duet::Pane &pane) {
    std::cout << echo::format::String(label).fg("#FFFFFF").bold().to_string() << " "
              << pane.title() << "\n";
    auto entries = pane.current_entries();
    if (!entries) {
        std::cout << "  " << echo::format::String(duet::describe(entries.error()).c_str()).fg("#fb4934").to_string()
                  << "\n";
        return;
    }
    for (const auto &e : entries.value()) {
        dp::String line;
        line += "  ";
        if (e.is_directory()) {
            line += echo::format::String((std::string(e.name.c_str()) + "/").c_str()).fg("#689FB6").to_string();
        } else {
            line += echo::format::String(e.name.c_str()).fg("#F09F17").to_string();
            line += " ";
            line += std::to_string(e.size).c_str();
        }
        std::cout << line << "\n";
    }
}

int main() {
    fs::path work = fs::temp_directory_path() / "duet-bucket-copy";
    std::error_code ec;
    fs::remove_all(work, ec);
    fs::create_directories(work / "src" / "sub", ec);
    if (ec) {
        std::cerr << "error: " << ec.message() << "\n";
        return 1;
    }
    std::ofstream(work / "src" / "a.txt") << "alpha\n";
    std::ofstream(work / "src" / "sub" / "b.txt") << "bravo bravo\n";

    auto local = std::make_shared<duet::LocalProvider>();
    auto bucket = std::make_shared<duet::MemoryBucket>("demo");
    auto store = std::make_shared<duet::ObjectStoreProvider>(bucket);

    duet::Pane left(local, duet::LocalProvider::locate(work));
    duet::Pane right(store, duet::Location::parse(store->id(), "dest"));

    std::cout << "=== before ===\n";
    print_pane("left ", left);
    print_pane("right", right);

    auto entries = left.current_entries();
    if (!entries) {
        std::cerr << "error: " << duet::describe(entries.error()).c_str() << "\n";
        return 1;
    }
    for (const auto &e : entries.value()) {
        if (e.name == dp::String("src"))
            left.mark(e, duet::Action::Copy);
    }

    duet::TransferEngine engine;
    auto result = duet::commit(left, right, engine);
    for (const auto &line : duet::summarize(result))
        std::cout << line << "\n";

    std::cout << "\n=== after ===\n";
    print_pane("left ", left);
    print_pane("right", right);

    dp::Vector<duet::Entry> landed = right.entries();
    for (const auto &e : landed) {
        if (e.is_directory() && right.navigate_into(e)) {
            print_pane("right", right);
            break;
        }
    }

    fs::remove_all(work, ec);
    return result.failed() == 0 ? 0 : 1;
}
