#include "duet/config.hpp"
#include "duet/log.hpp"
#include "duet/session.hpp"
#include "duet/view.hpp"

#include <argu/argu.hpp>
#include <datapod/datapod.hpp>

#include <iostream>
#include <string>
#include <unistd.h>

int main(int argc, char *argv[]) {
    duet::Config config;

    auto cmd =
        argu::Command("duet")
            .version("0.1.0")
            .about("Two-pane browser for a local directory and an object-store bucket")
            .arg(argu::Arg("path").positional().help("Directory for the left pane").value_of(config.left_path))
            .arg(argu::Arg("right").long_name("right").help("Directory for the right pane").value_of(config.right_path))
            .arg(argu::Arg("bucket-dir")
                     .long_name("bucket-dir")
                     .help("Serve the right pane from a bucket stored in this directory")
                     .value_of(config.bucket_dir))
            .arg(argu::Arg("bucket")
                     .long_name("bucket")
                     .help("S3 bucket for the right pane (with --bucket-dir: its name)")
                     .value_of(config.bucket_name))
            .arg(argu::Arg("prefix").long_name("prefix").help("Key prefix to open in the bucket").value_of(config.bucket_prefix))
            .arg(argu::Arg("region").long_name("region").help("S3 region").value_of(config.s3_region))
            .arg(argu::Arg("endpoint")
                     .long_name("endpoint")
                     .help("S3-compatible endpoint URL")
                     .value_of(config.s3_endpoint))
            .arg(argu::Arg("all").short_name('a').long_name("all").help("Show hidden entries").flag(config.show_hidden))
            .arg(argu::Arg("alt")
                     .short_name('A')
                     .long_name("alt-screen")
                     .help("Use alternate screen buffer")
                     .flag(config.alt_screen))
            .arg(argu::Arg("size").short_name('s').long_name("size").help("Show file size column").flag(config.show_size))
            .arg(argu::Arg("buffer")
                     .long_name("buffer-kib")
                     .help("Transfer buffer size in KiB")
                     .value_of(config.buffer_kib)
                     .default_value(64))
            .arg(argu::Arg("no-clobber")
                     .short_name('n')
                     .long_name("no-clobber")
                     .help("Fail instead of overwriting existing files")
                     .flag(config.no_clobber))
            .arg(argu::Arg("verbose").short_name('v').long_name("verbose").help("Log debug output").flag(config.verbose))
            .arg(argu::Arg("quiet").short_name('q').long_name("quiet").help("Only log errors").flag(config.quiet));

    auto parsed = cmd.parse(argc, argv);
    if (!parsed || !parsed.message().empty())
        return parsed.exit();

    config.use_ansi = isatty(STDOUT_FILENO) != 0;

    auto valid = config.validate();
    if (!valid) {
        std::cerr << "error: " << valid.error().message.c_str() << "\n";
        return 2;
    }
    duet::log::set_level(config.log_level());

    auto session = duet::open_session(config);
    if (!session) {
        std::cerr << "error: " << duet::describe(session.error()).c_str() << "\n";
        return 2;
    }

    auto result = duet::run_view(session.value(), config);
    if (!result) {
        std::cerr << "error: " << result.error().c_str() << "\n";
        return 1;
    }
    return 0;
}
