#include "cli.hpp"
#include "commands.hpp"
#include "store.hpp"
#include "ytdlp_source.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>

static std::atomic<bool> g_abort{false};

static void on_sigint(int) {
  g_abort.store(true);
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);
  std::signal(SIGINT, on_sigint);

  try {
    Store store(args.sqlite_path);

    YtDlpConfig cfg;
    cfg.binary = args.ytdlp;
    cfg.verbose = args.verbose;
    YtDlpSource source(cfg, std::cerr);

    int rc = dispatch(args, store, source, g_abort, std::cout, std::cerr);
    if (rc == EXIT_OK && g_abort.load()) return EXIT_ABORTED;
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return g_abort.load() ? EXIT_ABORTED : EXIT_FATAL;
  }
}
