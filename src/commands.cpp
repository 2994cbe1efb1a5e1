#include "commands.hpp"
#include "clips.hpp"
#include "ingest.hpp"
#include "log.hpp"
#include "planner.hpp"
#include "report.hpp"
#include "search.hpp"
#include <algorithm>
#include <cctype>

static OutputFormat format_of(const Args& a) {
  return a.format == "json" ? OutputFormat::json : OutputFormat::table;
}

// "Hello World" -> "output-hello-world"
static std::string clips_folder(const std::string& text) {
  std::string f = "output-" + text;
  std::replace(f.begin(), f.end(), ' ', '-');
  std::transform(f.begin(), f.end(), f.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return f;
}

int cmd_index(const Args& a, Store& store, MediaSource& source,
              const std::atomic<bool>& abort, std::ostream& out, std::ostream& log) {
  log << "Fetching video urls from " << a.target << "...\n";
  auto ids = source.list_video_ids(a.target);

  Planner planner(store);
  auto todo = planner.needs_indexing(ids, a.lang);
  log << "[index] " << ids.size() << " videos, " << todo.size()
      << " without '" << a.lang << "' subtitles yet\n";

  IngestOptions opts;
  opts.max_threads = a.max_threads;
  opts.verbose = a.verbose;
  IngestPipeline pipeline(store, source, opts, log);

  auto summary = pipeline.run(todo, a.lang, abort,
    [&](size_t done, size_t total, const std::string&, IngestOutcome) {
      log_write(log, "\rDownloading subtitles: " + std::to_string(done) + "/" +
                     std::to_string(total));
    });
  if (summary.total > 0) log << "\n";

  out << "indexed=" << summary.indexed << " unavailable=" << summary.unavailable
      << " failed=" << summary.failed << " skipped=" << summary.skipped << "\n";
  if (summary.aborted) {
    log << "Aborting...\n";
    return EXIT_ABORTED;
  }
  return EXIT_OK;
}

int cmd_search(const Args& a, Store& store, MediaSource& source,
               std::ostream& out, std::ostream& log) {
  SearchQuery q{ a.target, a.user, a.lang };
  auto rows = search_all(store, q);
  if (rows.empty()) {
    out << "No results\n";
    return EXIT_OK;
  }

  if (a.download_parts) {
    out << "Downloading " << rows.size() << " parts...\n";
    ClipExtractor clips(source, clips_folder(a.target), a.spacing_secs, log);
    auto s = clips.extract_all(rows);
    out << "downloaded=" << s.downloaded << " already_archived=" << s.already_archived
        << " failed=" << s.failed << "\n";
    return EXIT_OK;
  }

  print_rows(out, rows, format_of(a));
  return EXIT_OK;
}

int cmd_list_channels(const Args& a, Store& store, std::ostream& out) {
  print_channels(out, store.list_channels(), format_of(a));
  return EXIT_OK;
}

int cmd_list_videos(const Args& a, Store& store, std::ostream& out) {
  print_videos(out, store.list_videos(), format_of(a));
  return EXIT_OK;
}

int cmd_stats(const Args& a, Store& store, std::ostream& out) {
  print_stats(out, store.stats(), format_of(a));
  return EXIT_OK;
}

int cmd_remove_channel(const Args& a, Store& store, std::ostream& out) {
  if (!store.get_channel(a.target)) {
    out << "No channel " << a.target << "\n";
    return EXIT_OK;
  }
  store.delete_channel(a.target);
  out << "Removed channel " << a.target << "\n";
  return EXIT_OK;
}

int cmd_remove_video(const Args& a, Store& store, std::ostream& out) {
  if (!store.get_video(a.target)) {
    out << "No video " << a.target << "\n";
    return EXIT_OK;
  }
  store.delete_video(a.target);
  out << "Removed video " << a.target << "\n";
  return EXIT_OK;
}

int dispatch(const Args& a, Store& store, MediaSource& source,
             const std::atomic<bool>& abort, std::ostream& out, std::ostream& log) {
  if (a.mode == "index") return cmd_index(a, store, source, abort, out, log);
  if (a.mode == "search") return cmd_search(a, store, source, out, log);
  if (a.mode == "list-channels") return cmd_list_channels(a, store, out);
  if (a.mode == "list-videos") return cmd_list_videos(a, store, out);
  if (a.mode == "stats") return cmd_stats(a, store, out);
  if (a.mode == "remove-channel") return cmd_remove_channel(a, store, out);
  if (a.mode == "remove-video") return cmd_remove_video(a, store, out);
  log << "Unknown command: " << a.mode << "\n";
  return EXIT_FATAL;
}
