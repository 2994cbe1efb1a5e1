#include "ingest.hpp"
#include "captions.hpp"
#include "log.hpp"
#include <algorithm>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

const char* to_string(IngestOutcome o) {
  switch (o) {
    case IngestOutcome::indexed:     return "indexed";
    case IngestOutcome::unavailable: return "unavailable";
    case IngestOutcome::failed:      return "failed";
    case IngestOutcome::skipped:     return "skipped";
  }
  return "unknown";
}

IngestPipeline::IngestPipeline(Store& store, MediaSource& source,
                               const IngestOptions& opts, std::ostream& log)
  : store_(store), source_(source), opts_(opts), log_(log) {}

int IngestPipeline::default_threads() {
  unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) hw = 4;
  return (int)std::min<unsigned>(32u, hw + 4);
}

IngestOutcome IngestPipeline::process(const std::string& video_id, const std::string& lang,
                                      const std::atomic<bool>& abort) {
  auto track = source_.fetch_captions(video_id, lang);
  // the fetch may outlive an abort; drop its result rather than write
  if (abort.load()) return IngestOutcome::skipped;

  if (!track) {
    store_.set_language_availability(video_id, lang, false);
    return IngestOutcome::unavailable;
  }
  if (track->video.video_id != video_id)
    throw MetadataError("metadata is for '" + track->video.video_id + "', expected '" + video_id + "'");

  auto segments = normalize_cues(video_id, lang, track->cues);
  store_.write_captions(track->channel, track->video, lang, segments);
  if (opts_.verbose)
    log_write(log_, "[ingest] " + video_id + ": " + std::to_string(segments.size()) +
                    " segments (" + std::to_string(track->cues.size()) + " cues)\n");
  return IngestOutcome::indexed;
}

IngestSummary IngestPipeline::run(const std::vector<std::string>& video_ids,
                                  const std::string& lang,
                                  const std::atomic<bool>& abort,
                                  const ProgressFn& on_progress) {
  IngestSummary summary;
  summary.total = video_ids.size();
  if (video_ids.empty()) return summary;

  int threads = opts_.max_threads > 0 ? opts_.max_threads : default_threads();
  unsigned num_workers = (unsigned)std::min<size_t>((size_t)threads, video_ids.size());

  std::atomic<size_t> next{0};
  std::atomic<bool> stop{false};
  std::mutex report_mu;
  size_t done = 0;
  std::exception_ptr progress_error;

  auto report = [&](const std::string& id, IngestOutcome outcome, const std::string& error) {
    std::lock_guard<std::mutex> lk(report_mu);
    switch (outcome) {
      case IngestOutcome::indexed:     ++summary.indexed; break;
      case IngestOutcome::unavailable: ++summary.unavailable; break;
      case IngestOutcome::skipped:     ++summary.skipped; break;
      case IngestOutcome::failed:
        ++summary.failed;
        summary.failures.push_back(IngestFailure{ id, error });
        log_write(log_, "[ingest] Error downloading subtitles for " + id + ": " + error + "\n");
        break;
    }
    ++done;
    if (!on_progress || progress_error) return;
    try {
      on_progress(done, summary.total, id, outcome);
    } catch (...) {
      // rethrown from run() once the workers have stopped
      progress_error = std::current_exception();
      stop = true;
    }
  };

  auto worker = [&]() {
    while (!abort.load() && !stop.load()) {
      size_t i = next.fetch_add(1);
      if (i >= video_ids.size()) break;
      const std::string& id = video_ids[i];
      IngestOutcome outcome;
      std::string error;
      try {
        outcome = process(id, lang, abort);
      } catch (const std::exception& e) {
        // an interrupted fetch fails too; count it as abandoned, not broken
        outcome = abort.load() ? IngestOutcome::skipped : IngestOutcome::failed;
        error = e.what();
      }
      report(id, outcome, error);
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(num_workers);
  try {
    for (unsigned t = 0; t < num_workers; ++t) workers.emplace_back(worker);
  } catch (const std::system_error&) {
    stop = true;
    for (auto& w : workers) w.join();
    throw;
  }
  for (auto& w : workers) w.join();
  if (progress_error) std::rethrow_exception(progress_error);

  // ids nobody claimed before the abort
  size_t claimed = std::min(next.load(), video_ids.size());
  summary.skipped += video_ids.size() - claimed;
  summary.aborted = abort.load();
  return summary;
}
