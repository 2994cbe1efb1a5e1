#pragma once
#include "media_source.hpp"
#include "store.hpp"
#include <atomic>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

enum class IngestOutcome { indexed, unavailable, failed, skipped };

const char* to_string(IngestOutcome o);

struct IngestOptions {
  // Worker threads; 0 picks min(32, hardware threads + 4)
  int max_threads = 0;
  bool verbose = false;
};

struct IngestFailure {
  std::string video_id;
  std::string message;
};

struct IngestSummary {
  size_t total = 0;
  size_t indexed = 0;
  size_t unavailable = 0;
  size_t failed = 0;
  size_t skipped = 0;   // never started, or fetched after an abort and dropped
  bool aborted = false;
  std::vector<IngestFailure> failures;
};

// Called once per finished id, never concurrently; `done` strictly increases.
// If it throws, no further ids are started and run() rethrows the exception.
using ProgressFn = std::function<void(size_t done, size_t total,
                                     const std::string& video_id, IngestOutcome outcome)>;

// Fetches caption tracks on a pool of workers and writes each video as one
// store transaction. A failing id is recorded and never stops the others.
class IngestPipeline {
public:
  IngestPipeline(Store& store, MediaSource& source, const IngestOptions& opts, std::ostream& log);

  IngestSummary run(const std::vector<std::string>& video_ids,
                    const std::string& lang,
                    const std::atomic<bool>& abort,
                    const ProgressFn& on_progress = {});

  static int default_threads();

private:
  IngestOutcome process(const std::string& video_id, const std::string& lang,
                        const std::atomic<bool>& abort);

  Store& store_;
  MediaSource& source_;
  IngestOptions opts_;
  std::ostream& log_;
};
