#pragma once
#include "cli.hpp"
#include "media_source.hpp"
#include "store.hpp"
#include <atomic>
#include <ostream>

// Each command writes results to `out` and diagnostics to `log`, and
// returns the process exit status.
int cmd_index(const Args& a, Store& store, MediaSource& source,
              const std::atomic<bool>& abort, std::ostream& out, std::ostream& log);
int cmd_search(const Args& a, Store& store, MediaSource& source,
               std::ostream& out, std::ostream& log);
int cmd_list_channels(const Args& a, Store& store, std::ostream& out);
int cmd_list_videos(const Args& a, Store& store, std::ostream& out);
int cmd_stats(const Args& a, Store& store, std::ostream& out);
int cmd_remove_channel(const Args& a, Store& store, std::ostream& out);
int cmd_remove_video(const Args& a, Store& store, std::ostream& out);

int dispatch(const Args& a, Store& store, MediaSource& source,
             const std::atomic<bool>& abort, std::ostream& out, std::ostream& log);
