#pragma once
#include "store.hpp"
#include <string>
#include <vector>

// Decides which candidate videos still need a caption fetch for a language.
class Planner {
public:
  explicit Planner(const Store& store) : store_(store) {}

  // Drops ids that already have an availability row for `lang`, and ids
  // with any row marked unavailable (any language). Input order is kept,
  // duplicates collapse to their first occurrence.
  std::vector<std::string> needs_indexing(const std::vector<std::string>& candidate_ids,
                                          const std::string& lang) const;

private:
  const Store& store_;
};
