// src/planner.cpp
#include "planner.hpp"
#include "sqlite_db.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::vector<std::string> Planner::needs_indexing(const std::vector<std::string>& candidate_ids,
                                                 const std::string& lang) const {
  if (candidate_ids.empty()) return {};

  // one round trip: the whole candidate list travels as a JSON array
  json ids = candidate_ids;

  auto db = Db::reader(store_.path());
  Stmt st(db,
    "SELECT c.value FROM json_each(?1) c "
    "WHERE c.value NOT IN ("
    "  SELECT video_id FROM video_languages WHERE lang = ?2 OR available = 0"
    ") "
    "GROUP BY c.value ORDER BY MIN(c.key);");
  st.bind(1, ids.dump());
  st.bind(2, lang);

  std::vector<std::string> out;
  while (st.step()) out.push_back(st.text(0));
  return out;
}
