#include "conflict_merge.hpp"

#include <unordered_map>
#include <unordered_set>

namespace resync::lock {

MergeResult MergeLineItems(const std::vector<db::model::LineItemRecord>& original, const std::vector<db::model::LineItemRecord>& clone) {
  std::unordered_map<std::string, const db::model::LineItemRecord*> by_id;
  for (const auto& item : clone) by_id.emplace(item.id, &item);

  MergeResult                     result;
  std::unordered_set<std::string> seen;

  for (const auto& item : original) {
    seen.insert(item.id);

    auto it = by_id.find(item.id);
    if (it == by_id.end()) {
      result.line_items.push_back(item);
      continue;
    }

    // last write wins per line item, not per field
    const auto& other = *it->second;
    if (other.quantity != item.quantity) result.diverged.push_back(item.id);
    result.line_items.push_back(other.updated_at_ms > item.updated_at_ms ? other : item);
  }

  for (const auto& item : clone) {
    if (seen.insert(item.id).second) result.line_items.push_back(item);
  }

  return result;
}

} // namespace resync::lock
