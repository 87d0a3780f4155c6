#pragma once

#include <string>
#include <vector>

#include "internal/db/model/check_record.hpp"

namespace resync::lock {

struct MergeResult {
  std::vector<db::model::LineItemRecord> line_items;
  // Ids present in both versions with different quantities.
  std::vector<std::string> diverged;
};

/*
  Union of two versions' line items keyed by line item id.

  Items of `original` keep their order, items only in `clone` follow.
  When both carry an id the copy with the later updated_at_ms wins, ties
  go to `original`; a quantity mismatch is reported in `diverged`. The
  winner replaces the whole line item, so a field edited only on the
  losing copy is lost. Callers show `diverged` to the manager.
*/
MergeResult MergeLineItems(const std::vector<db::model::LineItemRecord>& original, const std::vector<db::model::LineItemRecord>& clone);

} // namespace resync::lock
