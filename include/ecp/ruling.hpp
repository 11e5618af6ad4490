#pragma once

// ecp/ruling.hpp - Human rulings and the precedents they create.
//
// One ruling per event, written once to rulings/<event_id>. A ruling with
// precedent_created covers later events whose action type is listed in
// applicable_event_types (either "x" or "decision_x"), until
// issued_at + validity_days.

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ecp/ledger.hpp"
#include "ecp/record_store.hpp"
#include "ecp/types.hpp"

namespace ecp {

class RulingRegistry {
 public:
  RulingRegistry(IRecordStore& store, const Ledger& ledger, Clock clock = {});

  // Errors:
  //   unknown_event       event_id is not a decision event in the ledger
  //   ruling_invalid      empty issued_by, or a precedent without a validity window
  //   ruling_exists       the event already has a ruling
  //   store_write_failed
  // Fills ruling.action_type from the ledger and stamps issued_at_unix_ms when zero.
  ErrorCode create_ruling(HumanRuling& ruling, std::string* detail = nullptr);

  std::optional<HumanRuling> find(const std::string& event_id) const;
  // Newest unexpired precedent covering action_type.
  std::optional<HumanRuling> find_precedent(const std::string& action_type, uint64_t now_ms) const;
  std::vector<HumanRuling> precedents() const;
  std::size_t size() const;

 private:
  void load_existing();

  IRecordStore& store_;
  const Ledger& ledger_;
  Clock clock_;
  mutable std::mutex mu_;
  std::map<std::string, HumanRuling> rulings_;  // event id -> ruling
};

}  // namespace ecp
