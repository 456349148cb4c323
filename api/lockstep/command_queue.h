#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "command.h"

namespace lockstep {

enum class AddResult {
  Accepted,
  Stale,               // tick already released
  UnknownParticipant,  // sender is not in the roster
};

const char* AddResultName(AddResult r);

struct QueueStats {
  int64_t current_tick = 0;
  size_t queued_ticks = 0;
  std::map<std::string, size_t> per_participant_backlog;
  uint64_t total_released = 0;
  uint64_t stale_rejected = 0;
  size_t expected_participants = 0;
};

// Turns unordered per-peer arrivals into complete, totally ordered per-tick
// batches. A tick is released only once every roster member has submitted for
// it; there is no timeout. Fed by the network path, drained by the simulation.
class CommandQueue {
 public:
  explicit CommandQueue(const std::vector<std::string>& participant_ids);

  AddResult AddCommand(const Command& command);

  // Commands for the cursor tick ordered by participant id, then submission
  // order; nullopt while any participant is missing. No-op markers count as a
  // submission but are not part of the batch. Does not move the cursor.
  std::optional<std::vector<Command>> GetNextTickCommands() const;

  // Releases the cursor tick and moves to the next one. Returns false (and does
  // nothing) if the cursor tick is not complete.
  bool AdvanceTick();

  int64_t CurrentTick() const;
  const std::set<std::string>& Participants() const;
  QueueStats GetStats() const;
  void Clear();

 private:
  using TickSlots = std::map<std::string, std::vector<Command>>;

  bool IsCompleteLocked(int64_t tick) const;

  mutable std::mutex mu_;
  const std::set<std::string> participants_;
  std::map<int64_t, TickSlots> ticks_;
  int64_t cursor_ = 0;
  uint64_t total_released_ = 0;
  uint64_t stale_rejected_ = 0;
};

}  // namespace lockstep
