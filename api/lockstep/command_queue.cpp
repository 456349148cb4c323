#include "command_queue.h"

#include <iostream>

namespace lockstep {

const char* AddResultName(AddResult r) {
  switch (r) {
    case AddResult::Accepted: return "accepted";
    case AddResult::Stale: return "stale";
    case AddResult::UnknownParticipant: return "unknown_participant";
  }
  return "unknown";
}

CommandQueue::CommandQueue(const std::vector<std::string>& participant_ids)
    : participants_(participant_ids.begin(), participant_ids.end()) {}

AddResult CommandQueue::AddCommand(const Command& command) {
  std::lock_guard<std::mutex> lock(mu_);

  if (command.tick < cursor_) {
    ++stale_rejected_;
    std::cerr << "[CommandQueue] dropped stale command tick=" << command.tick
              << " from=" << command.participant_id << " (current " << cursor_ << ")\n";
    return AddResult::Stale;
  }
  if (!participants_.count(command.participant_id)) {
    std::cerr << "[CommandQueue] dropped command from unknown participant " << command.participant_id << "\n";
    return AddResult::UnknownParticipant;
  }

  ticks_[command.tick][command.participant_id].push_back(command);
  return AddResult::Accepted;
}

bool CommandQueue::IsCompleteLocked(int64_t tick) const {
  if (participants_.empty()) return true;
  auto it = ticks_.find(tick);
  if (it == ticks_.end()) return false;
  // Slots only exist for roster members, so equal size means everyone submitted.
  return it->second.size() == participants_.size();
}

std::optional<std::vector<Command>> CommandQueue::GetNextTickCommands() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!IsCompleteLocked(cursor_)) return std::nullopt;

  std::vector<Command> batch;
  auto it = ticks_.find(cursor_);
  if (it == ticks_.end()) return batch;

  // std::map iterates participant ids in ascending order; each slot keeps
  // submission order.
  for (const auto& slot : it->second) {
    for (const auto& c : slot.second) {
      if (!IsNoOp(c)) batch.push_back(c);
    }
  }
  return batch;
}

bool CommandQueue::AdvanceTick() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!IsCompleteLocked(cursor_)) return false;

  auto it = ticks_.find(cursor_);
  if (it != ticks_.end()) {
    for (const auto& slot : it->second) total_released_ += slot.second.size();
    ticks_.erase(it);
  }
  ++cursor_;
  return true;
}

int64_t CommandQueue::CurrentTick() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cursor_;
}

const std::set<std::string>& CommandQueue::Participants() const {
  return participants_;
}

QueueStats CommandQueue::GetStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  QueueStats s;
  s.current_tick = cursor_;
  s.queued_ticks = ticks_.size();
  s.total_released = total_released_;
  s.stale_rejected = stale_rejected_;
  s.expected_participants = participants_.size();
  for (const auto& id : participants_) s.per_participant_backlog[id] = 0;
  for (const auto& tick : ticks_) {
    for (const auto& slot : tick.second) s.per_participant_backlog[slot.first] += slot.second.size();
  }
  return s;
}

void CommandQueue::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  ticks_.clear();
}

}  // namespace lockstep
