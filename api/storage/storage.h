#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "models.h"

namespace storage {

// Thrown by reads when the backend cannot be reached; a missing row is nullopt.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

class IStorage {
 public:
  virtual ~IStorage() = default;

  virtual bool PutMatch(const Match& m) = 0;
  virtual std::optional<Match> GetMatchById(const std::string& match_id) = 0;
  // Newest first.
  virtual std::vector<Match> ListMatchesByStatus(const std::string& status, int limit) = 0;
  virtual bool UpdateMatchStatus(const std::string& match_id, const std::string& status) = 0;

  virtual bool PutParticipant(const Participant& p) = 0;
  virtual std::vector<Participant> ListParticipants(const std::string& match_id) = 0;
  virtual bool UpdateParticipantConnected(const std::string& match_id, const std::string& participant_id,
                                          bool connected) = 0;
  virtual bool DeleteParticipant(const std::string& match_id, const std::string& participant_id) = 0;

  virtual bool HealthCheck() = 0;
  virtual bool ResetForDev() = 0;
};

}  // namespace storage
