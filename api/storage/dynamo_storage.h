#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <aws/dynamodb/DynamoDBClient.h>

#include "storage.h"

namespace storage {

struct DynamoConfig {
  std::string region = "us-east-1";
  std::string endpoint;
  std::string matches_table;
  std::string participants_table;
  // (status, created_at) index on the matches table.
  std::string status_index = "gsi_status";
};

class DynamoStorage : public IStorage {
 public:
  explicit DynamoStorage(DynamoConfig cfg);

  bool PutMatch(const Match& m) override;
  std::optional<Match> GetMatchById(const std::string& match_id) override;
  std::vector<Match> ListMatchesByStatus(const std::string& status, int limit) override;
  bool UpdateMatchStatus(const std::string& match_id, const std::string& status) override;

  bool PutParticipant(const Participant& p) override;
  std::vector<Participant> ListParticipants(const std::string& match_id) override;
  bool UpdateParticipantConnected(const std::string& match_id, const std::string& participant_id,
                                  bool connected) override;
  bool DeleteParticipant(const std::string& match_id, const std::string& participant_id) override;

  bool HealthCheck() override;
  bool ResetForDev() override;

 private:
  DynamoConfig cfg_;
  std::shared_ptr<Aws::DynamoDB::DynamoDBClient> client_;
};

}  // namespace storage
