#include "dynamo_storage.h"

#include <iostream>
#include <string>

#include <aws/core/client/ClientConfiguration.h>
#include <aws/dynamodb/model/AttributeValue.h>
#include <aws/dynamodb/model/DeleteItemRequest.h>
#include <aws/dynamodb/model/DescribeTableRequest.h>
#include <aws/dynamodb/model/GetItemRequest.h>
#include <aws/dynamodb/model/PutItemRequest.h>
#include <aws/dynamodb/model/QueryRequest.h>
#include <aws/dynamodb/model/ScanRequest.h>
#include <aws/dynamodb/model/UpdateItemRequest.h>

namespace storage {
namespace {

using Aws::DynamoDB::Model::AttributeValue;
using Aws::Map;
using Aws::String;

std::string GetString(const Map<String, AttributeValue>& item, const char* key, const std::string& def = "") {
  auto it = item.find(key);
  if (it == item.end()) return def;
  return it->second.GetS().c_str();
}

int64_t GetInt64(const Map<String, AttributeValue>& item, const char* key, int64_t def = 0) {
  auto it = item.find(key);
  if (it == item.end()) return def;
  const auto& n = it->second.GetN();
  if (n.empty()) return def;
  try {
    return std::stoll(n.c_str());
  } catch (const std::exception&) {
    return def;
  }
}

bool GetBool(const Map<String, AttributeValue>& item, const char* key, bool def = false) {
  auto it = item.find(key);
  if (it == item.end()) return def;
  return it->second.GetBool();
}

AttributeValue S(const std::string& v) {
  AttributeValue a;
  a.SetS(v.c_str());
  return a;
}

AttributeValue N(int64_t v) {
  AttributeValue a;
  a.SetN(std::to_string(v).c_str());
  return a;
}

AttributeValue B(bool v) {
  AttributeValue a;
  a.SetBool(v);
  return a;
}

Match LoadMatchFromItem(const Map<String, AttributeValue>& item) {
  Match m;
  m.match_id = GetString(item, "match_id");
  m.created_at = GetInt64(item, "created_at");
  m.status = GetString(item, "status", "open");
  m.host_participant_id = GetString(item, "host_participant_id");
  m.seed = static_cast<uint32_t>(GetInt64(item, "seed"));
  m.tick_rate = static_cast<int>(GetInt64(item, "tick_rate", 30));
  m.max_participants = static_cast<int>(GetInt64(item, "max_participants", 2));
  m.name = GetString(item, "name");
  m.settings_json = GetString(item, "settings", "{}");
  m.lockstep_enabled = GetBool(item, "lockstep_enabled", true);
  return m;
}

Participant LoadParticipantFromItem(const Map<String, AttributeValue>& item) {
  Participant p;
  p.match_id = GetString(item, "match_id");
  p.participant_id = GetString(item, "participant_id");
  p.role = GetString(item, "role", "peer");
  p.connected = GetBool(item, "connected", false);
  p.display_name = GetString(item, "display_name");
  p.faction = GetString(item, "faction");
  p.joined_at = GetInt64(item, "joined_at");
  return p;
}

}  // namespace

DynamoStorage::DynamoStorage(DynamoConfig cfg) : cfg_(std::move(cfg)) {
  Aws::Client::ClientConfiguration cc;
  cc.region = cfg_.region.c_str();
  if (!cfg_.endpoint.empty()) {
    cc.endpointOverride = cfg_.endpoint.c_str();
    cc.scheme = Aws::Http::Scheme::HTTP;
  }
  client_ = std::make_shared<Aws::DynamoDB::DynamoDBClient>(cc);
}

bool DynamoStorage::PutMatch(const Match& m) {
  Aws::DynamoDB::Model::PutItemRequest req;
  req.SetTableName(cfg_.matches_table.c_str());
  req.AddItem("match_id", S(m.match_id));
  req.AddItem("created_at", N(m.created_at));
  req.AddItem("status", S(m.status));
  req.AddItem("host_participant_id", S(m.host_participant_id));
  req.AddItem("seed", N(static_cast<int64_t>(m.seed)));
  req.AddItem("tick_rate", N(m.tick_rate));
  req.AddItem("max_participants", N(m.max_participants));
  req.AddItem("name", S(m.name));
  req.AddItem("settings", S(m.settings_json.empty() ? "{}" : m.settings_json));
  req.AddItem("lockstep_enabled", B(m.lockstep_enabled));
  return client_->PutItem(req).IsSuccess();
}

std::optional<Match> DynamoStorage::GetMatchById(const std::string& match_id) {
  Aws::DynamoDB::Model::GetItemRequest req;
  req.SetTableName(cfg_.matches_table.c_str());
  req.AddKey("match_id", S(match_id));

  auto out = client_->GetItem(req);
  if (!out.IsSuccess()) throw StorageError(out.GetError().GetMessage().c_str());
  const auto& item = out.GetResult().GetItem();
  if (item.empty()) return std::nullopt;
  return LoadMatchFromItem(item);
}

std::vector<Match> DynamoStorage::ListMatchesByStatus(const std::string& status, int limit) {
  std::vector<Match> out;
  Aws::DynamoDB::Model::QueryRequest req;
  req.SetTableName(cfg_.matches_table.c_str());
  req.SetIndexName(cfg_.status_index.c_str());
  req.SetKeyConditionExpression("#s = :s");
  req.AddExpressionAttributeNames("#s", "status");
  req.AddExpressionAttributeValues(":s", S(status));
  req.SetScanIndexForward(false);
  req.SetLimit(limit);

  auto res = client_->Query(req);
  if (!res.IsSuccess()) throw StorageError(res.GetError().GetMessage().c_str());
  for (const auto& item : res.GetResult().GetItems()) {
    out.push_back(LoadMatchFromItem(item));
  }
  return out;
}

bool DynamoStorage::UpdateMatchStatus(const std::string& match_id, const std::string& status) {
  Aws::DynamoDB::Model::UpdateItemRequest req;
  req.SetTableName(cfg_.matches_table.c_str());
  req.AddKey("match_id", S(match_id));
  req.SetUpdateExpression("SET #s = :s");
  req.SetConditionExpression("attribute_exists(match_id)");
  req.AddExpressionAttributeNames("#s", "status");
  req.AddExpressionAttributeValues(":s", S(status));
  return client_->UpdateItem(req).IsSuccess();
}

bool DynamoStorage::PutParticipant(const Participant& p) {
  Aws::DynamoDB::Model::PutItemRequest req;
  req.SetTableName(cfg_.participants_table.c_str());
  req.AddItem("match_id", S(p.match_id));
  req.AddItem("participant_id", S(p.participant_id));
  req.AddItem("role", S(p.role.empty() ? "peer" : p.role));
  req.AddItem("connected", B(p.connected));
  req.AddItem("display_name", S(p.display_name));
  if (!p.faction.empty()) req.AddItem("faction", S(p.faction));
  req.AddItem("joined_at", N(p.joined_at));
  return client_->PutItem(req).IsSuccess();
}

std::vector<Participant> DynamoStorage::ListParticipants(const std::string& match_id) {
  std::vector<Participant> out;
  Aws::DynamoDB::Model::QueryRequest req;
  req.SetTableName(cfg_.participants_table.c_str());
  req.SetKeyConditionExpression("match_id = :m");
  req.AddExpressionAttributeValues(":m", S(match_id));

  while (true) {
    auto res = client_->Query(req);
    if (!res.IsSuccess()) throw StorageError(res.GetError().GetMessage().c_str());
    for (const auto& item : res.GetResult().GetItems()) {
      out.push_back(LoadParticipantFromItem(item));
    }

    const auto& lek = res.GetResult().GetLastEvaluatedKey();
    if (lek.empty()) break;
    req.SetExclusiveStartKey(lek);
  }
  return out;
}

bool DynamoStorage::UpdateParticipantConnected(const std::string& match_id, const std::string& participant_id,
                                               bool connected) {
  Aws::DynamoDB::Model::UpdateItemRequest req;
  req.SetTableName(cfg_.participants_table.c_str());
  req.AddKey("match_id", S(match_id));
  req.AddKey("participant_id", S(participant_id));
  req.SetUpdateExpression("SET connected = :c");
  req.SetConditionExpression("attribute_exists(participant_id)");
  req.AddExpressionAttributeValues(":c", B(connected));
  return client_->UpdateItem(req).IsSuccess();
}

bool DynamoStorage::DeleteParticipant(const std::string& match_id, const std::string& participant_id) {
  Aws::DynamoDB::Model::DeleteItemRequest req;
  req.SetTableName(cfg_.participants_table.c_str());
  req.AddKey("match_id", S(match_id));
  req.AddKey("participant_id", S(participant_id));
  return client_->DeleteItem(req).IsSuccess();
}

bool DynamoStorage::HealthCheck() {
  Aws::DynamoDB::Model::DescribeTableRequest req;
  req.SetTableName(cfg_.matches_table.c_str());
  auto res = client_->DescribeTable(req);
  if (!res.IsSuccess()) {
    std::cerr << "Dynamo health check failed: " << res.GetError().GetMessage() << "\n";
    return false;
  }
  return true;
}

bool DynamoStorage::ResetForDev() {
  auto delete_by_scan = [&](const std::string& table, const std::string& pk, const std::optional<std::string>& sk) {
    Aws::DynamoDB::Model::ScanRequest scan;
    scan.SetTableName(table.c_str());
    while (true) {
      auto out = client_->Scan(scan);
      if (!out.IsSuccess()) return false;
      for (const auto& item : out.GetResult().GetItems()) {
        Aws::DynamoDB::Model::DeleteItemRequest del;
        del.SetTableName(table.c_str());
        auto it_pk = item.find(pk.c_str());
        if (it_pk == item.end()) continue;
        del.AddKey(pk.c_str(), it_pk->second);
        if (sk.has_value()) {
          auto it_sk = item.find(sk->c_str());
          if (it_sk == item.end()) continue;
          del.AddKey(sk->c_str(), it_sk->second);
        }
        if (!client_->DeleteItem(del).IsSuccess()) return false;
      }
      const auto& lek = out.GetResult().GetLastEvaluatedKey();
      if (lek.empty()) break;
      scan.SetExclusiveStartKey(lek);
    }
    return true;
  };

  return delete_by_scan(cfg_.participants_table, "match_id", std::optional<std::string>("participant_id")) &&
         delete_by_scan(cfg_.matches_table, "match_id", std::nullopt);
}

}  // namespace storage
