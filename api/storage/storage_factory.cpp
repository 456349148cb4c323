#include "storage_factory.h"

#include <cstdlib>
#include <initializer_list>
#include <stdexcept>
#include <string>

#include "dynamo_storage.h"

namespace storage {
namespace {

// First non-empty variable among `names`, or `def`.
std::string FirstEnv(std::initializer_list<const char*> names, const std::string& def) {
  for (const char* name : names) {
    const char* v = std::getenv(name);
    if (v && *v) return std::string(v);
  }
  return def;
}

std::string TableName(const char* primary, const char* alias, const char* suffix) {
  std::string name = FirstEnv({primary, alias}, "");
  if (!name.empty()) return name;
  // TABLE_PREFIX=dev- gives dev-matches / dev-match-participants.
  const std::string prefix = FirstEnv({"TABLE_PREFIX"}, "");
  if (!prefix.empty()) return prefix + suffix;
  throw std::runtime_error(std::string("table name not configured: set ") + primary + " (or " + alias +
                           ", or TABLE_PREFIX)");
}

}  // namespace

std::unique_ptr<IStorage> CreateStorageFromEnv() {
  DynamoConfig cfg;
  cfg.region = FirstEnv({"DYNAMO_REGION", "AWS_REGION"}, cfg.region);
  cfg.endpoint = FirstEnv({"DDB_ENDPOINT", "DYNAMO_ENDPOINT"}, "");
  cfg.matches_table = TableName("TABLE_MATCHES", "DYNAMO_TABLE_MATCHES", "matches");
  cfg.participants_table = TableName("TABLE_PARTICIPANTS", "DYNAMO_TABLE_PARTICIPANTS", "match-participants");
  cfg.status_index = FirstEnv({"MATCHES_STATUS_INDEX"}, cfg.status_index);
  return std::make_unique<DynamoStorage>(cfg);
}

}  // namespace storage
