#pragma once

#include <memory>

#include "storage.h"

namespace storage {

// DynamoDB-backed storage configured from the environment. Throws
// std::runtime_error when a table name is missing.
std::unique_ptr<IStorage> CreateStorageFromEnv();

}  // namespace storage
