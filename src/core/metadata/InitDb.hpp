#pragma once
#include <string>

namespace ams {

// Creates the database file if needed and applies the schema script in one
// transaction, recording the schema version in PRAGMA user_version.
// Idempotent: the script only uses CREATE ... IF NOT EXISTS. Throws
// StoreError when the script is unreadable or fails, or when the file
// carries a newer schema version.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace ams
