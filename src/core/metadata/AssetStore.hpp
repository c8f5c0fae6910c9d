#pragma once
#include <optional>
#include <string>
#include <vector>

#include "core/Asset.hpp"

namespace ams {

// Document store holding asset records keyed (and partitioned) by id.
// Implementations are shared across request threads and must be safe to
// call concurrently. Unexpected failures throw (StoreError or the
// backend's own std::exception subclass).
class AssetStore {
public:
  virtual ~AssetStore() = default;

  // Inserts a new record; throws StoreError if the id already exists.
  virtual void create(const Asset& a) = 0;

  // Point read; empty when no record has this id.
  virtual std::optional<Asset> read(const std::string& id) = 0;

  // Every record, in no particular order.
  virtual std::vector<Asset> readAll() = 0;

  // Overwrites the record with a.id; throws NotFound if it does not exist.
  virtual void replace(const Asset& a) = 0;

  // Returns false when no record has this id.
  virtual bool remove(const std::string& id) = 0;
};

} // namespace ams
