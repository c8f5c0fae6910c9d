#pragma once
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ams {

struct Asset {
  std::string id;            // document key and partition key
  std::string title;
  std::string description;
  std::string blobUrl;
  std::string blobKey;       // object name inside the blob container
  std::string created_at;
  std::optional<std::string> updated_at;
};

// Final path segment of a blob URL, ignoring any query or fragment.
// Returns an empty string when the URL has no usable segment.
std::string blob_key_from_url(std::string_view url);

// Key to delete for an asset: the stored blobKey, else derived from blobUrl.
std::string resolve_blob_key(const Asset& a);

void to_json(nlohmann::json& j, const Asset& a);

// Reads a stored document. Unknown members (store system properties) are
// ignored; missing optional members default to empty.
void from_json(const nlohmann::json& j, Asset& a);

} // namespace ams
