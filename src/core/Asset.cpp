#include "Asset.hpp"

namespace ams {

std::string blob_key_from_url(std::string_view url) {
  const auto end = url.find_first_of("?#");
  if (end != std::string_view::npos) url = url.substr(0, end);
  const auto slash = url.rfind('/');
  if (slash == std::string_view::npos) return std::string(url);
  return std::string(url.substr(slash + 1));
}

std::string resolve_blob_key(const Asset& a) {
  if (!a.blobKey.empty()) return a.blobKey;
  return blob_key_from_url(a.blobUrl);
}

void to_json(nlohmann::json& j, const Asset& a) {
  j = nlohmann::json{
    {"id", a.id},
    {"title", a.title},
    {"description", a.description},
    {"blobUrl", a.blobUrl},
    {"blobKey", a.blobKey},
    {"created_at", a.created_at}
  };
  if (a.updated_at) j["updated_at"] = *a.updated_at;
}

void from_json(const nlohmann::json& j, Asset& a) {
  auto get_s = [&](const char* k) {
    if (auto it = j.find(k); it != j.end() && it->is_string()) return it->get<std::string>();
    return std::string();
  };
  a.id          = get_s("id");
  a.title       = get_s("title");
  a.description = get_s("description");
  a.blobUrl     = get_s("blobUrl");
  a.blobKey     = get_s("blobKey");
  a.created_at  = get_s("created_at");
  if (auto it = j.find("updated_at"); it != j.end() && it->is_string()) {
    a.updated_at = it->get<std::string>();
  } else {
    a.updated_at.reset();
  }
}

} // namespace ams
