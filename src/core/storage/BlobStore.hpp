#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace ams {

struct StoredBlob {
  std::string bytes;
  std::string content_type;
};

// Object store for uploaded payloads, addressed by name inside one container.
class BlobStore {
public:
  virtual ~BlobStore() = default;

  // Stores bytes under name and returns the object's public URL.
  // With overwrite=false an existing object is an error.
  virtual std::string upload(const std::string& name,
                             std::string_view bytes,
                             const std::string& content_type,
                             bool overwrite) = 0;

  virtual std::optional<StoredBlob> download(const std::string& name) = 0;

  // Returns false when no object has this name.
  virtual bool remove(const std::string& name) = 0;

  virtual std::string urlFor(const std::string& name) const = 0;

  virtual const std::string& container() const = 0;
};

// True when name addresses exactly one object inside the container: not
// empty, no path separators, no leading dot (rules out "." and "..").
inline bool is_safe_blob_name(std::string_view name) {
  if (name.empty() || name.front() == '.') return false;
  return name.find_first_of("/\\") == std::string_view::npos;
}

} // namespace ams
