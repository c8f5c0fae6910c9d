#include "LocalFSBackend.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "core/Errors.hpp"
#include "core/util/Ids.hpp"

namespace ams {

namespace fs = std::filesystem;

namespace {

void write_file(const fs::path& file, std::string_view bytes) {
  std::ofstream os(file, std::ios::binary | std::ios::trunc);
  if (!os) throw StoreError("cannot open " + file.string() + " for writing");
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.flush();
  if (!os) throw StoreError("write failed: " + file.string());
}

std::string read_file(const fs::path& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in) throw StoreError("cannot open " + file.string());
  std::ostringstream buf; buf << in.rdbuf();
  return buf.str();
}

} // namespace

LocalFSBackend::LocalFSBackend(std::string root, std::string container, std::string publicBaseUrl)
  : root_(std::move(root)), container_(std::move(container)), publicBaseUrl_(std::move(publicBaseUrl)) {
  while (!publicBaseUrl_.empty() && publicBaseUrl_.back() == '/') publicBaseUrl_.pop_back();
}

std::string LocalFSBackend::upload(const std::string& name,
                                   std::string_view bytes,
                                   const std::string& content_type,
                                   bool overwrite) {
  if (!is_safe_blob_name(name)) throw StoreError("invalid blob name: " + name);

  fs::path dir = fs::path(root_) / container_;
  fs::create_directories(dir / ".meta");
  fs::path file = dir / name;
  if (!overwrite && fs::exists(file)) {
    throw StoreError("blob already exists: " + name);
  }

  // Write beside the target and rename so readers never see a partial file.
  fs::path tmp = dir / ("." + name + "." + uuid4() + ".tmp");
  try {
    write_file(tmp, bytes);
    write_file(dir / ".meta" / name, content_type);
    fs::rename(tmp, file);
  } catch (...) {
    std::error_code ec;
    fs::remove(tmp, ec);
    throw;
  }
  return urlFor(name);
}

std::optional<StoredBlob> LocalFSBackend::download(const std::string& name) {
  if (!is_safe_blob_name(name)) return std::nullopt;
  fs::path file = fs::path(root_) / container_ / name;
  if (!fs::is_regular_file(file)) return std::nullopt;

  StoredBlob blob;
  blob.bytes = read_file(file);
  fs::path meta = fs::path(root_) / container_ / ".meta" / name;
  blob.content_type = fs::exists(meta) ? read_file(meta) : "application/octet-stream";
  return blob;
}

bool LocalFSBackend::remove(const std::string& name) {
  if (!is_safe_blob_name(name)) return false;
  fs::path dir = fs::path(root_) / container_;
  const bool removed = fs::remove(dir / name);
  std::error_code ec;
  fs::remove(dir / ".meta" / name, ec);
  return removed;
}

std::string LocalFSBackend::urlFor(const std::string& name) const {
  return publicBaseUrl_ + "/" + container_ + "/" + name;
}

} // namespace ams
