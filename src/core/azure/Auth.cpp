#include "Auth.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ams::azure {

namespace {

// Published development-storage credentials used by Azurite.
constexpr const char* kDevAccount = "devstoreaccount1";
constexpr const char* kDevKey =
  "Eby8vdM02xNOcqFlqUwJPLlmEtlCDXJ1OUzFT50uSRZ6IFsuFq2UVErCz4I6tq/K1SZFPTOtr/KBHBeksoGMGw==";
constexpr const char* kDevBlobEndpoint = "http://127.0.0.1:10000/devstoreaccount1";

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

} // namespace

std::string base64_encode(std::string_view bytes) {
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(bytes.data()),
                                static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(n));
  return out;
}

std::string base64_decode(std::string_view text) {
  if (text.size() % 4 != 0) throw std::invalid_argument("base64 length is not a multiple of 4");
  if (text.empty()) return {};

  std::string out(3 * (text.size() / 4), '\0');
  const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
  if (n < 0) throw std::invalid_argument("invalid base64");
  // EVP_DecodeBlock counts padding as zero bytes.
  size_t len = static_cast<size_t>(n);
  if (text[text.size() - 1] == '=') --len;
  if (text[text.size() - 2] == '=') --len;
  out.resize(len);
  return out;
}

std::string hmac_sha256(std::string_view key, std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(),
            digest, &len)) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<const char*>(digest), len);
}

std::string rfc1123_date(std::time_t t) {
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[64];
  const size_t n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
  return std::string(buf, n);
}

std::string rfc1123_now() {
  return rfc1123_date(std::time(nullptr));
}

std::string percent_encode(std::string_view s) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += k[c >> 4];
      out += k[c & 0xF];
    }
  }
  return out;
}

Endpoint split_endpoint(const std::string& url) {
  const auto scheme = url.find("://");
  if (scheme == std::string::npos || scheme == 0) {
    throw std::invalid_argument("endpoint has no scheme: " + url);
  }
  const auto hostBegin = scheme + 3;
  const auto slash = url.find('/', hostBegin);
  Endpoint ep;
  ep.origin = url.substr(0, slash);
  if (ep.origin.size() <= hostBegin) {
    throw std::invalid_argument("endpoint has no host: " + url);
  }
  if (slash != std::string::npos) {
    ep.basePath = url.substr(slash);
    while (!ep.basePath.empty() && ep.basePath.back() == '/') ep.basePath.pop_back();
  }
  return ep;
}

std::string cosmos_auth_token(const std::string& verb,
                              const std::string& resourceType,
                              const std::string& resourceLink,
                              const std::string& date,
                              const std::string& masterKeyBase64) {
  const std::string payload = lower(verb) + "\n" + lower(resourceType) + "\n" +
                              resourceLink + "\n" + lower(date) + "\n" + "\n";
  const std::string sig = base64_encode(hmac_sha256(base64_decode(masterKeyBase64), payload));
  return percent_encode("type=master&ver=1.0&sig=" + sig);
}

StorageConnection parse_connection_string(const std::string& cs) {
  std::map<std::string, std::string> kv;
  size_t pos = 0;
  while (pos <= cs.size()) {
    auto semi = cs.find(';', pos);
    if (semi == std::string::npos) semi = cs.size();
    const std::string part = trim(cs.substr(pos, semi - pos));
    pos = semi + 1;
    if (part.empty()) continue;
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      throw std::invalid_argument("malformed connection string segment: " + part);
    }
    kv[lower(trim(part.substr(0, eq)))] = trim(part.substr(eq + 1));
  }

  auto get = [&](const char* k) {
    auto it = kv.find(k);
    return it == kv.end() ? std::string() : it->second;
  };

  StorageConnection c;
  if (lower(get("usedevelopmentstorage")) == "true") {
    c.accountName = kDevAccount;
    c.accountKey = kDevKey;
    c.blobEndpoint = kDevBlobEndpoint;
    return c;
  }

  c.accountName = get("accountname");
  c.accountKey = get("accountkey");
  c.sas = get("sharedaccesssignature");
  if (!c.sas.empty() && c.sas.front() == '?') c.sas.erase(0, 1);

  c.blobEndpoint = get("blobendpoint");
  if (c.blobEndpoint.empty()) {
    if (c.accountName.empty()) {
      throw std::invalid_argument("connection string needs AccountName or BlobEndpoint");
    }
    std::string protocol = get("defaultendpointsprotocol");
    if (protocol.empty()) protocol = "https";
    std::string suffix = get("endpointsuffix");
    if (suffix.empty()) suffix = "core.windows.net";
    c.blobEndpoint = protocol + "://" + c.accountName + ".blob." + suffix;
  }
  while (!c.blobEndpoint.empty() && c.blobEndpoint.back() == '/') c.blobEndpoint.pop_back();
  split_endpoint(c.blobEndpoint);

  if (c.sas.empty()) {
    if (c.accountKey.empty()) {
      throw std::invalid_argument("connection string needs AccountKey or SharedAccessSignature");
    }
    if (c.accountName.empty()) {
      throw std::invalid_argument("connection string needs AccountName for SharedKey auth");
    }
  }
  return c;
}

std::string blob_string_to_sign(const std::string& verb,
                                const std::map<std::string, std::string>& headers,
                                const std::string& accountName,
                                const std::string& resourcePath,
                                const std::map<std::string, std::string>& query) {
  std::map<std::string, std::string> h;
  for (const auto& [name, value] : headers) h[lower(name)] = trim(value);
  auto get = [&](const char* k) {
    auto it = h.find(k);
    return it == h.end() ? std::string() : it->second;
  };

  std::string contentLength = get("content-length");
  if (contentLength == "0") contentLength.clear();

  std::string s;
  s += verb + "\n";
  s += get("content-encoding") + "\n";
  s += get("content-language") + "\n";
  s += contentLength + "\n";
  s += get("content-md5") + "\n";
  s += get("content-type") + "\n";
  s += get("date") + "\n";
  s += get("if-modified-since") + "\n";
  s += get("if-match") + "\n";
  s += get("if-none-match") + "\n";
  s += get("if-unmodified-since") + "\n";
  s += get("range") + "\n";

  // std::map keeps x-ms-* headers in lexicographic order.
  for (const auto& [name, value] : h) {
    if (name.rfind("x-ms-", 0) == 0) s += name + ":" + value + "\n";
  }

  s += "/" + accountName + resourcePath;
  std::map<std::string, std::string> q;
  for (const auto& [name, value] : query) q[lower(name)] = value;
  for (const auto& [name, value] : q) {
    s += "\n" + name + ":" + value;
  }
  return s;
}

std::string blob_shared_key(const std::string& accountName,
                            const std::string& accountKeyBase64,
                            const std::string& stringToSign) {
  const std::string sig = base64_encode(hmac_sha256(base64_decode(accountKeyBase64), stringToSign));
  return "SharedKey " + accountName + ":" + sig;
}

} // namespace ams::azure
