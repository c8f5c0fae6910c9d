#pragma once
#include <ctime>
#include <map>
#include <string>
#include <string_view>

namespace ams::azure {

std::string base64_encode(std::string_view bytes);
// Throws std::invalid_argument on malformed input.
std::string base64_decode(std::string_view text);

// Raw 32-byte HMAC-SHA256 digest.
std::string hmac_sha256(std::string_view key, std::string_view data);

// RFC 1123 date in GMT, as required by x-ms-date.
std::string rfc1123_date(std::time_t t);
std::string rfc1123_now();

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string percent_encode(std::string_view s);

// Splits "https://host:port/base/path/" into origin and base path
// ("https://host:port", "/base/path"). Throws std::invalid_argument when
// the URL has no scheme or host.
struct Endpoint {
  std::string origin;
  std::string basePath;
};
Endpoint split_endpoint(const std::string& url);

// ----- Cosmos DB -----

// Value for the Cosmos "authorization" header (already URL-encoded).
// verb and resourceType are lowercased; resourceLink is used verbatim.
std::string cosmos_auth_token(const std::string& verb,
                              const std::string& resourceType,
                              const std::string& resourceLink,
                              const std::string& date,
                              const std::string& masterKeyBase64);

// ----- Blob Storage -----

struct StorageConnection {
  std::string accountName;
  std::string accountKey;    // base64; empty when sas is used
  std::string blobEndpoint;  // scheme://host[:port][/path], no trailing slash
  std::string sas;           // query string without leading '?'
};

// Parses an Azure Storage connection string. Supports explicit BlobEndpoint,
// DefaultEndpointsProtocol/AccountName/EndpointSuffix, SharedAccessSignature
// and UseDevelopmentStorage=true. Throws std::invalid_argument.
StorageConnection parse_connection_string(const std::string& cs);

// Canonical SharedKey string-to-sign for a Blob service request.
// headers holds every request header that is sent (names any case);
// resourcePath is the URL path including any endpoint base path;
// query holds decoded query parameters.
std::string blob_string_to_sign(const std::string& verb,
                                const std::map<std::string, std::string>& headers,
                                const std::string& accountName,
                                const std::string& resourcePath,
                                const std::map<std::string, std::string>& query = {});

// "SharedKey <account>:<signature>"
std::string blob_shared_key(const std::string& accountName,
                            const std::string& accountKeyBase64,
                            const std::string& stringToSign);

} // namespace ams::azure
