#pragma once
#include <stdexcept>
#include <string>

namespace ams {

// Translated to HTTP status codes in services/api/HttpServer.cpp.

// Client input is missing or malformed (400).
class BadRequest : public std::runtime_error {
public:
  explicit BadRequest(const std::string& msg) : std::runtime_error(msg) {}
};

// No record at the requested key (404).
class NotFound : public std::runtime_error {
public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {}
};

// Unexpected failure talking to the document or object store (500).
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace ams
