#include "Ids.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace ams {

std::string uuid4() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  uint64_t a = rng(), b = rng();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

std::string utc_now_iso() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t secs = system_clock::to_time_t(now);
  const auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;

  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &secs);
#else
  gmtime_r(&secs, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setw(6) << std::setfill('0') << micros << 'Z';
  return oss.str();
}

} // namespace ams
