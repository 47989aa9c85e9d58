#pragma once
#include <ctime>
#include <string>

namespace waterly {
namespace utils {

bool write_file(const std::string &path, const std::string &contents);
bool read_file(const std::string &path, std::string &out);

// Lowercase hex SHA-256 of the given bytes.
std::string sha256_hex(const std::string &data);

// "2025-09-12 10:42:40" style UTC rendering of an epoch timestamp.
std::string format_utc(std::time_t ts);

}
}
