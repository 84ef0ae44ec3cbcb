#ifndef CLAWSUITE_CORE_UTILS_HPP
#define CLAWSUITE_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace clawsuite {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Wall clock Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Monotonic milliseconds, for deadlines and intervals
int64_t monotonic_ms();

// ============ String utilities ============

std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Remove CR/LF and other ASCII control characters
std::string strip_control_chars(const std::string& s);

// ============ Random identifiers ============

// Generate a random UUID v4
std::string generate_uuid();

// 2*num_bytes lowercase hex characters
std::string random_hex(size_t num_bytes);

} // namespace clawsuite

#endif // CLAWSUITE_CORE_UTILS_HPP
