#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

uint64_t get_current_time_ms() {
  auto now = std::chrono::system_clock::now();
  auto epoch = now.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);
  return ms.count();
}

std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::optional<std::pair<double, double>> parse_range(std::string_view text) {
  std::vector<std::string> parts = split_string(std::string(text), ',');
  if (parts.size() != 2)
    return std::nullopt;

  std::string low_str = trim_copy(parts[0]);
  std::string high_str = trim_copy(parts[1]);
  if (low_str.empty() || high_str.empty())
    return std::nullopt;

  auto low = string_to_number<double>(low_str);
  auto high = string_to_number<double>(high_str);
  if (!low || !high)
    return std::nullopt;

  return std::make_pair(*low, *high);
}

bool create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

} // namespace Utils
