#pragma once

#include <trustee/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace trustee::testing {

inline trustee::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = trustee::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Non-null participant identity; distinct seeds give distinct identities.
inline trustee::schema::participant_id_t make_participant(const uint8_t seed) {
  auto id = trustee::schema::participant_id_t{};
  id[0] = seed;
  id[31] = 0xA5;
  return id;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace trustee::testing
