#pragma once
#include <trustee/schema/primitives.hpp>
#include <string_view>

namespace trustee::blake3 {

trustee::schema::hash32_t hash(const std::string_view& str);
trustee::schema::hash32_t hash(const trustee::schema::bytes_view_t& bytes);

}  // namespace trustee::blake3
