#pragma once
#include <trustee/schema/primitives.hpp>
#include <optional>
#include <span>

namespace trustee::schema::encoding {

// Encoding backend is a build time choice: call sites name the library tag
// once through an alias and stay agnostic of the codec behind it.
template <typename Library>
struct encoder {
  template <typename T>
  trustee::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, trustee::schema::bytes_t& out);

  template <typename T>
  T decode(const trustee::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const trustee::schema::bytes_view_t& bytes);
};

}  // namespace trustee::schema::encoding
