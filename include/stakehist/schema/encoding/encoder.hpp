#pragma once
#include <stakehist/schema/primitives.hpp>
#include <optional>
#include <span>

namespace stakehist::schema::encoding {

// The wire library is picked at build time through the tag type; code that
// needs to encode or decode takes an encoder<Library> and never names the
// library directly.
template <typename Library>
struct encoder {
  template <typename T>
  stakehist::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, stakehist::schema::bytes_t& out);

  template <typename T>
  T decode(const stakehist::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const stakehist::schema::bytes_view_t& bytes);
};

}  // namespace stakehist::schema::encoding
