#pragma once
#include <strongbox/schema/primitives.hpp>
#include <optional>
#include <span>

namespace strongbox::schema::encoding {

// The encoding library is a build time choice selected through the tag type;
// hot swapping encoders is not supported.
template <typename Library>
struct encoder {
  template <typename T>
  strongbox::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, strongbox::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const strongbox::schema::bytes_view_t& bytes);
};

}  // namespace strongbox::schema::encoding
