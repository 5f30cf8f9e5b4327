#include <turnstile/schema/key/builder.hpp>

#include <boost/endian/buffers.hpp>

#include <iterator>

namespace turnstile::schema::key {

builder& builder::write(const std::string_view& str) {
  data.insert(std::end(data), std::begin(str), std::end(str));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  data.insert(std::end(data), std::begin(bytes), std::end(bytes));
  return *this;
}

builder& builder::write(const uint8_t value) {
  data.push_back(value);
  return *this;
}

builder& builder::write_ordered(const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  auto bytes = reinterpret_cast<const uint8_t*>(buffer.data());
  data.insert(std::end(data), bytes, bytes + sizeof(buffer));
  return *this;
}

}  // namespace turnstile::schema::key
