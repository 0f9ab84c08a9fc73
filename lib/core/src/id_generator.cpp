#include <core/id_generator.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstddef>
#include <cstdint>

namespace courier::core {

namespace {

  auto uuid_source() -> boost::uuids::random_generator &
  {
    static thread_local boost::uuids::random_generator gen;
    return gen;
  }

}// namespace

auto id_generator::random_id() -> std::uint64_t
{
  // Version and variant bits fall in different halves, so the folded halves are fully random.
  std::uint64_t value = 0;
  while (value == 0) {
    const auto uuid = uuid_source()();
    for (std::size_t i = 0; i < sizeof(value); ++i) {
      value = (value << 8U) | static_cast<std::uint8_t>(uuid.data[i] ^ uuid.data[i + sizeof(value)]);
    }
  }
  return value;
}

auto id_generator::fresh_id(const std::function<bool(std::uint64_t)> &in_use) -> std::uint64_t
{
  auto value = random_id();
  while (in_use(value)) { value = random_id(); }
  return value;
}

auto id_generator::token() -> std::string { return boost::uuids::to_string(uuid_source()()); }

}// namespace courier::core
