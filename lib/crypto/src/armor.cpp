#include <crypto/armor.hpp>

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <openssl/evp.h>

namespace courier::crypto {

namespace {

  constexpr std::string_view base32_alphabet{ "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567" };
  constexpr std::size_t armor_line_width = 64;

  auto strip_whitespace(std::string_view text) -> std::string
  {
    std::string out;
    out.reserve(text.size());
    std::ranges::copy_if(text, std::back_inserter(out), [](char chr) {
      return std::isspace(static_cast<unsigned char>(chr)) == 0;
    });
    return out;
  }

}// namespace

auto base64_encode(std::span<const std::uint8_t> data) -> std::string
{
  std::string out(((data.size() + 2) / 3) * 4 + 1, '\0');
  const auto written =
    EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data.data(), static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

auto base64_decode(std::string_view text) -> std::optional<bytes>
{
  const auto compact = strip_whitespace(text);
  if (compact.size() % 4 != 0) { return std::nullopt; }
  if (compact.empty()) { return bytes{}; }

  bytes out(compact.size() / 4 * 3);
  const auto written = EVP_DecodeBlock(
    out.data(), reinterpret_cast<const unsigned char *>(compact.data()), static_cast<int>(compact.size()));
  if (written < 0) { return std::nullopt; }

  // EVP_DecodeBlock counts padding as zero bytes
  std::size_t padding = 0;
  if (compact.ends_with("==")) {
    padding = 2;
  } else if (compact.ends_with('=')) {
    padding = 1;
  }
  out.resize(static_cast<std::size_t>(written) - padding);
  return out;
}

auto base32_encode(std::span<const std::uint8_t> data) -> std::string
{
  std::string out;
  out.reserve((data.size() * 8 + 4) / 5);
  std::uint32_t buffer = 0;
  unsigned bits = 0;
  for (const auto byte : data) {
    buffer = (buffer << 8U) | byte;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      out.push_back(base32_alphabet[(buffer >> bits) & 0x1FU]);
    }
  }
  if (bits > 0) { out.push_back(base32_alphabet[(buffer << (5 - bits)) & 0x1FU]); }
  return out;
}

auto base32_decode(std::string_view text) -> std::optional<bytes>
{
  while (text.ends_with('=')) { text.remove_suffix(1); }

  bytes out;
  out.reserve(text.size() * 5 / 8);
  std::uint32_t buffer = 0;
  unsigned bits = 0;
  for (const char chr : text) {
    const auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(chr)));
    const auto pos = base32_alphabet.find(upper);
    if (pos == std::string_view::npos) { return std::nullopt; }
    buffer = (buffer << 5U) | static_cast<std::uint32_t>(pos);
    bits += 5;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFFU));
    }
  }
  // leftover bits must be zero padding, and there can be at most one partial symbol
  if (bits >= 5 or (buffer & ((1U << bits) - 1U)) != 0) { return std::nullopt; }
  return out;
}

auto armor(std::string_view label, std::span<const std::uint8_t> data) -> std::string
{
  const auto body = base64_encode(data);
  std::string out = fmt::format("-----BEGIN {}-----\n\n", label);
  for (std::size_t pos = 0; pos < body.size(); pos += armor_line_width) {
    out += body.substr(pos, armor_line_width);
    out += '\n';
  }
  out += fmt::format("-----END {}-----\n", label);
  return out;
}

auto dearmor(std::string_view label, std::string_view text) -> std::optional<bytes>
{
  const auto begin_marker = fmt::format("-----BEGIN {}-----", label);
  const auto end_marker = fmt::format("-----END {}-----", label);

  const auto begin = text.find(begin_marker);
  if (begin == std::string_view::npos) { return std::nullopt; }
  const auto body_start = begin + begin_marker.size();
  const auto end = text.find(end_marker, body_start);
  if (end == std::string_view::npos) { return std::nullopt; }

  return base64_decode(text.substr(body_start, end - body_start));
}

}// namespace courier::crypto
