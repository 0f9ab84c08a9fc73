#include <persistence/state_file.hpp>

#include <cerrno>
#include <core/errors.hpp>
#include <core/id_generator.hpp>
#include <crypto/aead.hpp>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <persistence/snapshot.hpp>
#include <stdexcept>
#include <system_error>
#include <tuple>
#include <unistd.h>

namespace courier::persistence {

namespace {

  /// Owns a POSIX file descriptor.
  class file_descriptor
  {
  public:
    explicit file_descriptor(int descriptor) : descriptor_(descriptor) {}
    ~file_descriptor()
    {
      if (descriptor_ >= 0) { ::close(descriptor_); }
    }

    file_descriptor(const file_descriptor &) = delete;
    auto operator=(const file_descriptor &) -> file_descriptor & = delete;
    file_descriptor(file_descriptor &&) = delete;
    auto operator=(file_descriptor &&) -> file_descriptor & = delete;

    [[nodiscard]] auto get() const -> int { return descriptor_; }
    explicit operator bool() const { return descriptor_ >= 0; }

  private:
    int descriptor_;
  };

  auto last_error() -> std::error_code { return { errno, std::generic_category() }; }

  [[noreturn]] auto throw_errno(const char *what, const std::filesystem::path &path) -> void
  {
    throw std::filesystem::filesystem_error(what, path, last_error());
  }

  auto write_all(int descriptor, std::span<const std::uint8_t> contents) -> bool
  {
    while (not contents.empty()) {
      const auto written = ::write(descriptor, contents.data(), contents.size());
      if (written < 0) {
        if (errno == EINTR) { continue; }
        return false;
      }
      contents = contents.subspan(static_cast<std::size_t>(written));
    }
    return true;
  }

}// namespace

auto derive_key(std::string_view passphrase,
  std::span<const std::uint8_t> salt,
  const crypto::kdf::scrypt_params &params) -> crypto::key32
{
  if (passphrase.empty()) { return crypto::key32{}; }
  return crypto::kdf::scrypt(passphrase, salt, params);
}

auto seal_state(const crypto::key32 &key, std::span<const std::uint8_t> salt, std::span<const std::uint8_t> snapshot)
  -> crypto::bytes
{
  if (salt.size() != salt_size) { throw std::invalid_argument("state file salt must be 32 bytes"); }
  crypto::bytes out(salt.begin(), salt.end());
  const auto sealed = crypto::aead::seal(key, snapshot);
  out.insert(out.end(), sealed.begin(), sealed.end());
  return out;
}

auto read_salt(std::span<const std::uint8_t> file) -> crypto::bytes
{
  if (file.size() < salt_size + crypto::aead::overhead) {
    core::raise(core::errc::corrupt_state, "state file truncated");
  }
  return { file.begin(), file.begin() + static_cast<std::ptrdiff_t>(salt_size) };
}

auto open_state(const crypto::key32 &key, std::span<const std::uint8_t> file) -> crypto::bytes
{
  std::ignore = read_salt(file);
  auto snapshot = crypto::aead::open(key, file.subspan(salt_size));
  if (not snapshot) { core::raise(core::errc::incorrect_passphrase); }
  return std::move(*snapshot);
}

auto load(std::span<const std::uint8_t> file, const crypto::key32 &key) -> model::session_state
{
  return deserialize(open_state(key, file));
}

auto read_file(const std::filesystem::path &path) -> crypto::bytes
{
  std::ifstream input(path, std::ios::binary);
  if (not input) {
    throw std::filesystem::filesystem_error(
      "cannot open for reading", path, std::make_error_code(std::errc::no_such_file_or_directory));
  }
  return { std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>() };
}

auto write_file_atomic(const std::filesystem::path &path, std::span<const std::uint8_t> contents) -> void
{
  auto temporary = path;
  temporary += "." + core::id_generator::token() + ".tmp";

  {
    const file_descriptor output(::open(temporary.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600));
    if (not output) { throw_errno("cannot open for writing", temporary); }
    if (not write_all(output.get(), contents) or ::fsync(output.get()) != 0) {
      const auto error = last_error();
      std::error_code ignored;
      std::filesystem::remove(temporary, ignored);
      throw std::filesystem::filesystem_error("cannot write", temporary, error);
    }
  }

  std::filesystem::rename(temporary, path);

  const auto directory = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
  const file_descriptor parent(::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (not parent or ::fsync(parent.get()) != 0) { throw_errno("cannot sync directory", directory); }
}

}// namespace courier::persistence
