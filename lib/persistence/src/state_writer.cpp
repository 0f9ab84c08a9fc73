#include <persistence/state_writer.hpp>

#include <core/processor_runner.hpp>
#include <persistence/state_file.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace courier::persistence {

state_writer::state_writer(std::shared_ptr<in_queue_t> in_queue,
  std::shared_ptr<out_queue_t> out_queue,
  std::filesystem::path path,
  const crypto::key32 &key,
  crypto::bytes salt)
  : in_queue_(std::move(in_queue)), out_queue_(std::move(out_queue)), path_(std::move(path)), key_(key),
    salt_(std::move(salt))
{}

// NOLINTNEXTLINE(performance-unnecessary-value-param)
auto state_writer::run_once(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
{
  auto evt = co_await in_queue_->pop(cancel_slot);
  std::visit([this](const auto &request) { handle(request); }, evt);
}

// NOLINTNEXTLINE(performance-unnecessary-value-param)
auto state_writer::run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
{
  try {
    while (true) { co_await run_once(cancel_slot); }
  } catch (const boost::system::system_error &e) {
    if (not core::is_stop_request(e.code())) {
      spdlog::error("[state_writer] Unexpected error in run loop: {}", e.what());
      emit(core::events::persistence::stopped{});
      throw;
    }
  }

  while (auto evt = in_queue_->try_pop()) {
    std::visit([this](const auto &request) { handle(request); }, *evt);
  }
  spdlog::debug("[state_writer] Input closed, stopping");
  emit(core::events::persistence::stopped{});
}

auto state_writer::handle(const core::events::persistence::save &request) -> void
{
  try {
    write_file_atomic(path_, seal_state(key_, salt_, request.snapshot));
    spdlog::trace("[state_writer] Wrote snapshot {} ({} bytes)", request.sequence, request.snapshot.size());
    emit(core::events::persistence::written{ .sequence = request.sequence });
  } catch (const std::filesystem::filesystem_error &e) {
    spdlog::error("[state_writer] Failed to write {}: {}", path_.string(), e.what());
    emit(core::events::persistence::write_failed{ .sequence = request.sequence, .reason = e.what() });
  } catch (const std::exception &e) {
    spdlog::error("[state_writer] Failed to seal snapshot {}: {}", request.sequence, e.what());
    emit(core::events::persistence::write_failed{ .sequence = request.sequence, .reason = e.what() });
  }
}

auto state_writer::emit(core::events::persistence::out_t event) -> void
{
  if (not out_queue_->try_push(std::move(event))) { spdlog::warn("[state_writer] Completion queue closed"); }
}

}// namespace courier::persistence
