#include <model/message_queue.hpp>

#include <algorithm>

namespace courier::model {

auto message_queue::enqueue(delivery item) -> void
{
  const std::scoped_lock lock(mutex_);
  items_.push_back(std::move(item));
}

auto message_queue::front() const -> std::optional<delivery>
{
  const std::scoped_lock lock(mutex_);
  if (items_.empty()) { return std::nullopt; }
  return items_.front();
}

auto message_queue::remove(std::uint64_t id) -> bool
{
  const std::scoped_lock lock(mutex_);
  const auto found = std::ranges::find_if(items_, [id](const delivery &item) { return item.id == id; });
  if (found == items_.end()) { return false; }
  items_.erase(found);
  return true;
}

auto message_queue::snapshot() const -> std::vector<delivery>
{
  const std::scoped_lock lock(mutex_);
  return { items_.begin(), items_.end() };
}

auto message_queue::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return items_.size();
}

}// namespace courier::model
