#ifndef PROGRESS_CHANNEL_HPP
#define PROGRESS_CHANNEL_HPP

#include <chrono>              // for milliseconds
#include <condition_variable>  // for condition_variable
#include <cstdint>             // for uint8_t
#include <deque>               // for deque
#include <map>                 // for map
#include <memory>              // for shared_ptr
#include <mutex>               // for mutex
#include <optional>            // for optional
#include <string>              // for string
#include <string_view>         // for string_view
#include <vector>              // for vector

namespace autoiso::progress {

enum class EventKind : std::uint8_t {
    Progress,
    Status,
    Error
};

/// Ephemeral job update, never persisted.
struct ProgressEvent final {
    std::string job_id{};
    EventKind kind{EventKind::Progress};
    std::uint8_t progress{};
    std::string status{};
    std::string message{};

    bool operator==(const ProgressEvent&) const = default;
};

[[nodiscard]] auto event_kind_to_string(EventKind kind) noexcept -> std::string_view;

/// Serializes event as {"data":{"type":..,"progress":..,"status":..,"message":..}}.
[[nodiscard]] auto event_to_json(const ProgressEvent& event) noexcept -> std::string;

class ProgressChannel;

// Receiving end of a channel. Unsubscribes on destruction.
class Subscription final {
 public:
    Subscription() = default;
    ~Subscription();

    // explicitly deleted (move-only)
    Subscription(const Subscription&)     = delete;
    auto operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept = default;
    auto operator=(Subscription&& other) noexcept -> Subscription&;

    /// @brief Blocks until the next event.
    /// @return The event, or std::nullopt once the channel is closed and drained.
    [[nodiscard]] auto receive() noexcept -> std::optional<ProgressEvent>;

    /// @brief Like receive(), but gives up after timeout.
    /// Use finished() to tell a timeout from the end of the stream.
    [[nodiscard]] auto receive_for(std::chrono::milliseconds timeout) noexcept -> std::optional<ProgressEvent>;

    /// @return true once the channel is closed and every event was received.
    [[nodiscard]] auto finished() const noexcept -> bool;

    [[nodiscard]] auto valid() const noexcept -> bool { return m_channel != nullptr; }

 private:
    friend class ProgressChannel;
    struct Queue {
        std::deque<ProgressEvent> events{};
        bool closed{};
    };

    Subscription(std::shared_ptr<ProgressChannel> channel, std::shared_ptr<Queue> queue) noexcept
      : m_channel(std::move(channel)), m_queue(std::move(queue)) { }

    std::shared_ptr<ProgressChannel> m_channel{};
    std::shared_ptr<Queue> m_queue{};
};

/// @brief Per-job fan-out of progress events.
/// Subscribers get events published after they subscribed, in publish order.
/// A subscriber joining a closed channel gets only the closing event.
class ProgressChannel final : public std::enable_shared_from_this<ProgressChannel> {
 public:
    [[nodiscard]] static auto create() noexcept -> std::shared_ptr<ProgressChannel>;

    [[nodiscard]] auto subscribe() noexcept -> Subscription;

    /// @return false when the channel is already closed.
    auto publish(ProgressEvent event) noexcept -> bool;

    /// Publishes the closing event and ends every subscription.
    auto close(ProgressEvent final_event) noexcept -> bool;

    [[nodiscard]] auto is_closed() const noexcept -> bool;
    [[nodiscard]] auto subscriber_count() const noexcept -> std::size_t;

 private:
    friend class Subscription;
    ProgressChannel() = default;

    void unsubscribe(const std::shared_ptr<Subscription::Queue>& queue) noexcept;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<std::shared_ptr<Subscription::Queue>> m_subscribers{};
    std::optional<ProgressEvent> m_last_event{};
    bool m_closed{};
};

// Registry of channels by job id
class ProgressHub final {
 public:
    /// Returns the channel of the job, creating it on first use.
    [[nodiscard]] auto channel(std::string_view job_id) noexcept -> std::shared_ptr<ProgressChannel>;

    [[nodiscard]] auto find(std::string_view job_id) const noexcept -> std::shared_ptr<ProgressChannel>;

    void remove(std::string_view job_id) noexcept;

    [[nodiscard]] auto size() const noexcept -> std::size_t;

 private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<ProgressChannel>, std::less<>> m_channels{};
};

}  // namespace autoiso::progress

#endif  // PROGRESS_CHANNEL_HPP
