#ifndef PROGRESS_HPP
#define PROGRESS_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace gitsight {

enum class ProgressStage { Counting, Compressing, Resolving, Receiving, Pushing, Message, Done };

struct ProgressEvent {
    ProgressStage stage = ProgressStage::Message;
    std::size_t current = 0;
    std::size_t total = 0;
    std::string message;
};

/**
 * @brief One-way queue carrying transfer progress to a presentation thread.
 *
 * Producers never block; @ref receive blocks until an event arrives or the
 * channel is closed and drained.
 */
class ProgressChannel {
  public:
    void publish(ProgressEvent event);
    std::optional<ProgressEvent> receive();
    /** @brief Stop accepting events; pending ones are still delivered. */
    void close();
    bool closed() const;

  private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> queue_;
    bool closed_ = false;
};

/**
 * @brief Parse a server sideband line like
 *        `Counting objects:  50% (5/10)`.
 *
 * @return `std::nullopt` when the text is not a progress line.
 */
std::optional<ProgressEvent> parse_sideband(const std::string& text);

/** @brief Single-line human readable form of @a event. */
std::string describe(const ProgressEvent& event);

} // namespace gitsight

#endif // PROGRESS_HPP
