/**
 * @file memory_channel.h
 * @brief In-process shared channel
 */

#ifndef CLIPXFER_CHANNEL_MEMORY_CHANNEL_H
#define CLIPXFER_CHANNEL_MEMORY_CHANNEL_H

#include <clipxfer/channel/channel_interface.h>

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace clipxfer {

/**
 * @brief Single-slot channel held in memory
 *
 * Thread-safe, so a sender and a receiver in the same process can share
 * it. Failures can be injected to exercise the transient error paths.
 */
class memory_channel : public channel_interface {
public:
    /// Observer invoked after every successful write, with the written text
    using write_observer = std::function<void(const std::string&)>;

    memory_channel() = default;
    explicit memory_channel(std::string initial);

    [[nodiscard]] auto type() const -> std::string_view override { return "memory"; }

    [[nodiscard]] auto read() -> result<std::string> override;

    [[nodiscard]] auto write(std::string_view text) -> result<void> override;

    /**
     * @brief Make the next n reads fail
     */
    void fail_next_reads(uint32_t n);

    /**
     * @brief Make the next n writes fail
     */
    void fail_next_writes(uint32_t n);

    /**
     * @brief Overwrite the slot bypassing failure injection and observers
     *
     * Stands in for a third program touching the clipboard.
     */
    void overwrite(std::string text);

    void set_write_observer(write_observer observer);

    [[nodiscard]] auto peek() const -> std::string;

    [[nodiscard]] auto write_count() const -> uint64_t;

private:
    mutable std::mutex mutex_;
    std::string value_;
    uint32_t failing_reads_ = 0;
    uint32_t failing_writes_ = 0;
    uint64_t write_count_ = 0;
    write_observer observer_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CHANNEL_MEMORY_CHANNEL_H
