/**
 * @file channel_interface.h
 * @brief Shared channel abstraction
 *
 * The shared channel is a single text slot both parties read and
 * overwrite. It holds one value at a time, never queues writes and offers
 * no change notification, so callers poll it.
 */

#ifndef CLIPXFER_CHANNEL_CHANNEL_INTERFACE_H
#define CLIPXFER_CHANNEL_CHANNEL_INTERFACE_H

#include <clipxfer/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace clipxfer {

/**
 * @brief Channel interface base class
 *
 * Implementations must be safe to poll in a tight loop. Read and write
 * failures are reported but callers treat them as transient.
 */
class channel_interface {
public:
    virtual ~channel_interface() = default;

    channel_interface(const channel_interface&) = delete;
    auto operator=(const channel_interface&) -> channel_interface& = delete;

    /**
     * @brief Get the channel type identifier (e.g. "clipboard", "file")
     */
    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    /**
     * @brief Read the current value of the slot
     * @return Current text (empty when the slot is empty) or error
     */
    [[nodiscard]] virtual auto read() -> result<std::string> = 0;

    /**
     * @brief Replace the value of the slot
     * @param text New value
     * @return Success or error
     */
    [[nodiscard]] virtual auto write(std::string_view text) -> result<void> = 0;

protected:
    channel_interface() = default;
};

/**
 * @brief Change detection over a polled channel value
 *
 * Remembers the last raw value observed and only reports values that
 * differ from it. Values the owner wrote itself are primed so their echo
 * is never reported.
 */
class change_detector {
public:
    /**
     * @brief Offer a freshly read value
     * @return The value if it differs from the last one observed
     */
    [[nodiscard]] auto observe(std::string value) -> std::optional<std::string> {
        if (last_ && *last_ == value) {
            return std::nullopt;
        }
        last_ = value;
        return value;
    }

    /**
     * @brief Record a value as already seen
     */
    void prime(std::string value) { last_ = std::move(value); }

    void reset() { last_.reset(); }

    [[nodiscard]] auto last() const -> const std::optional<std::string>& { return last_; }

private:
    std::optional<std::string> last_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CHANNEL_CHANNEL_INTERFACE_H
