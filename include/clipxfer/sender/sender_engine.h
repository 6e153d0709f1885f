/**
 * @file sender_engine.h
 * @brief Sending side of a clipboard transfer
 */

#ifndef CLIPXFER_SENDER_SENDER_ENGINE_H
#define CLIPXFER_SENDER_SENDER_ENGINE_H

#include <clipxfer/archive/archiver_interface.h>
#include <clipxfer/channel/channel_interface.h>
#include <clipxfer/core/cancellation.h>
#include <clipxfer/core/types.h>
#include <clipxfer/sender/sender_types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>

namespace clipxfer {

/**
 * @brief Publishes an artifact over a shared channel, one acknowledged packet at a time
 *
 * The artifact is digested once before chunking. Each packet is written
 * to the channel and the engine polls until the receiver's matching ACK
 * replaces it. When no ACK arrives within the timeout the identical text
 * is written again and the wait restarts, with no retry limit. Only the
 * cancellation token ends a stalled wait.
 *
 * @code
 * memory_channel channel;
 * auto engine = sender_engine::builder()
 *     .with_chunk_size(64 * 1024)
 *     .with_ack_timeout(std::chrono::seconds(10))
 *     .build(channel);
 *
 * cancellation_token token;
 * auto summary = engine.value().send("report.pdf", token);
 * @endcode
 */
class sender_engine {
public:
    /**
     * @brief Builder for sender_engine
     */
    class builder {
    public:
        builder();

        auto with_chunk_size(std::size_t size) -> builder&;

        auto with_dividing_size(std::size_t size) -> builder&;

        auto with_part_size(uint64_t size) -> builder&;

        auto with_poll_interval(std::chrono::milliseconds interval) -> builder&;

        auto with_ack_timeout(std::chrono::milliseconds timeout) -> builder&;

        auto with_work_directory(std::filesystem::path dir) -> builder&;

        /**
         * @brief Archive the artifact before sending
         * @param archiver Archiver to use; detected on PATH when null
         */
        auto with_archive(std::unique_ptr<archiver_interface> archiver = nullptr) -> builder&;

        auto with_config(sender_config config) -> builder&;

        /**
         * @brief Build the engine
         * @param channel Channel to publish on; must outlive the engine
         * @return Engine or invalid_configuration
         */
        [[nodiscard]] auto build(channel_interface& channel) -> result<sender_engine>;

    private:
        sender_config config_;
        std::unique_ptr<archiver_interface> archiver_;
    };

    sender_engine(const sender_engine&) = delete;
    auto operator=(const sender_engine&) -> sender_engine& = delete;
    sender_engine(sender_engine&&) noexcept;
    auto operator=(sender_engine&&) noexcept -> sender_engine&;
    ~sender_engine();

    /**
     * @brief Send an artifact
     * @param artifact_path File to send
     * @param token Cancels the transfer between polls
     * @return Summary once every packet is acknowledged, or error
     *
     * Fatal setup errors (unreadable artifact, missing archiver) are
     * returned before anything is written to the channel. Channel
     * failures during the transfer are logged and retried.
     */
    [[nodiscard]] auto send(
        const std::filesystem::path& artifact_path,
        const cancellation_token& token) -> result<send_summary>;

    /**
     * @brief Register callback invoked after every acknowledged packet
     */
    void on_progress(std::function<void(const send_progress&)> callback);

    [[nodiscard]] auto config() const -> const sender_config&;

private:
    sender_engine(channel_interface& channel,
                  sender_config config,
                  std::unique_ptr<archiver_interface> archiver);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_SENDER_SENDER_ENGINE_H
