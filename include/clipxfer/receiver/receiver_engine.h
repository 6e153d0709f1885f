/**
 * @file receiver_engine.h
 * @brief Receiving side of a clipboard transfer
 */

#ifndef CLIPXFER_RECEIVER_RECEIVER_ENGINE_H
#define CLIPXFER_RECEIVER_RECEIVER_ENGINE_H

#include <clipxfer/channel/channel_interface.h>
#include <clipxfer/core/cancellation.h>
#include <clipxfer/core/types.h>
#include <clipxfer/receiver/receiver_session.h>
#include <clipxfer/receiver/receiver_types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace clipxfer {

/**
 * @brief Polls a shared channel, stores packets and acknowledges them
 *
 * At most one transfer is tracked at a time. A packet of another
 * transfer replaces the current session and drops its temporary state.
 * Every chunk is persisted before its ACK is written, and chunks already
 * held are acknowledged again so a sender that missed an ACK can
 * advance. When the last part is reassembled the artifact is digested;
 * on a match it is moved into the output directory, otherwise it is
 * deleted and the failure reported.
 *
 * @code
 * auto engine = receiver_engine::builder()
 *     .with_output_directory("/tmp/incoming")
 *     .with_exit_after_one_transfer(true)
 *     .build(channel);
 *
 * engine.value().on_transfer_complete([](const transfer_outcome& outcome) {
 *     std::cout << outcome.filename << (outcome.verified ? " ok" : " corrupt") << "\n";
 * });
 *
 * cancellation_token token;
 * auto summary = engine.value().run(token);
 * @endcode
 */
class receiver_engine {
public:
    /**
     * @brief Builder for receiver_engine
     */
    class builder {
    public:
        builder();

        auto with_output_directory(std::filesystem::path dir) -> builder&;

        auto with_work_directory(std::filesystem::path dir) -> builder&;

        auto with_poll_interval(std::chrono::milliseconds interval) -> builder&;

        auto with_exit_after_one_transfer(bool enable) -> builder&;

        auto with_mode(receive_mode mode) -> builder&;

        auto with_resume(bool enable) -> builder&;

        auto with_config(receiver_config config) -> builder&;

        /**
         * @brief Build the engine
         * @param channel Channel to poll; must outlive the engine
         * @return Engine or invalid_configuration
         */
        [[nodiscard]] auto build(channel_interface& channel) -> result<receiver_engine>;

    private:
        receiver_config config_;
    };

    receiver_engine(const receiver_engine&) = delete;
    auto operator=(const receiver_engine&) -> receiver_engine& = delete;
    receiver_engine(receiver_engine&&) noexcept;
    auto operator=(receiver_engine&&) noexcept -> receiver_engine&;
    ~receiver_engine();

    /**
     * @brief Check the output and work directories
     * @return directory_not_writable if either cannot be written
     */
    [[nodiscard]] auto prepare() -> result<void>;

    /**
     * @brief Read the channel once and handle the value
     * @return What was done, or the channel read error
     */
    [[nodiscard]] auto poll_once() -> result<poll_outcome>;

    /**
     * @brief Handle a value read from the channel
     */
    auto handle_value(const std::string& value) -> poll_outcome;

    /**
     * @brief Poll until cancelled, or until one transfer is delivered
     *        when exit_after_one_transfer is set
     * @return Counters of the run, or a fatal setup error
     */
    [[nodiscard]] auto run(const cancellation_token& token) -> result<receive_summary>;

    /**
     * @brief Register callback invoked when a transfer is verified or fails
     */
    void on_transfer_complete(std::function<void(const transfer_outcome&)> callback);

    /**
     * @brief Register callback invoked after every acknowledged packet
     */
    void on_progress(std::function<void(const receive_progress&)> callback);

    /**
     * @brief Session of the transfer in progress, if any
     */
    [[nodiscard]] auto active_session() const -> const receiver_session*;

    [[nodiscard]] auto summary() const -> const receive_summary&;

    [[nodiscard]] auto config() const -> const receiver_config&;

private:
    receiver_engine(channel_interface& channel, receiver_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_RECEIVER_RECEIVER_ENGINE_H
