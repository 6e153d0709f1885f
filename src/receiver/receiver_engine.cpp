/**
 * @file receiver_engine.cpp
 * @brief Receiver engine implementation
 */

#include <clipxfer/receiver/receiver_engine.h>

#include <clipxfer/codec/codec.h>
#include <clipxfer/core/checksum.h>
#include <clipxfer/core/logging.h>
#include <clipxfer/core/scoped_directory.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <optional>
#include <thread>

namespace clipxfer {

namespace {

auto to_lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief Create a directory and prove it accepts new files
 */
auto ensure_writable(const std::filesystem::path& dir) -> result<void> {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return unexpected(error{error_code::directory_not_writable,
                                "cannot create " + dir.string() + ": " + ec.message()});
    }

    auto probe = dir / (".clipxfer_probe_" + random_hex(8));
    {
        std::ofstream file(probe, std::ios::trunc);
        if (!file) {
            return unexpected(error{error_code::directory_not_writable,
                                    "directory is not writable: " + dir.string()});
        }
    }
    std::filesystem::remove(probe, ec);
    return {};
}

auto context_of(const packet& p) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.filename = p.base_filename;
    if (p.part_index) {
        ctx.part_index = p.part_index;
        ctx.part_count = p.part_count;
    }
    ctx.sequence_index = p.sequence_index;
    ctx.sequence_count = p.sequence_count;
    return ctx;
}

}  // namespace

struct receiver_engine::impl {
    channel_interface* channel;
    receiver_config config;

    change_detector detector;
    std::unique_ptr<receiver_session> session;
    /// Exact text of the packet that finished the most recent transfer
    std::optional<std::string> last_final_packet;
    receive_summary summary;
    bool stop_requested = false;

    std::function<void(const transfer_outcome&)> complete_callback;
    std::function<void(const receive_progress&)> progress_callback;
    std::mutex callback_mutex;

    impl(channel_interface& ch, receiver_config cfg) : channel(&ch), config(std::move(cfg)) {}

    auto options(bool resume) const -> session_options {
        session_options opts;
        opts.work_root = config.work_directory;
        opts.mode = config.mode;
        opts.resume = resume;
        return opts;
    }

    void acknowledge(const packet& p) {
        auto text = codec::encode_ack(codec::ack_for(p));
        if (auto written = channel->write(text); !written) {
            const auto ctx = context_of(p);
            CX_LOG_WARN_CTX(log_category::receiver,
                            "ACK write failed: " + written.error().message, ctx);
        }
        // Never read our own ACK back as news; if the write failed the
        // packet is still there and reads as a change, which re-ACKs it
        detector.prime(std::move(text));
    }

    auto start_session(const packet& p, bool resume) -> result<void> {
        if (session) {
            CX_LOG_WARN(log_category::receiver,
                        "Abandoning incomplete transfer of '" + session->base_filename() + "'");
            session->discard();
            session.reset();
        }

        auto opened = receiver_session::open(p, options(resume));
        if (!opened) {
            return unexpected(opened.error());
        }
        session = std::move(opened.value());

        CX_LOG_INFO(log_category::receiver,
                    "Transfer initiated: '" + p.base_filename + "', " +
                        std::to_string(p.effective_part_count()) + " part(s), sha256 " +
                        p.content_hash);
        if (p.archive_type) {
            CX_LOG_INFO(log_category::receiver,
                        "This is an archived transfer (" + *p.archive_type + ")");
        }
        return {};
    }

    auto finalize(const packet& last) -> transfer_outcome {
        transfer_outcome outcome;
        outcome.filename = session->base_filename();
        outcome.expected_hash = session->content_hash();
        outcome.archive_type = session->archive_type();

        const auto final_path = config.output_directory / outcome.filename;
        const auto temp_path = config.output_directory /
                               ("." + outcome.filename + ".clipxfer_" + random_hex(8) + ".tmp");

        CX_LOG_INFO(log_category::receiver, "Reassembling '" + outcome.filename + "'");

        std::error_code ec;
        std::filesystem::create_directories(config.output_directory, ec);

        auto bytes = session->reassemble(temp_path);
        if (!bytes) {
            outcome.failure = bytes.error();
        } else {
            outcome.bytes = bytes.value();
            auto actual = checksum::sha256_file(temp_path);
            if (!actual) {
                outcome.failure = actual.error();
            } else {
                outcome.actual_hash = actual.value();
                if (outcome.actual_hash != to_lower(outcome.expected_hash)) {
                    outcome.failure = error{error_code::file_hash_mismatch,
                                            "expected " + outcome.expected_hash + ", got " +
                                                outcome.actual_hash};
                } else {
                    std::filesystem::rename(temp_path, final_path, ec);
                    if (ec) {
                        outcome.failure = error{error_code::file_write_error,
                                                "cannot deliver " + final_path.string() + ": " +
                                                    ec.message()};
                    } else {
                        outcome.verified = true;
                        outcome.delivered_path = final_path;
                    }
                }
            }
        }

        if (!outcome.verified) {
            std::filesystem::remove(temp_path, ec);
        }

        session->finish(outcome.verified);
        session->discard();
        session.reset();

        if (outcome.verified) {
            summary.transfers_completed++;
            CX_LOG_INFO(log_category::receiver,
                        "SUCCESS: hashes match, saved " + final_path.string() + " (" +
                            std::to_string(outcome.bytes) + " bytes)");
            if (outcome.archive_type) {
                CX_LOG_INFO(log_category::receiver,
                            "Reminder: extract '" + final_path.string() +
                                "' to get the original content");
            }
            if (config.exit_after_one_transfer) {
                stop_requested = true;
            }
        } else {
            summary.transfers_failed++;
            CX_LOG_ERROR(log_category::receiver,
                         "FAILURE: transfer of '" + outcome.filename + "' rejected: " +
                             outcome.failure->message);
        }
        return outcome;
    }

    auto handle_value(const std::string& value) -> poll_outcome {
        auto changed = detector.observe(value);
        if (!changed || changed->empty()) {
            return poll_outcome::no_change;
        }

        auto decoded = codec::decode(*changed);
        if (!decoded) {
            CX_LOG_TRACE(log_category::receiver,
                         "Ignoring channel value: " + decoded.error().message);
            return poll_outcome::ignored;
        }
        const auto& p = decoded.value();
        const auto ctx = context_of(p);

        // The sender may have missed the ACK of the transfer's last packet.
        // Only a byte-identical retransmission counts; a resend after a failed
        // transfer carries different content and starts over.
        if (last_final_packet) {
            if (*changed == *last_final_packet) {
                CX_LOG_DEBUG_CTX(log_category::receiver, "Re-acknowledging final packet", ctx);
                acknowledge(p);
                summary.duplicates++;
                return poll_outcome::duplicate;
            }
            last_final_packet.reset();
        }

        if (!session || !session->matches(p)) {
            if (auto started = start_session(p, config.resume); !started) {
                CX_LOG_ERROR_CTX(log_category::receiver,
                                 "Cannot start session: " + started.error().message, ctx);
                detector.reset();
                return poll_outcome::storage_error;
            }
        }

        auto accepted = session->accept(p);
        if (!accepted && accepted.error().code == error_code::session_mismatch) {
            CX_LOG_WARN_CTX(log_category::receiver,
                            "Chunk layout changed, restarting transfer: " +
                                accepted.error().message,
                            ctx);
            session->discard();
            session.reset();
            if (auto started = start_session(p, false); !started) {
                CX_LOG_ERROR_CTX(log_category::receiver,
                                 "Cannot start session: " + started.error().message, ctx);
                detector.reset();
                return poll_outcome::storage_error;
            }
            accepted = session->accept(p);
        }
        if (!accepted) {
            // No ACK: the sender keeps republishing and we retry on the next poll
            CX_LOG_ERROR_CTX(log_category::receiver,
                             "Cannot store chunk: " + accepted.error().message, ctx);
            detector.reset();
            return poll_outcome::storage_error;
        }

        const auto status = accepted.value().status;
        switch (status) {
            case store_status::stored: summary.chunks_stored++; break;
            case store_status::duplicate: summary.duplicates++; break;
            case store_status::discarded: summary.discarded++; break;
        }

        receive_progress progress;
        progress.filename = p.base_filename;
        progress.part_index = p.effective_part_index();
        progress.part_count = p.effective_part_count();
        progress.sequence_index = p.sequence_index;
        progress.sequence_count = p.sequence_count;
        progress.status = status;

        if (accepted.value().transfer_ready) {
            auto outcome = finalize(p);
            last_final_packet = *changed;
            acknowledge(p);
            notify_progress(progress);
            notify_complete(outcome);
            return outcome.verified ? poll_outcome::transfer_completed
                                    : poll_outcome::transfer_failed;
        }

        acknowledge(p);
        if (status == store_status::stored) {
            CX_LOG_INFO_CTX(log_category::receiver, "Received chunk, sending ACK", ctx);
        } else {
            CX_LOG_DEBUG_CTX(log_category::receiver,
                             std::string("Chunk ") + to_string(status) + ", sending ACK", ctx);
        }
        notify_progress(progress);

        switch (status) {
            case store_status::duplicate: return poll_outcome::duplicate;
            case store_status::discarded: return poll_outcome::discarded;
            default: return poll_outcome::stored;
        }
    }

    void notify_progress(const receive_progress& progress) {
        std::lock_guard lock(callback_mutex);
        if (progress_callback) {
            progress_callback(progress);
        }
    }

    void notify_complete(const transfer_outcome& outcome) {
        std::lock_guard lock(callback_mutex);
        if (complete_callback) {
            complete_callback(outcome);
        }
    }
};

// Builder implementation
receiver_engine::builder::builder() = default;

auto receiver_engine::builder::with_output_directory(std::filesystem::path dir) -> builder& {
    config_.output_directory = std::move(dir);
    return *this;
}

auto receiver_engine::builder::with_work_directory(std::filesystem::path dir) -> builder& {
    config_.work_directory = std::move(dir);
    return *this;
}

auto receiver_engine::builder::with_poll_interval(std::chrono::milliseconds interval) -> builder& {
    config_.poll_interval = interval;
    return *this;
}

auto receiver_engine::builder::with_exit_after_one_transfer(bool enable) -> builder& {
    config_.exit_after_one_transfer = enable;
    return *this;
}

auto receiver_engine::builder::with_mode(receive_mode mode) -> builder& {
    config_.mode = mode;
    return *this;
}

auto receiver_engine::builder::with_resume(bool enable) -> builder& {
    config_.resume = enable;
    return *this;
}

auto receiver_engine::builder::with_config(receiver_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto receiver_engine::builder::build(channel_interface& channel) -> result<receiver_engine> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    return receiver_engine{channel, std::move(config_)};
}

// receiver_engine implementation
receiver_engine::receiver_engine(channel_interface& channel, receiver_config config)
    : impl_(std::make_unique<impl>(channel, std::move(config))) {
    get_logger().initialize();
}

receiver_engine::receiver_engine(receiver_engine&&) noexcept = default;
auto receiver_engine::operator=(receiver_engine&&) noexcept -> receiver_engine& = default;
receiver_engine::~receiver_engine() = default;

auto receiver_engine::prepare() -> result<void> {
    if (auto out = ensure_writable(impl_->config.output_directory); !out) {
        return out;
    }
    return ensure_writable(impl_->config.work_directory);
}

auto receiver_engine::poll_once() -> result<poll_outcome> {
    auto value = impl_->channel->read();
    if (!value) {
        return unexpected(value.error());
    }
    return impl_->handle_value(value.value());
}

auto receiver_engine::handle_value(const std::string& value) -> poll_outcome {
    return impl_->handle_value(value);
}

auto receiver_engine::run(const cancellation_token& token) -> result<receive_summary> {
    if (auto ready = prepare(); !ready) {
        return unexpected(ready.error());
    }

    CX_LOG_INFO(log_category::receiver, "Receiver is running, waiting for data");
    impl_->stop_requested = false;

    while (!token.is_cancelled()) {
        auto outcome = poll_once();
        if (!outcome) {
            CX_LOG_DEBUG(log_category::receiver,
                         "Channel read failed: " + outcome.error().message);
        }
        if (impl_->stop_requested) {
            break;
        }
        std::this_thread::sleep_for(impl_->config.poll_interval);
    }

    impl_->summary.cancelled = !impl_->stop_requested;
    return impl_->summary;
}

void receiver_engine::on_transfer_complete(std::function<void(const transfer_outcome&)> callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->complete_callback = std::move(callback);
}

void receiver_engine::on_progress(std::function<void(const receive_progress&)> callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->progress_callback = std::move(callback);
}

auto receiver_engine::active_session() const -> const receiver_session* {
    return impl_->session.get();
}

auto receiver_engine::summary() const -> const receive_summary& {
    return impl_->summary;
}

auto receiver_engine::config() const -> const receiver_config& {
    return impl_->config;
}

}  // namespace clipxfer
