/**
 * @file sender_engine.cpp
 * @brief Sender engine implementation
 */

#include <clipxfer/sender/sender_engine.h>

#include <clipxfer/archive/command_archiver.h>
#include <clipxfer/codec/codec.h>
#include <clipxfer/core/checksum.h>
#include <clipxfer/core/chunk_splitter.h>
#include <clipxfer/core/file_partitioner.h>
#include <clipxfer/core/logging.h>
#include <clipxfer/core/scoped_directory.h>

#include <fstream>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace clipxfer {

namespace {

/**
 * @brief Fatal setup check of the artifact
 */
auto check_artifact(const std::filesystem::path& path) -> result<uint64_t> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected(error{error_code::file_not_found, "file not found: " + path.string()});
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(error{error_code::invalid_file_path, "not a regular file: " + path.string()});
    }
    std::ifstream probe(path, std::ios::binary);
    if (!probe) {
        return unexpected(error{error_code::file_access_denied, "cannot read file: " + path.string()});
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error, "cannot stat file: " + ec.message()});
    }
    return size;
}

/**
 * @brief One on-disk unit chunked independently
 */
struct send_part {
    std::filesystem::path path;
    uint64_t size = 0;
};

}  // namespace

struct sender_engine::impl {
    channel_interface* channel;
    sender_config config;
    std::unique_ptr<archiver_interface> archiver;

    std::function<void(const send_progress&)> progress_callback;
    std::mutex callback_mutex;

    impl(channel_interface& ch, sender_config cfg, std::unique_ptr<archiver_interface> arch)
        : channel(&ch), config(std::move(cfg)), archiver(std::move(arch)) {}

    void notify_progress(const send_progress& progress) {
        std::lock_guard lock(callback_mutex);
        if (progress_callback) {
            progress_callback(progress);
        }
    }

    /**
     * @brief Publish a packet and block until its ACK is observed
     * @return Number of republications, or transfer_cancelled
     */
    auto publish_and_await(const packet& p, const cancellation_token& token,
                           const transfer_log_context& ctx) -> result<uint64_t> {
        const auto text = codec::encode(p);
        const auto expected = codec::ack_for(p);
        change_detector detector;
        uint64_t retries = 0;

        while (true) {
            if (token.is_cancelled()) {
                return unexpected(error{error_code::transfer_cancelled, "send cancelled"});
            }

            if (auto written = channel->write(text); !written) {
                CX_LOG_WARN_CTX(log_category::sender,
                                "Channel write failed: " + written.error().message, ctx);
            }
            // Our own packet must never count as a change
            detector.prime(text);

            const auto deadline = std::chrono::steady_clock::now() + config.ack_timeout;
            while (std::chrono::steady_clock::now() < deadline) {
                if (token.is_cancelled()) {
                    return unexpected(error{error_code::transfer_cancelled, "send cancelled"});
                }

                auto value = channel->read();
                if (!value) {
                    CX_LOG_DEBUG_CTX(log_category::sender,
                                     "Channel read failed: " + value.error().message, ctx);
                } else if (auto changed = detector.observe(std::move(value.value()))) {
                    auto ack = codec::decode_ack(*changed);
                    if (ack && ack.value() == expected) {
                        return retries;
                    }
                }

                std::this_thread::sleep_for(config.poll_interval);
            }

            ++retries;
            auto retry_ctx = ctx;
            retry_ctx.retries = retries;
            CX_LOG_WARN_CTX(log_category::sender, "Timeout waiting for ACK, republishing", retry_ctx);
        }
    }

    auto send(const std::filesystem::path& artifact_path, const cancellation_token& token)
        -> result<send_summary> {
        const auto started = std::chrono::steady_clock::now();

        auto source_size = check_artifact(artifact_path);
        if (!source_size) {
            return unexpected(source_size.error());
        }

        // Archives and volumes live here until send() returns
        std::optional<scoped_directory> work_dir;
        auto ensure_work_dir = [&]() -> result<std::filesystem::path> {
            if (!work_dir) {
                auto created = scoped_directory::create(config.work_directory, "clipxfer_send_");
                if (!created) {
                    return unexpected(created.error());
                }
                work_dir.emplace(std::move(created.value()));
            }
            return work_dir->path();
        };

        std::filesystem::path artifact = artifact_path;
        uint64_t artifact_size = source_size.value();
        std::optional<std::string> archive_type;

        if (config.archive) {
            if (!archiver) {
                auto detected = command_archiver::detect();
                if (!detected) {
                    return unexpected(detected.error());
                }
                archiver = std::move(detected.value());
            }
            auto dir = ensure_work_dir();
            if (!dir) {
                return unexpected(dir.error());
            }
            auto archived = archiver->archive(artifact_path, dir.value());
            if (!archived) {
                return unexpected(archived.error());
            }
            artifact = archived.value().path;
            artifact_size = archived.value().size_bytes;
            archive_type = archived.value().archive_type;
        }

        auto hash = checksum::sha256_file(artifact);
        if (!hash) {
            return unexpected(hash.error());
        }

        const auto base_filename = artifact.filename().string();
        CX_LOG_INFO(log_category::sender,
                    "Preparing to send '" + base_filename + "' (" + std::to_string(artifact_size) +
                        " bytes, sha256 " + hash.value() + ")");

        std::vector<send_part> parts;
        const bool partitioned = config.part_size && artifact_size > *config.part_size;
        if (partitioned) {
            auto dir = ensure_work_dir();
            if (!dir) {
                return unexpected(dir.error());
            }
            auto volumes = file_partitioner::split(artifact, *config.part_size, dir.value() / "parts");
            if (!volumes) {
                return unexpected(volumes.error());
            }
            for (auto& volume : volumes.value()) {
                std::error_code ec;
                auto size = std::filesystem::file_size(volume, ec);
                if (ec) {
                    return unexpected(error{error_code::file_read_error,
                                            "cannot stat part " + volume.string()});
                }
                parts.push_back({volume, size});
            }
            CX_LOG_INFO(log_category::sender,
                        "Split into " + std::to_string(parts.size()) + " parts");
        } else {
            parts.push_back({artifact, artifact_size});
        }

        if (parts.size() > max_part_count) {
            return unexpected(error{error_code::invalid_configuration,
                                    std::to_string(parts.size()) + " parts exceed the limit of " +
                                        std::to_string(max_part_count)});
        }

        send_summary summary;
        summary.filename = base_filename;
        summary.content_hash = hash.value();
        summary.bytes = artifact_size;
        summary.parts = static_cast<uint32_t>(parts.size());
        summary.archive_type = archive_type;

        send_progress progress;
        progress.filename = base_filename;
        progress.part_count = summary.parts;
        progress.total_bytes = artifact_size;

        chunk_splitter splitter(config.chunking());

        for (std::size_t i = 0; i < parts.size(); ++i) {
            const auto part_index = static_cast<uint32_t>(i + 1);
            auto chunks = splitter.split(parts[i].path);
            if (!chunks) {
                return unexpected(chunks.error());
            }
            auto& iter = chunks.value();
            if (iter.total_chunks() > max_sequence_count) {
                return unexpected(error{error_code::invalid_chunk_size,
                                        "chunk size too small: " +
                                            std::to_string(iter.total_chunks()) + " chunks per part"});
            }

            while (iter.has_next()) {
                auto c = iter.next();
                if (!c) {
                    return unexpected(c.error());
                }

                packet p;
                p.base_filename = base_filename;
                p.content_hash = summary.content_hash;
                if (partitioned) {
                    p.part_index = part_index;
                    p.part_count = summary.parts;
                    p.part_filename = parts[i].path.filename().string();
                }
                p.dividing_index = c.value().dividing_index;
                p.dividing_count = c.value().dividing_count;
                p.sequence_index = c.value().sequence_index;
                p.sequence_count = c.value().sequence_count;
                p.archive_type = archive_type;
                p.payload = std::move(c.value().data);

                transfer_log_context ctx;
                ctx.filename = base_filename;
                if (partitioned) {
                    ctx.part_index = part_index;
                    ctx.part_count = summary.parts;
                }
                ctx.sequence_index = p.sequence_index;
                ctx.sequence_count = p.sequence_count;
                CX_LOG_DEBUG_CTX(log_category::sender, "Publishing chunk", ctx);

                auto retries = publish_and_await(p, token, ctx);
                if (!retries) {
                    CX_LOG_WARN_CTX(log_category::sender, retries.error().message, ctx);
                    return unexpected(retries.error());
                }

                summary.packets++;
                summary.retries += retries.value();

                progress.part_index = part_index;
                progress.dividing_index = p.dividing_index;
                progress.dividing_count = p.dividing_count;
                progress.sequence_index = p.sequence_index;
                progress.sequence_count = p.sequence_count;
                progress.bytes_acknowledged += p.payload.size();
                progress.retries = retries.value();

                CX_LOG_INFO_CTX(log_category::sender, "ACK received", ctx);
                notify_progress(progress);
            }
        }

        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        CX_LOG_INFO(log_category::sender,
                    "Transfer complete, " + std::to_string(summary.packets) +
                        " packets acknowledged");
        return summary;
    }
};

// Builder implementation
sender_engine::builder::builder() = default;

auto sender_engine::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto sender_engine::builder::with_dividing_size(std::size_t size) -> builder& {
    config_.dividing_size = size;
    return *this;
}

auto sender_engine::builder::with_part_size(uint64_t size) -> builder& {
    config_.part_size = size;
    return *this;
}

auto sender_engine::builder::with_poll_interval(std::chrono::milliseconds interval) -> builder& {
    config_.poll_interval = interval;
    return *this;
}

auto sender_engine::builder::with_ack_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.ack_timeout = timeout;
    return *this;
}

auto sender_engine::builder::with_work_directory(std::filesystem::path dir) -> builder& {
    config_.work_directory = std::move(dir);
    return *this;
}

auto sender_engine::builder::with_archive(std::unique_ptr<archiver_interface> archiver) -> builder& {
    config_.archive = true;
    archiver_ = std::move(archiver);
    return *this;
}

auto sender_engine::builder::with_config(sender_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto sender_engine::builder::build(channel_interface& channel) -> result<sender_engine> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    return sender_engine{channel, std::move(config_), std::move(archiver_)};
}

// sender_engine implementation
sender_engine::sender_engine(channel_interface& channel,
                             sender_config config,
                             std::unique_ptr<archiver_interface> archiver)
    : impl_(std::make_unique<impl>(channel, std::move(config), std::move(archiver))) {
    get_logger().initialize();
}

sender_engine::sender_engine(sender_engine&&) noexcept = default;
auto sender_engine::operator=(sender_engine&&) noexcept -> sender_engine& = default;
sender_engine::~sender_engine() = default;

auto sender_engine::send(const std::filesystem::path& artifact_path,
                         const cancellation_token& token) -> result<send_summary> {
    return impl_->send(artifact_path, token);
}

void sender_engine::on_progress(std::function<void(const send_progress&)> callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->progress_callback = std::move(callback);
}

auto sender_engine::config() const -> const sender_config& {
    return impl_->config;
}

}  // namespace clipxfer
