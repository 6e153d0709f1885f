/**
 * @file memory_channel.cpp
 * @brief Implementation of memory_channel
 */

#include <clipxfer/channel/memory_channel.h>

namespace clipxfer {

memory_channel::memory_channel(std::string initial) : value_(std::move(initial)) {}

auto memory_channel::read() -> result<std::string> {
    std::lock_guard lock(mutex_);
    if (failing_reads_ > 0) {
        --failing_reads_;
        return unexpected(error{error_code::channel_read_error, "injected read failure"});
    }
    return value_;
}

auto memory_channel::write(std::string_view text) -> result<void> {
    write_observer observer;
    std::string written;
    {
        std::lock_guard lock(mutex_);
        if (failing_writes_ > 0) {
            --failing_writes_;
            return unexpected(error{error_code::channel_write_error, "injected write failure"});
        }
        value_.assign(text.data(), text.size());
        ++write_count_;
        observer = observer_;
        written = value_;
    }

    // Called without the lock so the observer may touch the channel
    if (observer) {
        observer(written);
    }
    return {};
}

void memory_channel::fail_next_reads(uint32_t n) {
    std::lock_guard lock(mutex_);
    failing_reads_ = n;
}

void memory_channel::fail_next_writes(uint32_t n) {
    std::lock_guard lock(mutex_);
    failing_writes_ = n;
}

void memory_channel::overwrite(std::string text) {
    std::lock_guard lock(mutex_);
    value_ = std::move(text);
}

void memory_channel::set_write_observer(write_observer observer) {
    std::lock_guard lock(mutex_);
    observer_ = std::move(observer);
}

auto memory_channel::peek() const -> std::string {
    std::lock_guard lock(mutex_);
    return value_;
}

auto memory_channel::write_count() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return write_count_;
}

}  // namespace clipxfer
