/**
 * @file channel_factory.cpp
 * @brief Implementation of channel_factory
 */

#include <clipxfer/channel/channel_factory.h>

#include <clipxfer/channel/clipboard_channel.h>
#include <clipxfer/channel/file_channel.h>
#include <clipxfer/channel/memory_channel.h>

namespace clipxfer {

auto channel_config::parse(std::string_view name) -> result<channel_config> {
    channel_config config;
    if (name == "clipboard") {
        config.kind = channel_kind::clipboard;
    } else if (name == "memory") {
        config.kind = channel_kind::memory;
    } else if (name.substr(0, 5) == "file:") {
        config.kind = channel_kind::file;
        config.file_path = std::filesystem::path(std::string(name.substr(5)));
    } else {
        return unexpected(error{error_code::invalid_configuration,
                                "unknown channel '" + std::string(name) + "'"});
    }

    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }
    return config;
}

auto channel_factory::create(const channel_config& config)
    -> result<std::unique_ptr<channel_interface>> {
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }

    switch (config.kind) {
        case channel_kind::clipboard: {
            auto channel = clipboard_channel::create();
            if (!channel) {
                return unexpected(channel.error());
            }
            return std::unique_ptr<channel_interface>(std::move(channel.value()));
        }
        case channel_kind::file:
            return std::unique_ptr<channel_interface>(
                std::make_unique<file_channel>(config.file_path));
        case channel_kind::memory:
            return std::unique_ptr<channel_interface>(std::make_unique<memory_channel>());
    }

    return unexpected(error{error_code::invalid_configuration, "unknown channel kind"});
}

}  // namespace clipxfer
