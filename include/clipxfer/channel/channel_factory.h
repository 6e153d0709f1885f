/**
 * @file channel_factory.h
 * @brief Construction of channels from configuration
 */

#ifndef CLIPXFER_CHANNEL_CHANNEL_FACTORY_H
#define CLIPXFER_CHANNEL_CHANNEL_FACTORY_H

#include <clipxfer/channel/channel_interface.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace clipxfer {

/**
 * @brief Channel kinds
 */
enum class channel_kind {
    clipboard,  ///< Desktop clipboard
    file,       ///< Single file on a shared filesystem
    memory      ///< In-process slot (loopback, tests)
};

[[nodiscard]] constexpr auto to_string(channel_kind kind) -> const char* {
    switch (kind) {
        case channel_kind::clipboard: return "clipboard";
        case channel_kind::file: return "file";
        case channel_kind::memory: return "memory";
        default: return "unknown";
    }
}

/**
 * @brief Channel configuration
 */
struct channel_config {
    channel_kind kind = channel_kind::clipboard;
    std::filesystem::path file_path;  ///< Slot file for channel_kind::file

    [[nodiscard]] auto validate() const -> result<void> {
        if (kind == channel_kind::file && file_path.empty()) {
            return unexpected(error{error_code::invalid_configuration,
                                    "file channel requires a path"});
        }
        return {};
    }

    /**
     * @brief Parse "clipboard", "memory" or "file:<path>"
     */
    [[nodiscard]] static auto parse(std::string_view name) -> result<channel_config>;
};

/**
 * @brief Creates channels by kind
 */
class channel_factory {
public:
    [[nodiscard]] static auto create(const channel_config& config)
        -> result<std::unique_ptr<channel_interface>>;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CHANNEL_CHANNEL_FACTORY_H
