/**
 * @file clipboard_channel.h
 * @brief Desktop clipboard as the shared channel
 */

#ifndef CLIPXFER_CHANNEL_CLIPBOARD_CHANNEL_H
#define CLIPXFER_CHANNEL_CLIPBOARD_CHANNEL_H

#include <clipxfer/channel/channel_interface.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clipxfer {

/**
 * @brief Command line clipboard tool
 */
struct clipboard_tool {
    std::string name;
    std::string copy_command;   ///< Reads the new value on stdin
    std::string paste_command;  ///< Prints the current value on stdout
};

/**
 * @brief Clipboard access through xclip, xsel or wl-clipboard
 *
 * @code
 * auto channel = clipboard_channel::create();
 * if (channel) {
 *     auto value = channel.value()->read();
 * }
 * @endcode
 */
class clipboard_channel : public channel_interface {
public:
    /**
     * @brief Tools tried in order of preference
     */
    [[nodiscard]] static auto known_tools() -> std::vector<clipboard_tool>;

    /**
     * @brief First known tool found on PATH
     */
    [[nodiscard]] static auto detect_tool() -> std::optional<clipboard_tool>;

    /**
     * @brief Create a channel over the first available tool
     * @return Channel, or channel_unavailable when no tool is installed
     */
    [[nodiscard]] static auto create() -> result<std::unique_ptr<clipboard_channel>>;

    explicit clipboard_channel(clipboard_tool tool);

    [[nodiscard]] auto type() const -> std::string_view override { return "clipboard"; }

    [[nodiscard]] auto read() -> result<std::string> override;

    [[nodiscard]] auto write(std::string_view text) -> result<void> override;

    [[nodiscard]] auto tool() const -> const clipboard_tool& { return tool_; }

private:
    clipboard_tool tool_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CHANNEL_CLIPBOARD_CHANNEL_H
