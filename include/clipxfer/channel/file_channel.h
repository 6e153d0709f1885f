/**
 * @file file_channel.h
 * @brief Shared channel backed by a single file
 */

#ifndef CLIPXFER_CHANNEL_FILE_CHANNEL_H
#define CLIPXFER_CHANNEL_FILE_CHANNEL_H

#include <clipxfer/channel/channel_interface.h>

#include <filesystem>

namespace clipxfer {

/**
 * @brief Uses one file on a shared filesystem as the slot
 *
 * Writes go to a sibling temporary file that is then renamed over the
 * slot, so a reader never observes a half-written value. A missing file
 * reads as an empty slot.
 */
class file_channel : public channel_interface {
public:
    explicit file_channel(std::filesystem::path path);

    [[nodiscard]] auto type() const -> std::string_view override { return "file"; }

    [[nodiscard]] auto read() -> result<std::string> override;

    [[nodiscard]] auto write(std::string_view text) -> result<void> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CHANNEL_FILE_CHANNEL_H
