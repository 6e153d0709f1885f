/**
 * @file file_channel.cpp
 * @brief Implementation of file_channel
 */

#include <clipxfer/channel/file_channel.h>

#include <clipxfer/core/scoped_directory.h>

#include <fstream>
#include <sstream>

namespace clipxfer {

file_channel::file_channel(std::filesystem::path path) : path_(std::move(path)) {}

auto file_channel::read() -> result<std::string> {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::string{};
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::channel_read_error, "cannot open channel file: " + path_.string()});
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return unexpected(
            error{error_code::channel_read_error, "cannot read channel file: " + path_.string()});
    }
    return oss.str();
}

auto file_channel::write(std::string_view text) -> result<void> {
    auto temp_path = path_;
    temp_path += ".tmp_" + random_hex(8);

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected(error{error_code::channel_write_error,
                                    "cannot create " + temp_path.string()});
        }
        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!file) {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            return unexpected(error{error_code::channel_write_error,
                                    "cannot write " + temp_path.string()});
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return unexpected(error{error_code::channel_write_error,
                                "cannot replace channel file: " + ec.message()});
    }
    return {};
}

}  // namespace clipxfer
