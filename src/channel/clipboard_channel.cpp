/**
 * @file clipboard_channel.cpp
 * @brief Implementation of clipboard_channel over command line tools
 */

#include <clipxfer/channel/clipboard_channel.h>

#include <clipxfer/core/logging.h>
#include <clipxfer/core/process.h>

#include <array>
#include <csignal>
#include <cstdio>
#include <ctime>

#include <pthread.h>

namespace clipxfer {

namespace {

struct pipe_closer {
    void operator()(FILE* f) const {
        if (f) pclose(f);
    }
};

/**
 * @brief Keeps SIGPIPE blocked on the calling thread for its lifetime
 *
 * A copy tool that exits without reading stdin then fails the write with
 * EPIPE. A SIGPIPE raised meanwhile is consumed before the mask is restored.
 */
class sigpipe_block {
public:
    sigpipe_block() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;
        pthread_sigmask(SIG_BLOCK, &pipe_set_, &previous_);
    }

    ~sigpipe_block() {
        if (!was_pending_ && sigismember(&previous_, SIGPIPE) != 1) {
            timespec zero{0, 0};
            while (sigtimedwait(&pipe_set_, nullptr, &zero) == SIGPIPE) {
            }
        }
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    sigpipe_block(const sigpipe_block&) = delete;
    sigpipe_block& operator=(const sigpipe_block&) = delete;

private:
    sigset_t pipe_set_{};
    sigset_t previous_{};
    bool was_pending_ = false;
};

/// The executable a command line starts with
auto command_executable(const std::string& command) -> std::string {
    return command.substr(0, command.find(' '));
}

}  // namespace

auto clipboard_channel::known_tools() -> std::vector<clipboard_tool> {
    return {
        {"xclip", "xclip -i -selection clipboard", "xclip -o -selection clipboard"},
        {"xsel", "xsel --input --clipboard", "xsel --output --clipboard"},
        {"wl-clipboard", "wl-copy", "wl-paste --no-newline"},
    };
}

auto clipboard_channel::detect_tool() -> std::optional<clipboard_tool> {
    for (auto& tool : known_tools()) {
        if (find_executable(command_executable(tool.copy_command)) &&
            find_executable(command_executable(tool.paste_command))) {
            return tool;
        }
    }
    return std::nullopt;
}

auto clipboard_channel::create() -> result<std::unique_ptr<clipboard_channel>> {
    auto tool = detect_tool();
    if (!tool) {
        return unexpected(error{error_code::channel_unavailable,
                                "no clipboard tool found (xclip, xsel, wl-clipboard)"});
    }
    CX_LOG_INFO(log_category::channel, "Clipboard handler initialized (using '" + tool->name + "')");
    return std::make_unique<clipboard_channel>(std::move(*tool));
}

clipboard_channel::clipboard_channel(clipboard_tool tool) : tool_(std::move(tool)) {}

auto clipboard_channel::read() -> result<std::string> {
    // An empty clipboard makes some tools exit non-zero; that still reads as empty
    auto command = tool_.paste_command + " 2>/dev/null";
    std::unique_ptr<FILE, pipe_closer> pipe(popen(command.c_str(), "r"));
    if (!pipe) {
        return unexpected(error{error_code::channel_read_error,
                                "cannot run '" + tool_.paste_command + "'"});
    }

    std::string value;
    std::array<char, 64 * 1024> buffer{};
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        value.append(buffer.data(), n);
    }
    if (std::ferror(pipe.get())) {
        return unexpected(error{error_code::channel_read_error, "error reading clipboard tool output"});
    }
    return value;
}

auto clipboard_channel::write(std::string_view text) -> result<void> {
    sigpipe_block blocked;
    FILE* raw = popen(tool_.copy_command.c_str(), "w");
    if (!raw) {
        return unexpected(error{error_code::channel_write_error,
                                "cannot run '" + tool_.copy_command + "'"});
    }

    auto written = std::fwrite(text.data(), 1, text.size(), raw);
    bool flushed = std::fflush(raw) == 0;
    int status = pclose(raw);
    if (written != text.size() || !flushed) {
        return unexpected(error{error_code::channel_write_error, "short write to clipboard tool"});
    }
    if (status != 0) {
        return unexpected(error{error_code::channel_write_error,
                                "'" + tool_.copy_command + "' exited with status " +
                                    std::to_string(status)});
    }
    return {};
}

}  // namespace clipxfer
