/**
 * @file receiver_session.cpp
 * @brief Implementation of receiver_session
 */

#include <clipxfer/receiver/receiver_session.h>

#include <clipxfer/codec/flat_json.h>
#include <clipxfer/core/file_partitioner.h>
#include <clipxfer/core/logging.h>
#include <clipxfer/core/scoped_directory.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace clipxfer {

// ============================================================================
// Manifest
// ============================================================================

namespace {

constexpr const char* manifest_name = "session.json";

auto join_counts(const std::vector<uint64_t>& counts) -> std::string {
    std::ostringstream oss;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        if (i > 0) oss << ',';
        oss << counts[i];
    }
    return oss.str();
}

/// Parses "n,n,n"; any empty or non-numeric item fails the whole list
auto split_counts(std::string_view text) -> std::optional<std::vector<uint64_t>> {
    std::vector<uint64_t> counts;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto item = text.substr(0, comma);
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), value);
        if (item.empty() || ec != std::errc{} || ptr != item.data() + item.size()) {
            return std::nullopt;
        }
        counts.push_back(value);
        text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);
    }
    return counts;
}

}  // namespace

// ============================================================================
// receiver_session
// ============================================================================

receiver_session::receiver_session(const packet& first, const session_options& options)
    : base_filename_(first.base_filename)
    , content_hash_(first.content_hash)
    , archive_type_(first.archive_type)
    , part_count_(first.effective_part_count())
    , options_(options)
    , directory_(options.work_root / first.content_hash)
    , sequence_counts_(first.effective_part_count(), 0)
    , part_bitmap_(first.effective_part_count(), false) {}

receiver_session::~receiver_session() = default;

auto receiver_session::open(const packet& first, const session_options& options)
    -> result<std::unique_ptr<receiver_session>> {
    std::unique_ptr<receiver_session> session(new receiver_session(first, options));

    std::error_code ec;
    if (options.resume && std::filesystem::exists(session->directory_, ec) &&
        session->load_manifest()) {
        session->resumed_ = true;
        for (uint32_t i = 1; i <= session->part_count_; ++i) {
            if (std::filesystem::exists(session->part_file(i), ec)) {
                session->part_bitmap_[i - 1] = true;
            }
        }
        CX_LOG_INFO(log_category::session,
                    "Resuming transfer of '" + session->base_filename_ + "' (" +
                        std::to_string(session->completed_parts()) + "/" +
                        std::to_string(session->part_count_) + " parts complete)");
        return session;
    }

    std::filesystem::remove_all(session->directory_, ec);
    std::filesystem::create_directories(session->directory_, ec);
    if (ec) {
        return unexpected(error{error_code::directory_not_writable,
                                "cannot create session directory " +
                                    session->directory_.string() + ": " + ec.message()});
    }
    if (auto saved = session->save_manifest(); !saved) {
        return unexpected(saved.error());
    }
    return session;
}

auto receiver_session::save_manifest() const -> result<void> {
    const auto manifest = flat_json::writer()
        .field("file", base_filename_)
        .field("sha256", content_hash_)
        .field("part_count", static_cast<uint64_t>(part_count_))
        .field("mode", to_string(options_.mode))
        .field("sequence_counts", join_counts(sequence_counts_))
        .str();

    auto target = directory_ / manifest_name;
    auto temp_path = target;
    temp_path += ".tmp_" + random_hex(8);
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create " + temp_path.string()});
        }
        file << manifest << '\n';
        if (!file) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot write " + temp_path.string()});
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return unexpected(error{error_code::file_write_error,
                                "cannot save session manifest: " + ec.message()});
    }
    return {};
}

auto receiver_session::load_manifest() -> bool {
    std::ifstream file(directory_ / manifest_name);
    std::string line;
    if (!file || !std::getline(file, line)) {
        return false;
    }

    auto parsed = flat_json::parse(line);
    if (!parsed) {
        CX_LOG_WARN(log_category::session, "Ignoring unreadable session manifest in " +
                                               directory_.string() + ": " +
                                               parsed.error().message);
        return false;
    }
    const auto& manifest = parsed.value();
    if (flat_json::find_string(manifest, "sha256") != content_hash_ ||
        flat_json::find_string(manifest, "file") != base_filename_ ||
        flat_json::find_uint(manifest, "part_count") != uint64_t{part_count_} ||
        flat_json::find_string(manifest, "mode") != std::string(to_string(options_.mode))) {
        return false;
    }

    auto counts = split_counts(flat_json::find_string(manifest, "sequence_counts").value_or(""));
    if (!counts || counts->size() != part_count_) {
        return false;
    }
    sequence_counts_ = std::move(*counts);
    return true;
}

auto receiver_session::part_file(uint32_t part_index) const -> std::filesystem::path {
    std::ostringstream name;
    name << "part_" << std::setw(3) << std::setfill('0') << part_index << ".bin";
    return directory_ / name.str();
}

auto receiver_session::sink_path(uint32_t part_index) const -> std::filesystem::path {
    std::ostringstream name;
    name << "part_" << std::setw(3) << std::setfill('0') << part_index;
    if (options_.mode == receive_mode::streaming) {
        name << ".stream";
    }
    return directory_ / name.str();
}

auto receiver_session::sink_for(uint32_t part_index) -> result<part_sink*> {
    auto it = sinks_.find(part_index);
    if (it != sinks_.end()) {
        return it->second.get();
    }

    const auto count = sequence_counts_[part_index - 1];
    std::unique_ptr<part_sink> sink;
    if (options_.mode == receive_mode::streaming) {
        auto opened = stream_sink::open(sink_path(part_index), count, resumed_);
        if (!opened) {
            return unexpected(opened.error());
        }
        sink = std::move(opened.value());
    } else {
        auto opened = chunk_store::open(sink_path(part_index), count);
        if (!opened) {
            return unexpected(opened.error());
        }
        sink = std::move(opened.value());
    }

    auto* raw = sink.get();
    sinks_.emplace(part_index, std::move(sink));
    return raw;
}

auto receiver_session::matches(const packet& p) const -> bool {
    return p.content_hash == content_hash_ && p.base_filename == base_filename_ &&
           p.effective_part_count() == part_count_;
}

auto receiver_session::accept(const packet& p) -> result<accept_result> {
    if (!matches(p)) {
        return unexpected(error{error_code::session_mismatch,
                                "packet belongs to another transfer"});
    }

    accept_result out;
    if (state_ != session_state::receiving) {
        // Transfer already past reception; nothing left to store
        out.status = store_status::duplicate;
        return out;
    }

    const auto part_index = p.effective_part_index();
    if (part_bitmap_[part_index - 1]) {
        out.status = store_status::duplicate;
    } else {
        auto& declared = sequence_counts_[part_index - 1];
        if (declared == 0) {
            declared = p.sequence_count;
            if (auto saved = save_manifest(); !saved) {
                declared = 0;
                return unexpected(saved.error());
            }
        } else if (declared != p.sequence_count) {
            return unexpected(error{error_code::session_mismatch,
                                    "part " + std::to_string(part_index) + " declared " +
                                        std::to_string(declared) + " chunks, packet says " +
                                        std::to_string(p.sequence_count)});
        }

        auto sink = sink_for(part_index);
        if (!sink) {
            return unexpected(sink.error());
        }

        auto status = sink.value()->accept(p.sequence_index, p.payload);
        if (!status) {
            return unexpected(status.error());
        }
        out.status = status.value();

        if (sink.value()->is_complete()) {
            if (auto completed = complete_part(part_index); !completed) {
                return unexpected(completed.error());
            }
            out.part_completed = true;
        }
    }

    if (all_parts_complete()) {
        state_ = session_state::reassembling_final;
        out.transfer_ready = true;
    }
    return out;
}

auto receiver_session::complete_part(uint32_t part_index) -> result<void> {
    state_ = session_state::reassembling_part;

    auto& sink = sinks_.at(part_index);
    auto bytes = sink->finalize(part_file(part_index));
    if (!bytes) {
        state_ = session_state::receiving;
        return unexpected(bytes.error());
    }

    part_bitmap_[part_index - 1] = true;
    sinks_.erase(part_index);
    state_ = session_state::receiving;

    CX_LOG_INFO(log_category::session,
                "Part " + std::to_string(part_index) + "/" + std::to_string(part_count_) +
                    " reassembled (" + std::to_string(bytes.value()) + " bytes)");
    return {};
}

auto receiver_session::all_parts_complete() const -> bool {
    return std::all_of(part_bitmap_.begin(), part_bitmap_.end(), [](bool done) { return done; });
}

auto receiver_session::completed_parts() const -> uint32_t {
    return static_cast<uint32_t>(std::count(part_bitmap_.begin(), part_bitmap_.end(), true));
}

auto receiver_session::is_part_complete(uint32_t part_index) const -> bool {
    if (part_index == 0 || part_index > part_count_) {
        return false;
    }
    return part_bitmap_[part_index - 1];
}

auto receiver_session::received_in_part(uint32_t part_index) const -> uint64_t {
    if (is_part_complete(part_index)) {
        return sequence_counts_[part_index - 1];
    }
    auto it = sinks_.find(part_index);
    return it == sinks_.end() ? 0 : it->second->received_count();
}

auto receiver_session::reassemble(const std::filesystem::path& destination) -> result<uint64_t> {
    if (state_ != session_state::reassembling_final) {
        return unexpected(error{error_code::missing_chunks,
                                "transfer is not complete (state: " +
                                    std::string(to_string(state_)) + ")"});
    }

    std::vector<std::filesystem::path> parts;
    parts.reserve(part_count_);
    for (uint32_t i = 1; i <= part_count_; ++i) {
        parts.push_back(part_file(i));
    }
    return file_partitioner::join(parts, destination);
}

void receiver_session::finish(bool verified) {
    state_ = verified ? session_state::verified : session_state::failed;
}

void receiver_session::discard() noexcept {
    sinks_.clear();
    std::error_code ec;
    std::filesystem::remove_all(directory_, ec);
}

}  // namespace clipxfer
