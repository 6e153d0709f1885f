/**
 * @file benchmark_helpers.cpp
 * @brief Test data generation for the benchmarks
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <random>
#include <string_view>

namespace clipxfer::benchmark {

auto random_bytes(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<unsigned int> byte_value(0, 255);

    std::vector<std::byte> data(size);
    std::generate(data.begin(), data.end(),
                  [&] { return static_cast<std::byte>(byte_value(gen)); });
    return data;
}

auto text_bytes(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    static constexpr std::array<std::string_view, 16> words{
        "the", "clipboard", "holds", "one", "packet", "at", "a", "time",
        "and", "every", "chunk", "waits", "for", "its", "acknowledgement", "here"};

    std::mt19937 gen(seed);
    std::uniform_int_distribution<std::size_t> pick(0, words.size() - 1);
    std::bernoulli_distribution line_break(0.08);

    std::string text;
    text.reserve(size + 16);
    while (text.size() < size) {
        text += words[pick(gen)];
        text += line_break(gen) ? '\n' : ' ';
    }
    text.resize(size);

    const auto* first = reinterpret_cast<const std::byte*>(text.data());
    return {first, first + text.size()};
}

auto make_workspace() -> result<scoped_directory> {
    return scoped_directory::create(std::filesystem::temp_directory_path(), "clipxfer_bench_");
}

auto write_file(const std::filesystem::path& path, std::span<const std::byte> data)
    -> result<void> {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) {
        return unexpected(error{error_code::file_write_error, "cannot write " + path.string()});
    }
    return {};
}

}  // namespace clipxfer::benchmark
