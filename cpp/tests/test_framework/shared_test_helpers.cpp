// tests/test_framework/shared_test_helpers.cpp
#include "shared_test_helpers.h"

#include <fstream>
#include <sstream>

namespace federator::tests::helper
{

bool read_file_contents(const std::string &path, std::string &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

size_t count_lines(std::string_view text, std::optional<std::string_view> must_include,
                   std::optional<std::string_view> must_exclude)
{
    size_t count = 0;
    size_t start = 0;
    while (start < text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();
        const std::string_view line = text.substr(start, end - start);
        const bool included = !must_include || line.find(*must_include) != std::string_view::npos;
        const bool excluded = must_exclude && line.find(*must_exclude) != std::string_view::npos;
        if (!line.empty() && included && !excluded)
            ++count;
        start = end + 1;
    }
    return count;
}

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string contents;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (read_file_contents(path.string(), contents) &&
            contents.find(expected) != std::string::npos)
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

ScratchDir::ScratchDir(std::string_view tag)
{
    static std::atomic<int> counter{0};
    path_ = fs::temp_directory_path() /
            fmt::format("fed_test_{}_{}_{}_{}", tag, platform::get_pid(), counter++,
                        platform::monotonic_time_ns());
    fs::create_directories(path_);
}

ScratchDir::~ScratchDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_file(const fs::path &path, std::string_view contents)
{
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

} // namespace federator::tests::helper
