// tests/test_framework/shared_test_helpers.h
#pragma once
/**
 * @file shared_test_helpers.h
 * @brief Helpers shared by the federator test executables.
 */
#include "fed_service.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace federator::tests::helper
{
namespace fs = std::filesystem;

/**
 * @brief Reads the entire contents of a file into @p out.
 * @return false if the file could not be opened.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts lines of @p text, optionally only those containing @p must_include
 *        and not containing @p must_exclude.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls @p path until it contains @p expected or @p timeout passes.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/**
 * @class ScratchDir
 * @brief A fresh directory under the system temp path, removed on destruction.
 */
class ScratchDir
{
  public:
    explicit ScratchDir(std::string_view tag);
    ~ScratchDir();

    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    const fs::path &path() const { return path_; }
    fs::path operator/(const fs::path &rel) const { return path_ / rel; }

  private:
    fs::path path_;
};

/// Writes @p contents to @p path, creating parent directories.
void write_file(const fs::path &path, std::string_view contents);

/**
 * @brief Runs N threads that start together on a spin barrier.
 *
 * Exceptions thrown by a thread are captured; race() returns false if any thread
 * threw.
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    template <typename F> bool race(F fn)
    {
        exceptions_.clear();
        exceptions_.resize(static_cast<size_t>(n_threads_));

        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));

        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (...)
                    {
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();
        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::all_of(exceptions_.begin(), exceptions_.end(),
                           [](const std::exception_ptr &p) { return p == nullptr; });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

/**
 * @brief Runs worker test logic inside a LifecycleGuard holding @p mods.
 *
 * throw_on_failure turns ASSERT_* and EXPECT_* failures into exceptions so they
 * reach the exit code. Failures are reported on stderr with a "[WORKER FAILURE]"
 * marker that expect_worker_ok() looks for.
 *
 * @return 0 on success, 1 on a GTest assertion failure, 2 on a std::exception,
 *         3 on anything else.
 */
template <typename Fn, typename... Mods>
int run_gtest_worker(Fn test_logic, const char *test_name, Mods &&...mods)
{
    GTEST_FLAG_SET(throw_on_failure, true);

    federator::utils::LifecycleGuard guard(
        federator::utils::MakeModDefList(std::forward<Mods>(mods)...));

    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] GTest assertion failed in {}:\n{}\n", test_name,
                   e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] {} threw an exception: {}\n", test_name, e.what());
        return 2;
    }
    catch (...)
    {
        fmt::print(stderr, "[WORKER FAILURE] {} threw an unknown exception.\n", test_name);
        return 3;
    }
    return 0;
}

/**
 * @brief Same as run_gtest_worker() but with no lifecycle; the logic drives
 *        LifecycleGuard or InitializeApp/FinalizeApp itself.
 */
template <typename Fn> int run_worker_bare(Fn test_logic, const char *test_name)
{
    GTEST_FLAG_SET(throw_on_failure, true);

    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] GTest assertion failed in {}:\n{}\n", test_name,
                   e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] {} threw an exception: {}\n", test_name, e.what());
        return 2;
    }
    catch (...)
    {
        fmt::print(stderr, "[WORKER FAILURE] {} threw an unknown exception.\n", test_name);
        return 3;
    }
    return 0;
}

} // namespace federator::tests::helper
