#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

namespace federator::utils
{

// Appends formatted log lines to a file. The file is opened in the constructor.
class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    std::FILE *m_file{nullptr};
};

} // namespace federator::utils
