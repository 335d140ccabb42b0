#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <system_error>

namespace federator::utils
{

FileSink::FileSink(const std::string &path) : m_path(path)
{
    const auto parent = m_path.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            throw std::system_error(ec, fmt::format("cannot create log directory '{}'",
                                                    parent.string()));
        }
    }
    m_file = std::fopen(m_path.string().c_str(), "a");
    if (m_file == nullptr)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("cannot open log file '{}'", m_path.string()));
    }
}

FileSink::~FileSink()
{
    if (m_file != nullptr)
    {
        std::fclose(m_file);
    }
}

void FileSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    const auto line = format_logmsg(msg, mode);
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("write to '{}' failed", m_path.string()));
    }
}

void FileSink::flush()
{
    std::fflush(m_file);
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace federator::utils
