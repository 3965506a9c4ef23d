#include "logger.hpp"

LogStream::LogStream(std::ostream* output, std::mutex& mutex, bool enabled, std::string_view prefix)
    : output(output)
    , mutex(mutex)
    , enabled(enabled)
{
    mutex.lock();
    if (enabled)
    {
        buffer << "[" << prefix << "] ";
    }
}

LogStream::~LogStream()
{
    if (!moved && enabled && output)
    {
        *output << buffer.str() << std::endl;
    }
    if (!moved)
    {
        mutex.unlock();
    }
}

LogStream::LogStream(LogStream&& other) noexcept
    : output(other.output)
    , mutex(other.mutex)
    , buffer(std::move(other.buffer))
    , enabled(other.enabled)
    , moved(false)
{
    other.moved = true;
}


// Reader and Debug output are opt-in.
std::array<Logger::ChannelState, static_cast<size_t>(LogChannel::_Count)> Logger::channels = {{
    {true, &std::cerr},
    {true, &std::cerr},
    {false, &std::cerr},
    {false, &std::cerr},
}};
std::mutex Logger::mutex;

LogStream Logger::log(LogChannel channel)
{
    ChannelState state;
    {
        std::lock_guard<std::mutex> lock(mutex);
        state = channels[static_cast<size_t>(channel)];
    }
    return LogStream(state.output, mutex, state.enabled, channel_name(channel));
}

void Logger::enable(LogChannel channel)
{
    std::lock_guard<std::mutex> lock(mutex);
    channels[static_cast<size_t>(channel)].enabled = true;
}

void Logger::disable(LogChannel channel)
{
    std::lock_guard<std::mutex> lock(mutex);
    channels[static_cast<size_t>(channel)].enabled = false;
}

bool Logger::is_enabled(LogChannel channel)
{
    std::lock_guard<std::mutex> lock(mutex);
    return channels[static_cast<size_t>(channel)].enabled;
}

void Logger::set_output(LogChannel channel, std::ostream* output)
{
    std::lock_guard<std::mutex> lock(mutex);
    channels[static_cast<size_t>(channel)].output = output;
}

std::string_view Logger::channel_name(LogChannel channel)
{
    switch (channel)
    {
        case LogChannel::General: return "general";
        case LogChannel::Lexer:   return "lexer";
        case LogChannel::Reader:  return "reader";
        case LogChannel::Debug:   return "debug";
        case LogChannel::_Count:  break;
    }
    return "unknown";
}
