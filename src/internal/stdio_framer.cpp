#include "stdio_framer.hpp"

#include <toolhost/errors.hpp>

namespace toolhost
{
namespace protocol
{

StdioFramer::StdioFramer(size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

std::vector<json> StdioFramer::add_data(const std::string& data)
{
    buffer_ += data;

    std::vector<json> values;
    while (auto line = extract_line())
        parse_line(std::move(*line), values);

    // Only the unterminated tail counts against the limit
    if (buffer_.size() > max_buffer_size_)
    {
        size_t size = buffer_.size();
        buffer_.clear();
        std::string message = "Buffer exceeded maximum size of " +
                              std::to_string(max_buffer_size_) + " bytes (was " +
                              std::to_string(size) + ")";

        // Values completed by this chunk are still delivered
        if (values.empty())
            throw JSONDecodeError(message);
        ++dropped_lines_;
        if (diagnostic_)
            diagnostic_(message);
    }

    return values;
}

std::vector<json> StdioFramer::finish()
{
    std::vector<json> values;
    if (!buffer_.empty())
    {
        std::string tail;
        tail.swap(buffer_);
        parse_line(std::move(tail), values);
    }
    return values;
}

std::optional<std::string> StdioFramer::extract_line()
{
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    return line;
}

void StdioFramer::parse_line(std::string line, std::vector<json>& out)
{
    if (line.find_first_not_of(" \t\r") == std::string::npos)
        return;

    try
    {
        out.push_back(json::parse(line));
    }
    catch (const json::parse_error&)
    {
        ++dropped_lines_;
        if (diagnostic_)
            diagnostic_(line);
    }
}

} // namespace protocol
} // namespace toolhost
