#ifndef TOOLHOST_INTERNAL_STDIO_FRAMER_HPP
#define TOOLHOST_INTERNAL_STDIO_FRAMER_HPP

#include <functional>
#include <optional>
#include <string>
#include <toolhost/types.hpp>
#include <vector>

namespace toolhost
{
namespace protocol
{

// Splits a byte stream into newline-delimited JSON values.
// Lines that are not JSON are dropped and reported to the diagnostic callback.
class StdioFramer
{
  public:
    using DiagnosticCallback = std::function<void(const std::string&)>;

    explicit StdioFramer(size_t max_buffer_size = 1024 * 1024);

    // Append a chunk and return every complete JSON value it finished.
    // Throws JSONDecodeError when an unterminated line exceeds the buffer limit;
    // the buffer is discarded so the stream can continue.
    std::vector<json> add_data(const std::string& data);

    // End of stream: parse whatever is left in the buffer
    std::vector<json> finish();

    void set_diagnostic_callback(DiagnosticCallback callback)
    {
        diagnostic_ = std::move(callback);
    }

    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    void clear_buffer()
    {
        buffer_.clear();
    }

    size_t dropped_lines() const
    {
        return dropped_lines_;
    }

  private:
    std::string buffer_;
    size_t max_buffer_size_;
    size_t dropped_lines_ = 0;
    DiagnosticCallback diagnostic_;

    std::optional<std::string> extract_line();
    void parse_line(std::string line, std::vector<json>& out);
};

} // namespace protocol
} // namespace toolhost

#endif // TOOLHOST_INTERNAL_STDIO_FRAMER_HPP
