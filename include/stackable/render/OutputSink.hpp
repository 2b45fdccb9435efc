#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace STK::Render {

// Destination of rewritten document bytes. write() returning false ends the
// render with RewriteFailed.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual auto write(std::string_view bytes) -> bool = 0;
};

class StringSink final : public OutputSink {
public:
    auto write(std::string_view bytes) -> bool override {
        buffer_.append(bytes);
        ++writes_;
        return true;
    }

    [[nodiscard]] auto str() const -> std::string const& { return buffer_; }
    [[nodiscard]] auto take() -> std::string { return std::exchange(buffer_, {}); }
    [[nodiscard]] auto writes() const -> std::size_t { return writes_; }

private:
    std::string buffer_;
    std::size_t writes_{0};
};

} // namespace STK::Render
