/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Exceptions raised for API misuse in verity

**************************************************/

#ifndef VERITY_ERROR_EXCEPTION_HPP
#define VERITY_ERROR_EXCEPTION_HPP

#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#define VERITY_FILE_NAME __FILE__
#define VERITY_FILE_LINE __LINE__
#define VERITY_FUNC_NAME __func__

namespace verity::error {

/**
 * @brief Base exception carrying the throw site and a formatted message.
 *
 * The message is built with std::format, so callers may pass a format
 * string followed by its arguments.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              std::string_view format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        if constexpr (sizeof...(Args) == 0) {
            message_ = std::string(format);
        } else {
            message_ = std::vformat(format, std::make_format_args(args...));
        }
    }

    auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_ARGUMENT(...)                          \
    throw verity::error::InvalidArgument(                    \
        VERITY_FILE_NAME, VERITY_FILE_LINE, VERITY_FUNC_NAME, \
        __VA_ARGS__)

}  // namespace verity::error

#endif  // VERITY_ERROR_EXCEPTION_HPP
