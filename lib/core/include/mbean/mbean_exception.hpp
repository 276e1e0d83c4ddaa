#ifndef MBEAN_EXCEPTION_HPP
#define MBEAN_EXCEPTION_HPP

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace mbean
{
    class exception : public std::exception
    {
    public:
        exception(const std::int64_t _code,
                  const std::string& _message,
                  const std::string& _file_name,
                  const std::uint32_t _line_number,
                  const std::string& _function_name,
                  std::exception_ptr _cause = nullptr);

        exception(const exception&) = default;
        auto operator=(const exception&) -> exception& = default;

        ~exception() override = default;

        // This is used internally and by the logger.
        auto what() const noexcept -> const char* override;

        // This should be used when reporting to an end user, instead of what().
        auto client_display_what() const noexcept -> const char*;

        // accessors
        auto code() const noexcept -> std::int64_t { return code_; }
        auto message_stack() const -> const std::vector<std::string>& { return message_stack_; }
        auto file_name() const -> const std::string& { return file_name_; }
        auto line_number() const noexcept -> std::uint32_t { return line_number_; }
        auto function_name() const -> const std::string& { return function_name_; }

        /// The exception this one wraps, or null.
        auto cause() const noexcept -> std::exception_ptr { return cause_; }

        // mutators
        auto add_message(const std::string& _m) -> void { message_stack_.push_back(_m); }

    private:
        // Assemble the what_ string depending on what kind of what() was called...
        auto assemble_full_display_what() const noexcept -> void;
        auto assemble_client_display_what() const noexcept -> void;

        std::int64_t code_;
        std::vector<std::string> message_stack_;
        std::uint32_t line_number_;
        std::string function_name_;
        std::string file_name_;
        std::exception_ptr cause_;
        mutable std::string what_;
    }; // class exception

    /// Returns the what() text of the exception held by \p _ptr, or an empty string.
    auto describe(const std::exception_ptr& _ptr) -> std::string;
} // namespace mbean

#define MBEAN_THROW(_code, _msg) \
    (throw mbean::exception((_code), (_msg), __FILE__, __LINE__, __PRETTY_FUNCTION__))

// Must only be used inside a catch block. The exception being handled becomes the cause.
#define MBEAN_THROW_NESTED(_code, _msg) \
    (throw mbean::exception((_code), (_msg), __FILE__, __LINE__, __PRETTY_FUNCTION__, std::current_exception()))

#define MBEAN_RETHROW(_msg, _excp) \
    _excp.add_message(_msg);      \
    throw _excp;

#endif // MBEAN_EXCEPTION_HPP
