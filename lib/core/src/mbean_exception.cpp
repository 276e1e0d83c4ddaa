#include "mbean/mbean_exception.hpp"

#include "mbean/mbean_error.hpp"

#include <iterator>
#include <sstream>
#include <utility>

namespace mbean
{
    exception::exception(const std::int64_t _code,
                         const std::string& _message,
                         const std::string& _file_name,
                         const std::uint32_t _line_number,
                         const std::string& _function_name,
                         std::exception_ptr _cause)
        : std::exception()
        , code_{_code}
        , message_stack_{_message}
        , line_number_{_line_number}
        , function_name_{_function_name}
        , file_name_{_file_name}
        , cause_{std::move(_cause)}
    {
    } // ctor

    auto exception::what() const noexcept -> const char*
    {
        assemble_full_display_what();
        return what_.c_str();
    } // what

    auto exception::client_display_what() const noexcept -> const char*
    {
        assemble_client_display_what();
        return what_.c_str();
    } // client_display_what

    // Modifies the what_ string for a full what() message
    auto exception::assemble_full_display_what() const noexcept -> void
    {
        try {
            std::stringstream what_ss;

            what_ss << "mbean exception:"
                    << "\n    file: " << file_name_
                    << "\n    function: " << function_name_
                    << "\n    line: " << line_number_
                    << "\n    code: " << code_ << " (" << error_name(static_cast<int>(code_)) << ")"
                    << "\n    message:\n";

            for (auto&& entry : message_stack_) {
                what_ss << "        " << entry << "\n";
            }

            if (cause_) {
                what_ss << "caused by:\n" << describe(cause_);
            }

            what_ = what_ss.str();
        }
        catch (const std::exception&) {
            what_ = message_stack_.empty() ? std::string{} : message_stack_.front();
        }
    } // assemble_full_display_what

    // Modifies the what_ string for a client display message
    auto exception::assemble_client_display_what() const noexcept -> void
    {
        try {
            std::stringstream what_ss;

            // Display the messages in reverse order so that the most recent context is first.
            for (auto it = message_stack_.rbegin(); it != message_stack_.rend(); ++it) {
                what_ss << *it;

                if (std::next(it) != message_stack_.rend()) {
                    what_ss << "\n";
                }
            }

            what_ = what_ss.str();
        }
        catch (const std::exception&) {
            what_ = message_stack_.empty() ? std::string{} : message_stack_.front();
        }
    } // assemble_client_display_what

    auto describe(const std::exception_ptr& _ptr) -> std::string
    {
        if (!_ptr) {
            return {};
        }

        try {
            std::rethrow_exception(_ptr);
        }
        catch (const std::exception& e) {
            return e.what();
        }
        catch (...) {
            return "unknown exception";
        }
    } // describe
} // namespace mbean
