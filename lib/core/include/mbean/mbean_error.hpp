#ifndef MBEAN_ERROR_HPP
#define MBEAN_ERROR_HPP

/// \file

#include <string>

namespace mbean
{
    /// Returns the symbolic name of an error code declared in mbean_error_table.h.
    ///
    /// Errno values embedded in the last three digits of \p _ec are reported
    /// alongside the name (e.g. "TRANSPORT_ERROR [errno=111]").
    ///
    /// \param[in] _ec The error code.
    ///
    /// \return The name of the error, or "Unknown error <_ec>".
    auto error_name(int _ec) -> std::string;

    /// Clears the embedded errno value from \p _ec.
    auto get_mbean_error_code(int _ec) noexcept -> int;

    /// Returns the errno value embedded in \p _ec, or zero.
    auto get_errno(int _ec) noexcept -> int;
} // namespace mbean

#endif // MBEAN_ERROR_HPP
