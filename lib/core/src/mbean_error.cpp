#include "mbean/mbean_error.hpp"

#define MAKE_MBEAN_ERROR_MAP
#include "mbean/mbean_error_table.h"

#include <fmt/format.h>

#include <cstdlib>

namespace
{
    // Used to compute the value of an errno value embedded in an mbean error code.
    constexpr auto errno_divisor = 1000;
} // anonymous namespace

namespace mbean
{
    auto get_mbean_error_code(int _ec) noexcept -> int
    {
        return _ec / errno_divisor * errno_divisor;
    } // get_mbean_error_code

    auto get_errno(int _ec) noexcept -> int
    {
        return std::abs(_ec) - std::abs(get_mbean_error_code(_ec));
    } // get_errno

    auto error_name(int _ec) -> std::string
    {
        const auto ec = get_mbean_error_code(_ec);
        const auto embedded_errno_value = get_errno(_ec);

        using mbean_error_map_construction::mbean_error_map;

        if (const auto iter = mbean_error_map.find(ec); iter != std::end(mbean_error_map)) {
            if (embedded_errno_value != 0) {
                return fmt::format("{} [errno={}]", iter->second, embedded_errno_value);
            }

            return iter->second;
        }

        return fmt::format("Unknown error {}", _ec);
    } // error_name
} // namespace mbean
