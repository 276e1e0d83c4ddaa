#ifndef MBEAN_CALL_TARGET_HPP
#define MBEAN_CALL_TARGET_HPP

/// \file

#include "mbean/managed_caller.hpp"
#include "mbean/registry_connection.hpp"

namespace mbean
{
    /// Forwards calls to the object registered under a name on a live registry connection.
    ///
    /// The object is not validated. The connection must outlive the call target.
    ///
    /// \since 0.1.0
    class call_target : public managed_caller
    {
    public:
        call_target(registry_connection& _conn, object_name _name, const interface_descriptor& _interface);

        /// Errors raised by the registry propagate unchanged.
        auto call(const std::string_view _operation, const nlohmann::json& _arguments) const
            -> nlohmann::json override;

        auto managed_interface() const noexcept -> const interface_descriptor& override { return *interface_; }

        auto name() const noexcept -> const object_name& override { return name_; }

    private:
        registry_connection* conn_;
        object_name name_;
        const interface_descriptor* interface_;
    }; // class call_target
} // namespace mbean

#endif // MBEAN_CALL_TARGET_HPP
