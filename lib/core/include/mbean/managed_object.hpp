#ifndef MBEAN_MANAGED_OBJECT_HPP
#define MBEAN_MANAGED_OBJECT_HPP

/// \file

#include "mbean/interface_descriptor.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mbean
{
    /// The server-side implementation of one or more managed interfaces.
    ///
    /// Arguments are passed as a JSON array. The result of an operation is an
    /// arbitrary JSON value (null for operations without a result).
    ///
    /// \since 0.1.0
    class managed_object
    {
    public:
        virtual ~managed_object() = default;

        /// Returns the interfaces implemented by this object.
        virtual auto interfaces() const -> std::vector<const interface_descriptor*> = 0;

        /// Invokes \p _operation with \p _arguments.
        ///
        /// \throws mbean::exception OPERATION_NOT_FOUND if the operation is unknown.
        virtual auto invoke(const std::string_view _operation, const nlohmann::json& _arguments)
            -> nlohmann::json = 0;

        /// Checks whether one of the implemented interfaces has the qualified name \p _interface_name.
        auto is_instance_of(const std::string_view _interface_name) const -> bool;

        /// Returns the qualified name of the first implemented interface.
        auto type_name() const -> std::string;
    }; // class managed_object

    /// A managed object that dispatches operations through a table of handlers.
    ///
    /// \since 0.1.0
    class basic_managed_object : public managed_object
    {
    public:
        using operation_handler = std::function<nlohmann::json(const nlohmann::json&)>;

        explicit basic_managed_object(const interface_descriptor& _interface);

        auto interfaces() const -> std::vector<const interface_descriptor*> override;

        auto invoke(const std::string_view _operation, const nlohmann::json& _arguments) -> nlohmann::json override;

        /// Installs \p _handler for \p _operation, replacing any existing handler.
        auto add_operation(const std::string& _operation, operation_handler _handler) -> void;

    private:
        const interface_descriptor* interface_;
        std::map<std::string, operation_handler, std::less<>> operations_;
    }; // class basic_managed_object
} // namespace mbean

#endif // MBEAN_MANAGED_OBJECT_HPP
