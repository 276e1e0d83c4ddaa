#ifndef MBEAN_REGISTRY_CONNECTION_HPP
#define MBEAN_REGISTRY_CONNECTION_HPP

/// \file

#include "mbean/managed_object.hpp"
#include "mbean/object_name.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <tuple>

namespace mbean
{
    /// The type and name of a registered managed object.
    struct object_instance
    {
        std::string type_name;
        object_name name;
    }; // struct object_instance

    inline auto operator==(const object_instance& _lhs, const object_instance& _rhs) -> bool
    {
        return _lhs.type_name == _rhs.type_name && _lhs.name == _rhs.name;
    }

    inline auto operator<(const object_instance& _lhs, const object_instance& _rhs) -> bool
    {
        return std::forward_as_tuple(_lhs.type_name, _lhs.name.canonical_name()) <
               std::forward_as_tuple(_rhs.type_name, _rhs.name.canonical_name());
    }

    /// The operations a registry answers, whether it lives in this process or is
    /// reached through a connector.
    ///
    /// Every member may throw mbean::exception. Implementations reached over a
    /// transport report transport failures as TRANSPORT_ERROR.
    ///
    /// \since 0.1.0
    class registry_connection
    {
    public:
        virtual ~registry_connection() = default;

        virtual auto is_registered(const object_name& _name) -> bool = 0;

        /// \throws mbean::exception INSTANCE_NOT_FOUND if \p _name is not registered.
        virtual auto is_instance_of(const object_name& _name, const std::string_view _interface_name) -> bool = 0;

        /// \throws mbean::exception INSTANCE_ALREADY_EXISTS if \p _name is already registered.
        virtual auto register_object(std::shared_ptr<managed_object> _object, const object_name& _name)
            -> object_instance = 0;

        /// \throws mbean::exception INSTANCE_NOT_FOUND if \p _name is not registered.
        virtual auto unregister_object(const object_name& _name) -> void = 0;

        virtual auto query_all() -> std::set<object_instance> = 0;

        /// Invokes \p _operation on the object registered under \p _name.
        ///
        /// \throws mbean::exception INSTANCE_NOT_FOUND if \p _name is not registered.
        virtual auto invoke(const object_name& _name, const std::string_view _operation, const nlohmann::json& _arguments)
            -> nlohmann::json = 0;
    }; // class registry_connection
} // namespace mbean

#endif // MBEAN_REGISTRY_CONNECTION_HPP
