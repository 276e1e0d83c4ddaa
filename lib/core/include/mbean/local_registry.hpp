#ifndef MBEAN_LOCAL_REGISTRY_HPP
#define MBEAN_LOCAL_REGISTRY_HPP

/// \file

#include "mbean/registry_connection.hpp"

#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace mbean
{
    /// An in-process registry of managed objects.
    ///
    /// All member functions are thread-safe. Operations are invoked without holding
    /// the registry's lock, so a managed object may call back into the registry.
    ///
    /// \since 0.1.0
    class local_registry : public registry_connection
    {
    public:
        local_registry() = default;

        local_registry(const local_registry&) = delete;
        auto operator=(const local_registry&) -> local_registry& = delete;

        auto is_registered(const object_name& _name) -> bool override;

        auto is_instance_of(const object_name& _name, const std::string_view _interface_name) -> bool override;

        /// \throws mbean::exception INVALID_ARGUMENT if \p _object is null.
        /// \throws mbean::exception INSTANCE_ALREADY_EXISTS
        auto register_object(std::shared_ptr<managed_object> _object, const object_name& _name)
            -> object_instance override;

        auto unregister_object(const object_name& _name) -> void override;

        auto query_all() -> std::set<object_instance> override;

        auto invoke(const object_name& _name, const std::string_view _operation, const nlohmann::json& _arguments)
            -> nlohmann::json override;

    private:
        auto find(const object_name& _name) const -> std::shared_ptr<managed_object>;

        mutable std::shared_mutex mutex_;
        std::unordered_map<object_name, std::shared_ptr<managed_object>> objects_;
    }; // class local_registry

    /// Returns the registry shared by everything in this process.
    ///
    /// \since 0.1.0
    auto platform_registry() -> local_registry&;
} // namespace mbean

#endif // MBEAN_LOCAL_REGISTRY_HPP
