#ifndef MBEAN_IMPLEMENTATION_REGISTRY_HPP
#define MBEAN_IMPLEMENTATION_REGISTRY_HPP

/// \file

#include "mbean/interface_descriptor.hpp"
#include "mbean/managed_object.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mbean
{
    /// Maps managed interfaces onto the factories that create their implementations.
    ///
    /// The registry is populated explicitly, usually at startup through
    /// \ref implementation_registration. Registering a managed object by interface
    /// requires exactly one factory for that interface.
    ///
    /// \since 0.1.0
    class implementation_registry
    {
    public:
        using factory_type = std::function<std::shared_ptr<managed_object>()>;

        static auto instance() -> implementation_registry&;

        implementation_registry(const implementation_registry&) = delete;
        auto operator=(const implementation_registry&) -> implementation_registry& = delete;

        auto add(const interface_descriptor& _interface, factory_type _factory) -> void;

        /// Removes every factory registered for \p _interface.
        auto remove_all(const interface_descriptor& _interface) -> void;

        auto count(const interface_descriptor& _interface) const -> std::size_t;

        /// Creates the single implementation of \p _interface.
        ///
        /// \throws mbean::exception INVALID_ARGUMENT if zero or several factories are
        ///                          registered, or the factory returned null.
        auto create(const interface_descriptor& _interface) const -> std::shared_ptr<managed_object>;

    private:
        implementation_registry() = default;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::vector<factory_type>> factories_;
    }; // class implementation_registry

    /// Registers \p T as an implementation of \p _interface on construction.
    ///
    /// \p T must be default constructible.
    ///
    /// \code{.cpp}
    /// const mbean::implementation_registration<thing> thing_registration{thing_interface};
    /// \endcode
    ///
    /// \since 0.1.0
    template <typename T>
    class implementation_registration
    {
    public:
        explicit implementation_registration(const interface_descriptor& _interface)
        {
            implementation_registry::instance().add(_interface, [] { return std::make_shared<T>(); });
        }
    }; // class implementation_registration
} // namespace mbean

#endif // MBEAN_IMPLEMENTATION_REGISTRY_HPP
