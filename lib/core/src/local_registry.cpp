#include "mbean/local_registry.hpp"

#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"
#include "mbean/mbean_logger.hpp"

#include <fmt/format.h>

#include <iterator>
#include <mutex>
#include <utility>

namespace mbean
{
    auto local_registry::is_registered(const object_name& _name) -> bool
    {
        std::shared_lock lock{mutex_};
        return objects_.find(_name) != std::end(objects_);
    } // is_registered

    auto local_registry::is_instance_of(const object_name& _name, const std::string_view _interface_name) -> bool
    {
        return find(_name)->is_instance_of(_interface_name);
    } // is_instance_of

    auto local_registry::register_object(std::shared_ptr<managed_object> _object, const object_name& _name)
        -> object_instance
    {
        if (!_object) {
            MBEAN_THROW(INVALID_ARGUMENT, fmt::format("Cannot register a null managed object as [{}].", _name.str()));
        }

        auto type_name = _object->type_name();

        {
            std::lock_guard lock{mutex_};

            if (!objects_.try_emplace(_name, std::move(_object)).second) {
                MBEAN_THROW(INSTANCE_ALREADY_EXISTS,
                            fmt::format("A managed object is already registered as [{}].", _name.canonical_name()));
            }
        }

        log::registry::debug({{"log_message", "Registered managed object."},
                              {"object_name", _name.canonical_name()},
                              {"type", type_name}});

        return {std::move(type_name), _name};
    } // register_object

    auto local_registry::unregister_object(const object_name& _name) -> void
    {
        {
            std::lock_guard lock{mutex_};

            if (objects_.erase(_name) == 0) {
                MBEAN_THROW(INSTANCE_NOT_FOUND,
                            fmt::format("No managed object is registered as [{}].", _name.canonical_name()));
            }
        }

        log::registry::debug("Unregistered managed object [{}].", _name.canonical_name());
    } // unregister_object

    auto local_registry::query_all() -> std::set<object_instance>
    {
        std::set<object_instance> instances;

        std::shared_lock lock{mutex_};

        for (auto&& [name, object] : objects_) {
            instances.insert({object->type_name(), name});
        }

        return instances;
    } // query_all

    auto local_registry::invoke(const object_name& _name,
                                const std::string_view _operation,
                                const nlohmann::json& _arguments) -> nlohmann::json
    {
        // The object is kept alive by the copy even if it is unregistered during the call.
        return find(_name)->invoke(_operation, _arguments);
    } // invoke

    auto local_registry::find(const object_name& _name) const -> std::shared_ptr<managed_object>
    {
        std::shared_lock lock{mutex_};

        if (const auto iter = objects_.find(_name); iter != std::end(objects_)) {
            return iter->second;
        }

        MBEAN_THROW(INSTANCE_NOT_FOUND, fmt::format("No managed object is registered as [{}].", _name.canonical_name()));
    } // find

    auto platform_registry() -> local_registry&
    {
        static local_registry registry;
        return registry;
    } // platform_registry
} // namespace mbean
