#include "mbean/managed_object.hpp"

#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace mbean
{
    auto managed_object::is_instance_of(const std::string_view _interface_name) const -> bool
    {
        const auto ifaces = interfaces();

        return std::any_of(std::begin(ifaces), std::end(ifaces), [_interface_name](const auto* _i) {
            return _i && _i->qualified_name() == _interface_name;
        });
    } // is_instance_of

    auto managed_object::type_name() const -> std::string
    {
        const auto ifaces = interfaces();

        if (ifaces.empty() || !ifaces.front()) {
            return {};
        }

        return ifaces.front()->qualified_name();
    } // type_name

    basic_managed_object::basic_managed_object(const interface_descriptor& _interface)
        : interface_{&_interface}
    {
    } // ctor

    auto basic_managed_object::interfaces() const -> std::vector<const interface_descriptor*>
    {
        return {interface_};
    } // interfaces

    auto basic_managed_object::invoke(const std::string_view _operation, const nlohmann::json& _arguments)
        -> nlohmann::json
    {
        const auto iter = operations_.find(_operation);

        if (iter == std::end(operations_)) {
            MBEAN_THROW(OPERATION_NOT_FOUND,
                        fmt::format("Operation [{}] is not implemented for interface [{}].",
                                    _operation,
                                    interface_->qualified_name()));
        }

        return iter->second(_arguments);
    } // invoke

    auto basic_managed_object::add_operation(const std::string& _operation, operation_handler _handler) -> void
    {
        operations_.insert_or_assign(_operation, std::move(_handler));
    } // add_operation
} // namespace mbean
