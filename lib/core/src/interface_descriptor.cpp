#include "mbean/interface_descriptor.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace
{
    constexpr std::string_view mxbean_suffix = "MXBean";

    auto is_identifier(const std::string_view _s) noexcept -> bool
    {
        if (_s.empty()) {
            return false;
        }

        const auto is_start = [](unsigned char _c) { return std::isalpha(_c) || _c == '_' || _c == '$'; };
        const auto is_part = [&is_start](unsigned char _c) { return is_start(_c) || std::isdigit(_c); };

        return is_start(_s.front()) && std::all_of(std::next(std::begin(_s)), std::end(_s), is_part);
    } // is_identifier
} // anonymous namespace

namespace mbean
{
    interface_descriptor::interface_descriptor(std::string _qualified_name,
                                               std::vector<operation_descriptor> _operations,
                                               mxbean_annotation _annotation)
        : qualified_name_{std::move(_qualified_name)}
        , operations_{std::move(_operations)}
        , annotation_{_annotation}
    {
    } // ctor

    auto interface_descriptor::package_name() const -> std::string
    {
        if (const auto pos = qualified_name_.rfind('.'); pos != std::string::npos) {
            return qualified_name_.substr(0, pos);
        }

        return {};
    } // package_name

    auto interface_descriptor::simple_name() const -> std::string
    {
        if (const auto pos = qualified_name_.rfind('.'); pos != std::string::npos) {
            return qualified_name_.substr(pos + 1);
        }

        return qualified_name_;
    } // simple_name

    auto interface_descriptor::find_operation(const std::string_view _name) const noexcept
        -> const operation_descriptor*
    {
        const auto iter = std::find_if(std::begin(operations_), std::end(operations_), [_name](const auto& _op) {
            return _op.name == _name;
        });

        return iter != std::end(operations_) ? &*iter : nullptr;
    } // find_operation

    auto is_managed_interface(const interface_descriptor& _interface) noexcept -> bool
    {
        const auto& qname = _interface.qualified_name();
        const auto pos = qname.rfind('.');
        const auto simple_name = std::string_view{qname}.substr(pos == std::string::npos ? 0 : pos + 1);

        if (!is_identifier(simple_name)) {
            return false;
        }

        switch (_interface.annotation()) {
            case mxbean_annotation::enabled:
                return true;

            case mxbean_annotation::disabled:
                return false;

            case mxbean_annotation::none:
                break;
        }

        return boost::algorithm::ends_with(simple_name, mxbean_suffix);
    } // is_managed_interface
} // namespace mbean
