#ifndef MBEAN_INTERFACE_DESCRIPTOR_HPP
#define MBEAN_INTERFACE_DESCRIPTOR_HPP

/// \file

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mbean
{
    /// Describes an operation declared by a managed interface.
    struct operation_descriptor
    {
        std::string name;
        std::size_t arity = 0;
    }; // struct operation_descriptor

    /// The state of the MXBean annotation on a managed interface.
    enum class mxbean_annotation
    {
        none,
        enabled,
        disabled
    }; // enum class mxbean_annotation

    /// Describes the contract of a managed object.
    ///
    /// Descriptors are supplied by the caller and are expected to outlive every
    /// object that refers to them. Defining them at namespace scope is the usual
    /// approach.
    ///
    /// \since 0.1.0
    class interface_descriptor
    {
    public:
        /// \param[in] _qualified_name The dot-separated name of the interface (e.g. "org.example.ThingMXBean").
        /// \param[in] _operations     The operations declared by the interface.
        /// \param[in] _annotation     The state of the MXBean annotation.
        interface_descriptor(std::string _qualified_name,
                             std::vector<operation_descriptor> _operations,
                             mxbean_annotation _annotation = mxbean_annotation::none);

        auto qualified_name() const noexcept -> const std::string& { return qualified_name_; }

        /// Returns everything before the last '.' of the qualified name, or an empty string.
        auto package_name() const -> std::string;

        /// Returns everything after the last '.' of the qualified name.
        auto simple_name() const -> std::string;

        auto operations() const noexcept -> const std::vector<operation_descriptor>& { return operations_; }

        /// Returns the operation named \p _name, or null if the interface does not declare it.
        auto find_operation(const std::string_view _name) const noexcept -> const operation_descriptor*;

        auto annotation() const noexcept -> mxbean_annotation { return annotation_; }

    private:
        std::string qualified_name_;
        std::vector<operation_descriptor> operations_;
        mxbean_annotation annotation_;
    }; // class interface_descriptor

    /// Checks whether \p _interface follows the managed interface convention.
    ///
    /// The simple name must be a valid identifier. The interface must either carry
    /// an enabled MXBean annotation, or carry no annotation and have a simple name
    /// ending in "MXBean".
    auto is_managed_interface(const interface_descriptor& _interface) noexcept -> bool;
} // namespace mbean

#endif // MBEAN_INTERFACE_DESCRIPTOR_HPP
