#ifndef MBEAN_UNIT_TEST_UTILS_HPP
#define MBEAN_UNIT_TEST_UTILS_HPP

#include "mbean/connector.hpp"
#include "mbean/interface_descriptor.hpp"
#include "mbean/managed_object.hpp"
#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"
#include "mbean/registry_connection.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace unit_test_utils
{
    // clang-format off
    inline const mbean::interface_descriptor thing_interface{"org.example.Thing", {{"ping", 0}}};

    inline const mbean::interface_descriptor counter_interface{
        "org.example.CounterMXBean",
        {{"getCount", 0}, {"add", 1}, {"reset", 0}}
    };

    inline const mbean::interface_descriptor gauge_interface{"org.example.GaugeMXBean", {{"getValue", 0}}};
    // clang-format on

    class thing : public mbean::basic_managed_object
    {
    public:
        thing()
            : basic_managed_object{thing_interface}
        {
            add_operation("ping", [](const nlohmann::json&) { return "pong"; });
        }
    }; // class thing

    class counter : public mbean::basic_managed_object
    {
    public:
        counter()
            : basic_managed_object{counter_interface}
        {
            add_operation("getCount", [this](const nlohmann::json&) { return count_.load(); });
            add_operation("add", [this](const nlohmann::json& _args) { return count_ += _args.at(0).get<int>(); });
            add_operation("reset", [this](const nlohmann::json&) {
                count_ = 0;
                return nullptr;
            });
        }

    private:
        std::atomic<int> count_{0};
    }; // class counter

    // Returns the error code of the exception held by \p _ptr, or zero.
    inline auto cause_code(const std::exception_ptr& _ptr) -> std::int64_t
    {
        if (!_ptr) {
            return 0;
        }

        try {
            std::rethrow_exception(_ptr);
        }
        catch (const mbean::exception& e) {
            return e.code();
        }
        catch (const std::exception&) {
            return 0;
        }
    } // cause_code

    // A registry whose answers are controlled by the test.
    //
    // A non-zero error member causes the corresponding operation to throw an
    // mbean::exception carrying that code.
    class fake_registry : public mbean::registry_connection
    {
    public:
        auto is_registered(const mbean::object_name&) -> bool override
        {
            ++calls;
            maybe_throw(is_registered_error);
            return registered;
        }

        auto is_instance_of(const mbean::object_name&, const std::string_view) -> bool override
        {
            ++calls;
            maybe_throw(is_instance_of_error);
            return instance_of;
        }

        auto register_object(std::shared_ptr<mbean::managed_object> _object, const mbean::object_name& _name)
            -> mbean::object_instance override
        {
            ++calls;
            ++register_calls;
            maybe_throw(register_error);
            return {_object->type_name(), _name};
        }

        auto unregister_object(const mbean::object_name&) -> void override
        {
            ++calls;
            ++unregister_calls;
            maybe_throw(unregister_error);
        }

        auto query_all() -> std::set<mbean::object_instance> override
        {
            ++calls;
            return {};
        }

        auto invoke(const mbean::object_name&, const std::string_view _operation, const nlohmann::json& _arguments)
            -> nlohmann::json override
        {
            ++calls;

            const auto n = ++in_flight;
            update_max(max_in_flight, n);

            if (invoke_delay.count() > 0) {
                std::this_thread::sleep_for(invoke_delay);
            }

            --in_flight;

            maybe_throw(invoke_error);

            return {{"operation", std::string{_operation}}, {"arguments", _arguments}};
        }

        static auto update_max(std::atomic<int>& _max, int _value) noexcept -> void
        {
            auto current = _max.load();
            while (current < _value && !_max.compare_exchange_weak(current, _value)) {
            }
        }

        std::atomic<bool> registered{true};
        std::atomic<bool> instance_of{true};

        std::atomic<int> is_registered_error{0};
        std::atomic<int> is_instance_of_error{0};
        std::atomic<int> register_error{0};
        std::atomic<int> unregister_error{0};
        std::atomic<int> invoke_error{0};

        std::atomic<int> calls{0};
        std::atomic<int> register_calls{0};
        std::atomic<int> unregister_calls{0};
        std::atomic<int> in_flight{0};
        std::atomic<int> max_in_flight{0};

        std::chrono::milliseconds invoke_delay{0};

    private:
        static auto maybe_throw(const std::atomic<int>& _error) -> void
        {
            if (const int ec = _error.load(); ec != 0) {
                MBEAN_THROW(ec, "fake registry error");
            }
        }
    }; // class fake_registry

    // A connector provider that counts the sessions it opens and closes.
    class counting_connector_provider : public mbean::connector_provider
    {
    public:
        explicit counting_connector_provider(mbean::registry_connection& _registry)
            : registry_{_registry}
        {
        }

        auto connect(const mbean::service_url& _url, const mbean::credentials& _credentials)
            -> std::unique_ptr<mbean::connector> override
        {
            ++connects;

            {
                std::lock_guard lock{mutex_};
                last_url_ = _url.str();
                last_login_ = _credentials.login;
            }

            if (fail_connect) {
                MBEAN_THROW(TRANSPORT_ERROR, "connection refused");
            }

            fake_registry::update_max(max_open, ++open);

            return std::make_unique<session>(*this);
        }

        auto last_url() const -> std::string
        {
            std::lock_guard lock{mutex_};
            return last_url_;
        }

        auto last_login() const -> std::string
        {
            std::lock_guard lock{mutex_};
            return last_login_;
        }

        std::atomic<int> connects{0};
        std::atomic<int> closes{0};
        std::atomic<int> open{0};
        std::atomic<int> max_open{0};

        std::atomic<bool> fail_connect{false};
        std::atomic<bool> fail_close{false};

    private:
        class session : public mbean::connector
        {
        public:
            explicit session(counting_connector_provider& _provider)
                : provider_{_provider}
            {
            }

            auto connection() -> mbean::registry_connection& override { return provider_.registry_; }

            auto close() -> void override
            {
                ++provider_.closes;
                --provider_.open;

                if (provider_.fail_close) {
                    MBEAN_THROW(TRANSPORT_ERROR, "connection reset while closing");
                }
            }

        private:
            counting_connector_provider& provider_;
        }; // class session

        mbean::registry_connection& registry_;
        mutable std::mutex mutex_;
        std::string last_url_;
        std::string last_login_;
    }; // class counting_connector_provider
} // namespace unit_test_utils

#endif // MBEAN_UNIT_TEST_UTILS_HPP
