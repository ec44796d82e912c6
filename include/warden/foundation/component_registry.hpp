#pragma once

/// @file component_registry.hpp
/// @brief Named component registry used to wire configured backends.

#include <any>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>

#include "warden/foundation/security_result.hpp"

namespace warden::foundation {

/// Registry of shared components keyed by interface type and name.
///
/// Configuration refers to backends by name (`account_store: memory`,
/// `cache.backend: memory`); the registry resolves such a name to a live
/// instance of the requested interface.
///
/// Example:
/// @code
///   ComponentRegistry components;
///   components.add<IAccountStore>("memory", std::make_shared<InMemoryAccountStore>());
///
///   auto store = components.resolve<IAccountStore>("memory");
///   if (!store) { /* ConfigurationError: no such component */ }
/// @endcode
class ComponentRegistry {
public:
    ComponentRegistry() = default;

    /// Register @p component as the implementation of T named @p name.
    /// Replaces any previous registration under the same type and name.
    template <typename T>
    void add(std::string name, std::shared_ptr<T> component) {
        components_[Key{std::type_index(typeid(T)), std::move(name)}] =
            std::make_any<std::shared_ptr<T>>(std::move(component));
    }

    /// Registered component, or nullptr.
    template <typename T>
    [[nodiscard]] std::shared_ptr<T> get(std::string_view name) const {
        auto it = components_.find(Key{std::type_index(typeid(T)), std::string(name)});
        if (it == components_.end()) {
            return nullptr;
        }
        auto ptr = std::any_cast<std::shared_ptr<T>>(&it->second);
        return ptr ? *ptr : nullptr;
    }

    /// Registered component, or ConfigurationError naming the missing entry.
    template <typename T>
    SecurityResult<std::shared_ptr<T>> resolve(std::string_view name) const {
        auto component = get<T>(name);
        if (!component) {
            return SecurityResult<std::shared_ptr<T>>::err(
                ErrorCode::ConfigurationError,
                "no component registered under name '" + std::string(name) + "'");
        }
        return SecurityResult<std::shared_ptr<T>>::ok(std::move(component));
    }

    template <typename T>
    [[nodiscard]] bool has(std::string_view name) const {
        return components_.count(Key{std::type_index(typeid(T)), std::string(name)}) > 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return components_.size(); }

private:
    struct Key {
        std::type_index type;
        std::string name;

        bool operator<(const Key& other) const {
            if (type != other.type) {
                return type < other.type;
            }
            return name < other.name;
        }
    };

    std::map<Key, std::any> components_;
};

} // namespace warden::foundation
