#pragma once

/// @file key.hpp
/// @brief Identity keys controlling instance reuse during reconciliation
///
/// A key decides whether an existing element may be updated with a new widget.
/// Two widgets are compatible when they have the same runtime type and equal
/// keys (two absent keys are equal).
///
/// @code
/// auto a = std::make_shared<ValueKey<int>>(1);
/// auto b = std::make_shared<ValueKey<int>>(1);
/// keys_equal(a, b);  // true
///
/// auto g = make_global_key("editor");
/// Element* e = g->current_element(owner);
/// @endcode

#include "fwd.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <typeinfo>

namespace arbor_widgets {

// =============================================================================
// Key
// =============================================================================

/// Abstract identity token.
///
/// hash() must be consistent with equals().
class Key {
public:
    virtual ~Key() = default;

    Key(const Key&) = delete;
    Key& operator=(const Key&) = delete;

    [[nodiscard]] virtual bool equals(const Key& other) const = 0;
    [[nodiscard]] virtual std::size_t hash() const = 0;
    [[nodiscard]] virtual std::string to_string() const = 0;

    /// Global keys must be unique across the active tree
    [[nodiscard]] virtual bool is_global() const { return false; }

protected:
    Key() = default;
};

/// Key equality where two absent keys are equal
[[nodiscard]] bool keys_equal(const KeyPtr& a, const KeyPtr& b);

/// Hash functor for unordered containers keyed by KeyPtr
struct KeyHash {
    [[nodiscard]] std::size_t operator()(const KeyPtr& key) const {
        return key ? key->hash() : 0;
    }
};

/// Equality functor for unordered containers keyed by KeyPtr
struct KeyEqual {
    [[nodiscard]] bool operator()(const KeyPtr& a, const KeyPtr& b) const {
        return keys_equal(a, b);
    }
};

// =============================================================================
// Local Keys
// =============================================================================

/// Equal only to itself
class UniqueKey final : public Key {
public:
    UniqueKey() = default;

    [[nodiscard]] bool equals(const Key& other) const override { return this == &other; }
    [[nodiscard]] std::size_t hash() const override;
    [[nodiscard]] std::string to_string() const override;
};

namespace detail {

template<typename T>
concept Streamable = requires(std::ostream& os, const T& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

template<typename T>
std::string describe_value(const T& value) {
    if constexpr (std::is_convertible_v<const T&, std::string>) {
        return "'" + std::string(value) + "'";
    } else if constexpr (Streamable<T>) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return typeid(T).name();
    }
}

} // namespace detail

/// Equal when the wrapped values compare equal and the key types match
template<typename T>
class ValueKey : public Key {
public:
    explicit ValueKey(T value) : m_value(std::move(value)) {}

    [[nodiscard]] const T& value() const noexcept { return m_value; }

    [[nodiscard]] bool equals(const Key& other) const override {
        if (typeid(other) != typeid(*this)) {
            return false;
        }
        return static_cast<const ValueKey&>(other).m_value == m_value;
    }

    [[nodiscard]] std::size_t hash() const override {
        return std::hash<T>{}(m_value) ^ typeid(*this).hash_code();
    }

    [[nodiscard]] std::string to_string() const override {
        return "[" + detail::describe_value(m_value) + "]";
    }

private:
    T m_value;
};

/// Equal when both keys wrap the identical object
class ObjectKey final : public Key {
public:
    explicit ObjectKey(std::shared_ptr<const void> object) : m_object(std::move(object)) {}

    [[nodiscard]] const void* object() const noexcept { return m_object.get(); }

    [[nodiscard]] bool equals(const Key& other) const override;
    [[nodiscard]] std::size_t hash() const override;
    [[nodiscard]] std::string to_string() const override;

private:
    std::shared_ptr<const void> m_object;
};

// =============================================================================
// Global Keys
// =============================================================================

/// Key unique across the whole active tree.
///
/// The registry mapping a global key to its element is owned by a BuildOwner,
/// so lookups name the owner of the tree being queried.
class GlobalKey : public Key {
public:
    [[nodiscard]] bool is_global() const override { return true; }

    /// Element currently registered for this key, or nullptr
    [[nodiscard]] Element* current_element(const BuildOwner& owner) const;

    /// Widget of the registered element, or nullptr
    [[nodiscard]] const Widget* current_widget(const BuildOwner& owner) const;

    /// State of the registered element when it is stateful, or nullptr
    [[nodiscard]] State* current_state_base(const BuildOwner& owner) const;

    template<typename S>
    [[nodiscard]] S* current_state(const BuildOwner& owner) const {
        return dynamic_cast<S*>(current_state_base(owner));
    }

protected:
    GlobalKey() = default;
};

/// Global key with reference identity and a debug label
class LabeledGlobalKey final : public GlobalKey {
public:
    explicit LabeledGlobalKey(std::string label = {}) : m_label(std::move(label)) {}

    [[nodiscard]] const std::string& label() const noexcept { return m_label; }

    [[nodiscard]] bool equals(const Key& other) const override { return this == &other; }
    [[nodiscard]] std::size_t hash() const override;
    [[nodiscard]] std::string to_string() const override;

private:
    std::string m_label;
};

/// Global key equal to any other GlobalObjectKey wrapping the same object
class GlobalObjectKey final : public GlobalKey {
public:
    explicit GlobalObjectKey(std::shared_ptr<const void> object) : m_object(std::move(object)) {}

    [[nodiscard]] const void* object() const noexcept { return m_object.get(); }

    [[nodiscard]] bool equals(const Key& other) const override;
    [[nodiscard]] std::size_t hash() const override;
    [[nodiscard]] std::string to_string() const override;

private:
    std::shared_ptr<const void> m_object;
};

// =============================================================================
// Factories
// =============================================================================

[[nodiscard]] inline KeyPtr make_unique_key() {
    return std::make_shared<UniqueKey>();
}

template<typename T>
[[nodiscard]] KeyPtr make_value_key(T value) {
    return std::make_shared<ValueKey<T>>(std::move(value));
}

[[nodiscard]] inline KeyPtr make_value_key(const char* value) {
    return std::make_shared<ValueKey<std::string>>(value);
}

[[nodiscard]] inline std::shared_ptr<const LabeledGlobalKey> make_global_key(std::string label = {}) {
    return std::make_shared<LabeledGlobalKey>(std::move(label));
}

} // namespace arbor_widgets
