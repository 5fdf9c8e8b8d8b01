/// @file key.cpp
/// @brief Key equality, hashing and global key lookups

#include <arbor/widgets/key.hpp>

#include <arbor/widgets/build_owner.hpp>
#include <arbor/widgets/component_element.hpp>
#include <arbor/widgets/element.hpp>

#include <cstdint>
#include <cstdio>

namespace arbor_widgets {

namespace {

/// Short hex tag derived from an address, e.g. "#3fa2c"
std::string short_hash(const void* ptr) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "#%05zx",
                  static_cast<std::size_t>(reinterpret_cast<std::uintptr_t>(ptr)) & 0xFFFFFu);
    return buffer;
}

} // anonymous namespace

bool keys_equal(const KeyPtr& a, const KeyPtr& b) {
    if (a == b) {
        return true;
    }
    if (!a || !b) {
        return false;
    }
    return a->equals(*b);
}

// =============================================================================
// UniqueKey
// =============================================================================

std::size_t UniqueKey::hash() const {
    return std::hash<const void*>{}(this);
}

std::string UniqueKey::to_string() const {
    return "[" + short_hash(this) + "]";
}

// =============================================================================
// ObjectKey
// =============================================================================

bool ObjectKey::equals(const Key& other) const {
    auto* o = dynamic_cast<const ObjectKey*>(&other);
    return o != nullptr && o->m_object.get() == m_object.get();
}

std::size_t ObjectKey::hash() const {
    return std::hash<const void*>{}(m_object.get()) ^ typeid(ObjectKey).hash_code();
}

std::string ObjectKey::to_string() const {
    return "[ObjectKey " + short_hash(m_object.get()) + "]";
}

// =============================================================================
// GlobalKey
// =============================================================================

Element* GlobalKey::current_element(const BuildOwner& owner) const {
    return owner.global_keys().current_element(*this);
}

const Widget* GlobalKey::current_widget(const BuildOwner& owner) const {
    Element* element = current_element(owner);
    return element ? element->widget().get() : nullptr;
}

State* GlobalKey::current_state_base(const BuildOwner& owner) const {
    auto* element = dynamic_cast<StatefulElement*>(current_element(owner));
    return element ? element->state() : nullptr;
}

std::size_t LabeledGlobalKey::hash() const {
    return std::hash<const void*>{}(this);
}

std::string LabeledGlobalKey::to_string() const {
    if (m_label.empty()) {
        return "[GlobalKey " + short_hash(this) + "]";
    }
    return "[GlobalKey " + short_hash(this) + " " + m_label + "]";
}

bool GlobalObjectKey::equals(const Key& other) const {
    if (typeid(other) != typeid(*this)) {
        return false;
    }
    return static_cast<const GlobalObjectKey&>(other).m_object.get() == m_object.get();
}

std::size_t GlobalObjectKey::hash() const {
    return std::hash<const void*>{}(m_object.get()) ^ typeid(GlobalObjectKey).hash_code();
}

std::string GlobalObjectKey::to_string() const {
    return "[GlobalObjectKey " + short_hash(m_object.get()) + "]";
}

} // namespace arbor_widgets
