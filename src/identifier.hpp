#pragma once

#include "types.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace idmill {

// Hash shared by the C++ type and the C boundary
[[nodiscard]] inline std::size_t hashText(std::string_view text) { return std::hash<std::string_view>{}(text); }

// Immutable UTF-8 name of a domain entity. Kinds never compare with each other.
template <typename Tag>
class Identifier {
public:
    using tag_type = Tag;

    // Copies text; no validation or normalization is applied
    explicit Identifier(std::string value) : m_value(std::move(value)) {}

    [[nodiscard]] std::string_view value() const { return m_value; }

    [[nodiscard]] std::size_t hash() const { return hashText(m_value); }

    // e.g. "Venue('FTX')"
    [[nodiscard]] std::string repr() const
    {
        std::string out(Tag::name);
        out.reserve(out.size() + m_value.size() + 4);
        out += "('";
        out += m_value;
        out += "')";
        return out;
    }

    friend bool operator==(const Identifier& lhs, const Identifier& rhs) { return lhs.m_value == rhs.m_value; }
    friend bool operator!=(const Identifier& lhs, const Identifier& rhs) { return !(lhs == rhs); }

    friend std::ostream& operator<<(std::ostream& os, const Identifier& id) { return os << id.m_value; }

private:
    std::string m_value;
};

using AccountId = Identifier<AccountIdTag>;
using ComponentId = Identifier<ComponentIdTag>;
using Symbol = Identifier<SymbolTag>;
using Venue = Identifier<VenueTag>;

} // namespace idmill

namespace std {

template <typename Tag>
struct hash<idmill::Identifier<Tag>> {
    size_t operator()(const idmill::Identifier<Tag>& id) const noexcept { return id.hash(); }
};

} // namespace std
