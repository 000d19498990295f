#pragma once

#include "hostruntime.hpp"
#include "identifier.hpp"
#include "idmill.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Buffer behind the single pointer field of every boundary layout
struct idmill_text {
    std::string value;
};

namespace idmill::boundary {

// C layout of each identifier kind
template <typename Tag>
struct Layout;

template <>
struct Layout<AccountIdTag> {
    using type = account_id_t;
};

template <>
struct Layout<ComponentIdTag> {
    using type = component_id_t;
};

template <>
struct Layout<SymbolTag> {
    using type = symbol_t;
};

template <>
struct Layout<VenueTag> {
    using type = venue_t;
};

template <typename Tag>
using LayoutOf = typename Layout<Tag>::type;

template <typename Tag>
constexpr bool isFixedLayout()
{
    using Raw = LayoutOf<Tag>;
    return sizeof(Raw) == sizeof(void*) && std::is_standard_layout_v<Raw> && std::is_trivially_copyable_v<Raw>;
}

static_assert(isFixedLayout<AccountIdTag>());
static_assert(isFixedLayout<ComponentIdTag>());
static_assert(isFixedLayout<SymbolTag>());
static_assert(isFixedLayout<VenueTag>());

// Everything below trusts its arguments: layouts must be live (produced here
// and not yet freed) and host handles must satisfy the host contract.

template <typename Tag>
[[nodiscard]] LayoutOf<Tag> adoptText(std::string text)
{
    return LayoutOf<Tag>{std::make_unique<idmill_text>(idmill_text{std::move(text)}).release()};
}

template <typename Tag>
[[nodiscard]] std::string_view view(const LayoutOf<Tag>& raw)
{
    return raw.value->value;
}

// Copies a native identifier into a layout owned by the caller
template <typename Tag>
[[nodiscard]] LayoutOf<Tag> toLayout(const Identifier<Tag>& id)
{
    return adoptText<Tag>(std::string(id.value()));
}

// Takes the layout's buffer back into a native identifier. The layout is
// consumed and must not be freed afterwards.
template <typename Tag>
[[nodiscard]] Identifier<Tag> fromLayout(LayoutOf<Tag> raw)
{
    std::unique_ptr<idmill_text> text(raw.value);
    return Identifier<Tag>(std::move(text->value));
}

// Host keeps its handle, caller owns the copy
template <typename Tag>
[[nodiscard]] LayoutOf<Tag> fromForeignText(idmill_host_text* handle)
{
    return adoptText<Tag>(HostRuntime::instance().copyText(handle));
}

// Host owns the returned handle
template <typename Tag>
[[nodiscard]] idmill_host_text* toForeignText(const LayoutOf<Tag>& raw)
{
    return HostRuntime::instance().newText(view<Tag>(raw));
}

template <typename Tag>
void release(LayoutOf<Tag> raw)
{
    std::unique_ptr<idmill_text> text(raw.value);
}

template <typename Tag>
[[nodiscard]] LayoutOf<Tag> clone(const LayoutOf<Tag>& raw)
{
    return adoptText<Tag>(std::string(view<Tag>(raw)));
}

template <typename Tag>
[[nodiscard]] bool equals(const LayoutOf<Tag>& lhs, const LayoutOf<Tag>& rhs)
{
    return view<Tag>(lhs) == view<Tag>(rhs);
}

template <typename Tag>
[[nodiscard]] uint64_t hash(const LayoutOf<Tag>& raw)
{
    return static_cast<uint64_t>(hashText(view<Tag>(raw)));
}

} // namespace idmill::boundary
