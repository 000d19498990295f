#include "boundary.hpp"
#include "hostruntime.hpp"
#include "idmill.h"

using namespace idmill;

// Entry points are noexcept: an exception reaching one terminates instead of
// unwinding through host frames.

extern "C" uint8_t idmill_install_host(const idmill_host_api* api) noexcept
{
    if (api == nullptr) {
        HostRuntime::instance().uninstall();
        return 1;
    }
    return HostRuntime::instance().install(*api) ? 1 : 0;
}

// One set of entry points per identifier kind
#define IDMILL_DEFINE_IDENTIFIER(kind, Tag)                                                        \
    extern "C" kind##_t kind##_from_foreign_text(idmill_host_text* handle) noexcept                \
    {                                                                                              \
        return boundary::fromForeignText<Tag>(handle);                                             \
    }                                                                                              \
    extern "C" idmill_host_text* kind##_to_foreign_text(const kind##_t* id) noexcept               \
    {                                                                                              \
        return boundary::toForeignText<Tag>(*id);                                                  \
    }                                                                                              \
    extern "C" void kind##_free(kind##_t id) noexcept { boundary::release<Tag>(id); }              \
    extern "C" kind##_t kind##_clone(const kind##_t* id) noexcept                                  \
    {                                                                                              \
        return boundary::clone<Tag>(*id);                                                          \
    }                                                                                              \
    extern "C" uint8_t kind##_eq(const kind##_t* lhs, const kind##_t* rhs) noexcept                \
    {                                                                                              \
        return boundary::equals<Tag>(*lhs, *rhs) ? 1 : 0;                                          \
    }                                                                                              \
    extern "C" uint64_t kind##_hash(const kind##_t* id) noexcept { return boundary::hash<Tag>(*id); }

IDMILL_DEFINE_IDENTIFIER(account_id, AccountIdTag)
IDMILL_DEFINE_IDENTIFIER(component_id, ComponentIdTag)
IDMILL_DEFINE_IDENTIFIER(symbol, SymbolTag)
IDMILL_DEFINE_IDENTIFIER(venue, VenueTag)

#undef IDMILL_DEFINE_IDENTIFIER
