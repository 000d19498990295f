#pragma once

namespace idmill {

// Identifier kinds. Tags only keep kinds apart at compile time.
struct AccountIdTag {
    static constexpr const char* name = "AccountId";
};

struct ComponentIdTag {
    static constexpr const char* name = "ComponentId";
};

struct SymbolTag {
    static constexpr const char* name = "Symbol";
};

struct VenueTag {
    static constexpr const char* name = "Venue";
};

} // namespace idmill
