#pragma once

#include "idmill.h"

#include <cstddef>
#include <memory>
#include <string_view>

namespace idmill {

// Host runtime for native embedders. Host text objects are heap strings
// owned by whoever holds the handle.
class NativeHost {
public:
    // Callback table for idmill_install_host
    [[nodiscard]] static idmill_host_api api();

    // Create a host text object (caller owns it)
    [[nodiscard]] static idmill_host_text* create(std::string_view text);

    [[nodiscard]] static std::string_view text(const idmill_host_text* handle);

    static void destroy(idmill_host_text* handle);

    // Host text objects created and not yet destroyed
    [[nodiscard]] static size_t liveCount();
};

struct HostTextDeleter {
    void operator()(idmill_host_text* handle) const { NativeHost::destroy(handle); }
};

// Scoped owner of a native host text object
using HostTextPtr = std::unique_ptr<idmill_host_text, HostTextDeleter>;

} // namespace idmill
