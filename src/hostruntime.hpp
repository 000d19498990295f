#pragma once

#include "idmill.h"

#include <string>
#include <string_view>

namespace idmill {

// Callback table of the embedding host. Installed once at startup, before any
// text crosses the boundary.
class HostRuntime {
public:
    static HostRuntime& instance();

    // Returns false and keeps the current table if a callback is missing
    [[nodiscard]] bool install(const idmill_host_api& api);

    void uninstall();

    [[nodiscard]] bool installed() const { return m_installed; }

    // Copies the text behind a borrowed host handle
    [[nodiscard]] std::string copyText(idmill_host_text* handle) const;

    // New host text object; the caller hands it to the host immediately
    [[nodiscard]] idmill_host_text* newText(std::string_view text) const;

private:
    HostRuntime() = default;

    void requireInstalled() const;

    idmill_host_api m_api{};
    bool m_installed = false;
};

} // namespace idmill
