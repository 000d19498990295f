#include "hostruntime.hpp"

#include <stdexcept>

namespace idmill {

HostRuntime& HostRuntime::instance()
{
    static HostRuntime runtime;
    return runtime;
}

bool HostRuntime::install(const idmill_host_api& api)
{
    if (api.borrow_utf8 == nullptr || api.new_text == nullptr) {
        return false;
    }
    m_api = api;
    m_installed = true;
    return true;
}

void HostRuntime::uninstall()
{
    m_api = idmill_host_api{};
    m_installed = false;
}

std::string HostRuntime::copyText(idmill_host_text* handle) const
{
    requireInstalled();

    size_t length = 0;
    const char* data = m_api.borrow_utf8(handle, &length);
    return std::string(data, length);
}

idmill_host_text* HostRuntime::newText(std::string_view text) const
{
    requireInstalled();
    return m_api.new_text(text.data(), text.size());
}

void HostRuntime::requireInstalled() const
{
    if (!m_installed) {
        throw std::logic_error("No host runtime installed");
    }
}

} // namespace idmill
