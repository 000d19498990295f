#include "nativehost.hpp"

#include <atomic>
#include <memory>
#include <string>

// Host text object of the native host
struct idmill_host_text {
    std::string text;
};

namespace idmill {

namespace {

std::atomic<size_t> g_liveTexts{0};

const char* borrowUtf8(idmill_host_text* handle, size_t* length)
{
    *length = handle->text.size();
    return handle->text.data();
}

idmill_host_text* newText(const char* data, size_t length)
{
    return NativeHost::create(std::string_view(data, length));
}

} // namespace

idmill_host_api NativeHost::api() { return idmill_host_api{&borrowUtf8, &newText}; }

idmill_host_text* NativeHost::create(std::string_view text)
{
    auto owned = std::make_unique<idmill_host_text>(idmill_host_text{std::string(text)});
    ++g_liveTexts;
    return owned.release();
}

std::string_view NativeHost::text(const idmill_host_text* handle) { return handle->text; }

void NativeHost::destroy(idmill_host_text* handle)
{
    if (handle == nullptr) {
        return;
    }
    std::unique_ptr<idmill_host_text> owned(handle);
    --g_liveTexts;
}

size_t NativeHost::liveCount() { return g_liveTexts.load(); }

} // namespace idmill
