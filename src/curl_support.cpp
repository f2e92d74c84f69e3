#include "curl_support.hpp"
#include <mutex>
#include <new>
#include <stdexcept>
#include <fmt/format.h>

void ensureCurlInitialized() {
    static std::once_flag once;
    static CURLcode status = CURLE_OK;
    std::call_once(once, [] { status = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (status != CURLE_OK) {
        throw std::runtime_error(fmt::format("Failed to initialize CURL: {}", curl_easy_strerror(status)));
    }
}

void appendToSlist(CurlSlistPtr& list, const std::string& value) {
    curl_slist* appended = curl_slist_append(list.get(), value.c_str());
    if (!appended) {
        throw std::bad_alloc();
    }
    list.release();
    list.reset(appended);
}

std::string escapeUrlSegment(std::string_view segment) {
    // A zero length makes curl_easy_escape fall back to strlen.
    if (segment.empty()) {
        return {};
    }
    CurlStringPtr escaped(curl_easy_escape(nullptr, segment.data(), static_cast<int>(segment.size())));
    if (!escaped) {
        throw std::bad_alloc();
    }
    return std::string(escaped.get());
}
