/**
 * @file curl_support.hpp
 * @brief RAII owners and process-wide initialization for libcurl.
 *
 * @note Requires libcurl.
 */

#ifndef CURL_SUPPORT_HPP
#define CURL_SUPPORT_HPP

#include <memory>
#include <string>
#include <string_view>
#include <curl/curl.h>

struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct CurlFreeDeleter {
    void operator()(char* text) const { curl_free(text); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;
using CurlStringPtr = std::unique_ptr<char, CurlFreeDeleter>; ///< Strings allocated by libcurl.

/**
 * @brief Runs curl_global_init exactly once per process.
 *
 * @throws std::runtime_error If libcurl cannot be initialized.
 */
void ensureCurlInitialized();

/**
 * @brief Appends a string to a slist.
 *
 * @throws std::bad_alloc If libcurl cannot allocate the node.
 */
void appendToSlist(CurlSlistPtr& list, const std::string& value);

/**
 * @brief Percent-encodes one URL path segment with curl_easy_escape.
 *
 * @throws std::bad_alloc If libcurl cannot allocate the escaped copy.
 */
std::string escapeUrlSegment(std::string_view segment);

#endif // CURL_SUPPORT_HPP
