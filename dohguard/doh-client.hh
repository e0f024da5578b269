/*
 * MIT License
 *
 * Copyright (c) 2018-2019 powerdns.com bv
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once
#include <map>
#include <memory>
#include <string>

#include <curl/curlver.h>
#if defined(LIBCURL_VERSION_NUM) && LIBCURL_VERSION_NUM >= 0x073200
/* we need this so that 'CURL' is not typedef'd to void,
   which prevents us from wrapping it in a unique_ptr. */
#define CURL_STRICTER 1
#endif
#include <curl/curl.h>

namespace dohguard
{
/* Thin libcurl wrapper for the POST requests we send to DoH upstreams.
   Not thread-safe: use one instance per thread or per request. */
class DoHClient
{
public:
  using Headers = std::map<std::string, std::string>;

  struct Reply
  {
    long status{0};
    std::string contentType;
    std::string body;
  };

  static void init();

  DoHClient(const std::string& useragent = "dohguard/1.0");
  ~DoHClient();
  DoHClient(const DoHClient&) = delete;
  DoHClient& operator=(const DoHClient&) = delete;

  /* throws TimeoutException when the transfer does not complete within
     `timeout` seconds, UpstreamException on any other transport error.
     Non-2xx statuses are returned, not thrown. */
  Reply postURL(const std::string& url, const std::string& postdata, const Headers& headers, int timeout = 5, bool verify = true);

private:
  static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

#ifdef CURL_STRICTER
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> d_curl{nullptr, curl_easy_cleanup};
  std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)> d_header_list{nullptr, curl_slist_free_all};
#else
  CURL* d_curl{};
  struct curl_slist* d_header_list{};
#endif
  std::string d_data;
  bool d_fresh{true};

  void setupURL(const std::string& url, int timeout, bool verify);
  void setHeaders(const Headers& headers);
  void clearHeaders();
};
}
