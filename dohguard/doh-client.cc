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

#include <atomic>
#include <sstream>
#include <stdexcept>

#include "doh-client.hh"
#include "dohguardexception.hh"

#ifdef CURL_STRICTER
#define getCURLPtr(x) \
  x.get()
#else
#define getCURLPtr(x) \
  x
#endif

namespace dohguard
{
void DoHClient::init()
{
  static std::atomic_flag s_init = ATOMIC_FLAG_INIT;

  if (s_init.test_and_set()) {
    return;
  }

  CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
  if (code != 0) {
    throw std::runtime_error("Error initializing libcurl");
  }
}

DoHClient::DoHClient(const std::string& useragent)
{
  init();
#ifdef CURL_STRICTER
  d_curl = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>(curl_easy_init(), curl_easy_cleanup);
#else
  d_curl = curl_easy_init();
#endif
  if (d_curl == nullptr) {
    throw std::runtime_error("Error creating a DoH client session");
  }
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_USERAGENT, useragent.c_str());
}

DoHClient::~DoHClient()
{
  clearHeaders();
#ifndef CURL_STRICTER
  curl_easy_cleanup(d_curl);
#endif
}

size_t DoHClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
  if (userdata != nullptr) {
    auto* us = static_cast<DoHClient*>(userdata);
    us->d_data.append(ptr, size * nmemb);
    return size * nmemb;
  }
  return 0;
}

void DoHClient::setupURL(const std::string& url, int timeout, bool verify)
{
  if (!d_fresh) {
    curl_easy_reset(getCURLPtr(d_curl));
  }
  else {
    d_fresh = false;
  }

  /* only allow HTTP and HTTPS */
#if defined(LIBCURL_VERSION_NUM) && LIBCURL_VERSION_NUM >= 0x075500 // 7.85.0
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_PROTOCOLS_STR, "http,https");
#else
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
#endif

  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_FAILONERROR, 0L);
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_URL, url.c_str());
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_WRITEDATA, this);
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_TIMEOUT, static_cast<long>(timeout));

  clearHeaders();
  d_data.clear();
}

DoHClient::Reply DoHClient::postURL(const std::string& url, const std::string& postdata, const Headers& headers, int timeout, bool verify)
{
  setupURL(url, timeout, verify);
  setHeaders(headers);
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_POSTFIELDSIZE, static_cast<long>(postdata.size()));
  curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_POSTFIELDS, postdata.c_str());

  auto res = curl_easy_perform(getCURLPtr(d_curl));

  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw TimeoutException("Timeout after " + std::to_string(timeout) + "s posting to " + url);
  }
  if (res != CURLE_OK) {
    throw UpstreamException("Unable to post to " + url + ": " + std::string(curl_easy_strerror(res)));
  }

  Reply reply;
  curl_easy_getinfo(getCURLPtr(d_curl), CURLINFO_RESPONSE_CODE, &reply.status);
  char* contentType = nullptr;
  if (curl_easy_getinfo(getCURLPtr(d_curl), CURLINFO_CONTENT_TYPE, &contentType) == CURLE_OK && contentType != nullptr) {
    reply.contentType = contentType;
  }
  reply.body = std::move(d_data);
  d_data.clear();
  return reply;
}

void DoHClient::clearHeaders()
{
  if (d_curl) {
    curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_HTTPHEADER, nullptr);
#ifdef CURL_STRICTER
    d_header_list.reset();
#else
    curl_slist_free_all(d_header_list);
    d_header_list = nullptr;
#endif
  }
}

void DoHClient::setHeaders(const Headers& headers)
{
  if (d_curl) {
    for (const auto& header : headers) {
      std::stringstream header_ss;
      header_ss << header.first << ": " << header.second;
#ifdef CURL_STRICTER
      struct curl_slist* list = nullptr;
      if (d_header_list) {
        list = d_header_list.release();
      }
      d_header_list = std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)>(curl_slist_append(list, header_ss.str().c_str()), curl_slist_free_all);
#else
      d_header_list = curl_slist_append(d_header_list, header_ss.str().c_str());
#endif
    }
    curl_easy_setopt(getCURLPtr(d_curl), CURLOPT_HTTPHEADER, getCURLPtr(d_header_list));
  }
}
}
