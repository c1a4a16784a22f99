#pragma once

#include <curl/curl.h>

#include <cstddef>
#include <string>

namespace recorder_common
{

/// cURL 수신 데이터를 std::string 버퍼에 누적하는 콜백
inline size_t curl_write_callback(void * contents, size_t size, size_t nmemb, void * userp)
{
  const size_t total = size * nmemb;
  auto * buffer = static_cast<std::string *>(userp);
  buffer->append(static_cast<const char *>(contents), total);
  return total;
}

/// 네트워크 장애(DNS, 연결, 타임아웃 등)에 해당하는 cURL 에러 코드인지 판별
inline bool is_network_error_code(int curl_code)
{
  return curl_code == CURLE_COULDNT_RESOLVE_HOST ||
    curl_code == CURLE_COULDNT_CONNECT ||
    curl_code == CURLE_OPERATION_TIMEDOUT ||
    curl_code == CURLE_GOT_NOTHING ||
    curl_code == CURLE_SEND_ERROR ||
    curl_code == CURLE_RECV_ERROR ||
    curl_code == CURLE_SSL_CONNECT_ERROR;
}

/// 스트림을 끊어야 하는 HTTP 응답 코드 (rate limit, 서버 오류)
inline bool is_retryable_http_code(long http_code)
{
  return http_code == 429 || (http_code >= 500 && http_code < 600);
}

/// RAII 방식으로 curl_global_init/cleanup을 관리 (프로세스당 1개 static 인스턴스)
class CurlGlobalGuard
{
public:
  CurlGlobalGuard()
  {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }

  ~CurlGlobalGuard()
  {
    curl_global_cleanup();
  }

  CurlGlobalGuard(const CurlGlobalGuard &) = delete;
  CurlGlobalGuard & operator=(const CurlGlobalGuard &) = delete;
};

}  // namespace recorder_common
