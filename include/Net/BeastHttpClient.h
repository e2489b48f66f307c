#ifndef BEASTHTTPCLIENT_H
#define BEASTHTTPCLIENT_H

#include <memory>
#include <string>

#include "Net/HttpClient.h"

// IHttpClient over Boost.Beast. Every call runs on its own io_context, so a
// single instance may be shared between threads.
class BeastHttpClient : public IHttpClient {
  public:
    explicit BeastHttpClient(std::string user_agent = "reelcast/0.1");
    ~BeastHttpClient() override;

    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    int get(const HttpRequest& request, const HttpDataCallback& on_data) override;

  private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

#endif // BEASTHTTPCLIENT_H
