#pragma once
#include <string>
#include <stdexcept>

struct ApiResponse {
    long status{0};
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Thrown when a request never produced an HTTP response (DNS, connect, TLS, timeout).
class ApiTransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Allocator job service. Implementations return whatever the server sent,
// any status code included; only transport failures throw.
class JobApi {
public:
    virtual ~JobApi() = default;
    virtual ApiResponse create_job(const std::string& client, const std::string& provider) = 0;
    virtual ApiResponse get_job(const std::string& id) = 0;
    virtual ApiResponse get_client_url(const std::string& client) = 0;
};

class JobClient : public JobApi {
public:
    explicit JobClient(std::string base_url, long timeout_ms = 30000);

    ApiResponse create_job(const std::string& client, const std::string& provider) override;
    ApiResponse get_job(const std::string& id) override;
    ApiResponse get_client_url(const std::string& client) override;

    const std::string& base_url() const { return base_; }

private:
    ApiResponse get(const std::string& path);

    std::string base_;
    long timeout_ms_;
};
