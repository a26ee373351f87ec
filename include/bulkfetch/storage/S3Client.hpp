#pragma once

#include "bulkfetch/storage/ObjectStoreSink.hpp"
#include "bulkfetch/util/HttpClient.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace bulkfetch::storage {

struct S3Config {
    // 为空时使用 https://s3.<region>.amazonaws.com。
    std::string endpoint;
    std::string region{"us-east-1"};
    std::string bucket;
    std::string accessKeyId;
    std::string secretAccessKey;
    std::string sessionToken;
    // MinIO 等自建服务使用 <endpoint>/<bucket>/<key>，否则使用 <bucket>.<host>。
    bool pathStyle{false};
    std::chrono::seconds timeout{std::chrono::seconds{300}};
};

struct SigningInput {
    std::string method;
    std::string host;
    std::string canonicalUri;
    std::string canonicalQuery;
    std::string payloadHash;
    // yyyymmddThhmmssZ
    std::string amzDate;
};

std::string sha256Hex(std::string_view data);
std::string hmacSha256(std::string_view key, std::string_view data);
// RFC 3986 非保留字符之外全部编码；encodeSlash 为 false 时保留 '/'。
std::string uriEncode(std::string_view text, bool encodeSlash);
std::string formatAmzDate(std::chrono::system_clock::time_point time);

// AWS Signature Version 4，签名头为 host;x-amz-content-sha256;x-amz-date[;x-amz-security-token]。
std::string authorizationHeader(const S3Config& config, const SigningInput& input);

// S3 REST 接口上的 PutObject 与 ListObjectsV2，通过 HttpClient 直连，不走下载代理。
class S3Client : public ObjectStore {
public:
    S3Client(S3Config config, util::HttpClient& httpClient);

    void putObject(const std::string& key,
                   const std::filesystem::path& file,
                   const std::string& contentType) override;
    std::vector<std::string> listKeys(const std::string& prefix) override;

    const S3Config& config() const noexcept { return config_; }

private:
    struct Target {
        std::string url;
        std::string host;
        std::string canonicalUri;
    };

    Target targetFor(const std::string& key) const;
    std::vector<util::HttpClient::Header> signedHeaders(const std::string& method,
                                                        const Target& target,
                                                        const std::string& canonicalQuery,
                                                        const std::string& payloadHash) const;

    S3Config config_;
    util::HttpClient& httpClient_;
    std::string scheme_;
    std::string authority_;
};

// 解析 ListObjectsV2 的 XML 应答。
struct ListPage {
    std::vector<std::string> keys;
    bool truncated{};
    std::string continuationToken;
};

ListPage parseListObjectsResponse(std::string_view xml);

} // namespace bulkfetch::storage
