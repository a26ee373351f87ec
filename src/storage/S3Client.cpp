#include "bulkfetch/storage/S3Client.hpp"

#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <ctime>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace bulkfetch::storage {
namespace {

constexpr char kAlgorithm[] = "AWS4-HMAC-SHA256";

std::string toHex(std::string_view bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (const unsigned char c : bytes) {
        hex += digits[c >> 4];
        hex += digits[c & 0x0f];
    }
    return hex;
}

std::string tagValue(std::string_view xml, std::string_view tag, std::size_t& cursor) {
    const std::string open = "<" + std::string(tag) + ">";
    const std::string close = "</" + std::string(tag) + ">";
    const auto start = xml.find(open, cursor);
    if (start == std::string_view::npos) {
        cursor = std::string_view::npos;
        return {};
    }
    const auto valueStart = start + open.size();
    const auto end = xml.find(close, valueStart);
    if (end == std::string_view::npos) {
        cursor = std::string_view::npos;
        return {};
    }
    cursor = end + close.size();
    return std::string(xml.substr(valueStart, end - valueStart));
}

std::string firstTag(std::string_view xml, std::string_view tag) {
    std::size_t cursor = 0;
    return tagValue(xml, tag, cursor);
}

std::string unescapeXml(std::string text) {
    text = util::replaceAll(text, "&lt;", "<");
    text = util::replaceAll(text, "&gt;", ">");
    text = util::replaceAll(text, "&quot;", "\"");
    text = util::replaceAll(text, "&apos;", "'");
    return util::replaceAll(text, "&amp;", "&");
}

std::string readWholeFile(const std::filesystem::path& file) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open " + file.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw std::runtime_error("read failed for " + file.string());
    }
    return content;
}

void ensureSuccess(const util::HttpClient::HttpResponse& response, const std::string& what) {
    const auto status = response.result_int();
    if (status >= 200 && status < 300) {
        return;
    }
    auto code = firstTag(response.body(), "Code");
    throw std::runtime_error(what + " failed: HTTP " + std::to_string(status) + (code.empty() ? "" : " " + code));
}

} // namespace

std::string sha256Hex(std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return toHex(std::string_view(reinterpret_cast<const char*>(digest.data()), length));
}

std::string hmacSha256(std::string_view key, std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};
    unsigned int length = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac.data(), &length) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char*>(mac.data()), length);
}

std::string uriEncode(std::string_view text, bool encodeSlash) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(text.size());
    for (const unsigned char c : text) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                                c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encodeSlash)) {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += digits[c >> 4];
            encoded += digits[c & 0x0f];
        }
    }
    return encoded;
}

std::string formatAmzDate(std::chrono::system_clock::time_point time) {
    const auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::array<char, 20> buffer{};
    const auto written = std::strftime(buffer.data(), buffer.size(), "%Y%m%dT%H%M%SZ", &utc);
    return std::string(buffer.data(), written);
}

std::string authorizationHeader(const S3Config& config, const SigningInput& input) {
    std::string canonicalHeaders = "host:" + input.host + "\n" +
                                   "x-amz-content-sha256:" + input.payloadHash + "\n" +
                                   "x-amz-date:" + input.amzDate + "\n";
    std::string signedNames = "host;x-amz-content-sha256;x-amz-date";
    if (!config.sessionToken.empty()) {
        canonicalHeaders += "x-amz-security-token:" + config.sessionToken + "\n";
        signedNames += ";x-amz-security-token";
    }

    const auto canonicalRequest = input.method + "\n" + input.canonicalUri + "\n" + input.canonicalQuery + "\n" +
                                  canonicalHeaders + "\n" + signedNames + "\n" + input.payloadHash;

    const auto date = input.amzDate.substr(0, 8);
    const auto scope = date + "/" + config.region + "/s3/aws4_request";
    const auto stringToSign =
        std::string{kAlgorithm} + "\n" + input.amzDate + "\n" + scope + "\n" + sha256Hex(canonicalRequest);

    auto signingKey = hmacSha256("AWS4" + config.secretAccessKey, date);
    signingKey = hmacSha256(signingKey, config.region);
    signingKey = hmacSha256(signingKey, "s3");
    signingKey = hmacSha256(signingKey, "aws4_request");
    const auto signature = toHex(hmacSha256(signingKey, stringToSign));

    return std::string{kAlgorithm} + " Credential=" + config.accessKeyId + "/" + scope +
           ",SignedHeaders=" + signedNames + ",Signature=" + signature;
}

ListPage parseListObjectsResponse(std::string_view xml) {
    ListPage page;
    std::size_t cursor = 0;
    while (cursor != std::string_view::npos) {
        auto key = tagValue(xml, "Key", cursor);
        if (cursor != std::string_view::npos) {
            page.keys.push_back(unescapeXml(std::move(key)));
        }
    }
    page.truncated = util::toLower(util::trimView(firstTag(xml, "IsTruncated"))) == "true";
    page.continuationToken = unescapeXml(firstTag(xml, "NextContinuationToken"));
    return page;
}

S3Client::S3Client(S3Config config, util::HttpClient& httpClient)
    : config_(std::move(config))
    , httpClient_(httpClient) {
    if (config_.bucket.empty()) {
        throw std::invalid_argument("S3 bucket must not be empty");
    }
    auto base = config_.endpoint.empty() ? "https://s3." + config_.region + ".amazonaws.com" : config_.endpoint;
    const auto schemeEnd = base.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("S3 endpoint missing scheme: " + base);
    }
    scheme_ = util::toLower(base.substr(0, schemeEnd));
    if (scheme_ != "http" && scheme_ != "https") {
        throw std::invalid_argument("Unsupported S3 endpoint scheme: " + base);
    }
    authority_ = base.substr(schemeEnd + 3);
    authority_ = authority_.substr(0, authority_.find('/'));
    const std::string defaultPort = scheme_ == "https" ? ":443" : ":80";
    if (authority_.size() > defaultPort.size() &&
        authority_.compare(authority_.size() - defaultPort.size(), defaultPort.size(), defaultPort) == 0) {
        authority_.erase(authority_.size() - defaultPort.size());
    }
    if (authority_.empty()) {
        throw std::invalid_argument("S3 endpoint missing host: " + base);
    }
}

S3Client::Target S3Client::targetFor(const std::string& key) const {
    Target target;
    if (config_.pathStyle) {
        target.host = authority_;
        target.canonicalUri = "/" + uriEncode(config_.bucket, true);
        if (!key.empty()) {
            target.canonicalUri += "/" + uriEncode(key, false);
        }
    } else {
        target.host = config_.bucket + "." + authority_;
        target.canonicalUri = "/" + uriEncode(key, false);
    }
    target.url = scheme_ + "://" + target.host + target.canonicalUri;
    return target;
}

std::vector<util::HttpClient::Header> S3Client::signedHeaders(const std::string& method,
                                                              const Target& target,
                                                              const std::string& canonicalQuery,
                                                              const std::string& payloadHash) const {
    SigningInput input;
    input.method = method;
    input.host = target.host;
    input.canonicalUri = target.canonicalUri;
    input.canonicalQuery = canonicalQuery;
    input.payloadHash = payloadHash;
    input.amzDate = formatAmzDate(std::chrono::system_clock::now());

    std::vector<util::HttpClient::Header> headers{
        {"x-amz-date", input.amzDate},
        {"x-amz-content-sha256", payloadHash},
    };
    if (!config_.sessionToken.empty()) {
        headers.push_back({"x-amz-security-token", config_.sessionToken});
    }
    headers.push_back({"Authorization", authorizationHeader(config_, input)});
    return headers;
}

void S3Client::putObject(const std::string& key, const std::filesystem::path& file, const std::string& contentType) {
    const auto body = readWholeFile(file);
    const auto target = targetFor(key);
    auto headers = signedHeaders("PUT", target, {}, sha256Hex(body));
    headers.push_back({"Content-Type", contentType});
    if (body.empty()) {
        headers.push_back({"Content-Length", "0"});
    }

    auto response = httpClient_.fetch("PUT", target.url, headers, body, config_.timeout);
    ensureSuccess(response, "PUT s3://" + config_.bucket + "/" + key);
    util::log(util::LogLevel::trace, "已上传对象 " + key + " " + util::formatBytes(static_cast<double>(body.size())));
}

std::vector<std::string> S3Client::listKeys(const std::string& prefix) {
    std::vector<std::string> keys;
    std::string token;
    const auto target = targetFor({});
    do {
        // 规范查询串需按参数名排序。
        std::string query;
        if (!token.empty()) {
            query += "continuation-token=" + uriEncode(token, true) + "&";
        }
        query += "list-type=2&prefix=" + uriEncode(prefix, true);

        auto headers = signedHeaders("GET", target, query, sha256Hex({}));
        auto response = httpClient_.fetch("GET", target.url + "?" + query, headers, {}, config_.timeout);
        ensureSuccess(response, "LIST s3://" + config_.bucket + "/" + prefix);

        auto page = parseListObjectsResponse(response.body());
        keys.insert(keys.end(), std::make_move_iterator(page.keys.begin()), std::make_move_iterator(page.keys.end()));
        token = page.truncated ? page.continuationToken : std::string{};
    } while (!token.empty());

    util::log(util::LogLevel::debug,
              "S3 列举 " + config_.bucket + "/" + prefix + " 共 " + std::to_string(keys.size()) + " 个对象");
    return keys;
}

} // namespace bulkfetch::storage
