#include "graph/neo4j_session.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <chrono>
#include <iostream>
#include <vector>

using json = nlohmann::json;

namespace dbx {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Make HTTP POST request with CURL, authenticating with basic auth
HttpResponse http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    const std::string& credentials,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ConnectionError("Failed to initialize CURL");
    }

    HttpResponse response;
    struct curl_slist* header_list = nullptr;

    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(json_payload.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl, CURLOPT_USERPWD, credentials.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw ConnectionError(url + ": " + error);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_cleanup(curl);

    return response;
}

std::optional<std::string> value_to_text(const json& value) {
    if (value.is_null()) return std::nullopt;
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

} // anonymous namespace

// ============================================================================
// Neo4jConfig
// ============================================================================

std::string Neo4jConfig::commit_url() const {
    return scheme + "://" + host + ":" + std::to_string(port) +
           "/db/" + database + "/tx/commit";
}

// ============================================================================
// Neo4jHttpSession
// ============================================================================

Neo4jHttpSession::Neo4jHttpSession(const Neo4jConfig& config)
    : config_(config) {}

std::string Neo4jHttpSession::build_payload(
    const std::string& query,
    const QueryParameters& parameters
) const {
    json statement;
    statement["statement"] = query;
    statement["parameters"] = parameters.is_null() ? json::object() : parameters;
    statement["resultDataContents"] = json::array({"row"});

    json j;
    j["statements"] = json::array({statement});
    return j.dump();
}

std::unique_ptr<QueryResult> Neo4jHttpSession::run(
    const std::string& query,
    const QueryParameters& parameters
) {
    auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Accept: application/json;charset=UTF-8"
    };

    HttpResponse response = http_post(
        config_.commit_url(),
        build_payload(query, parameters),
        headers,
        config_.username + ":" + config_.password,
        config_.timeout_seconds
    );

    if (response.status == 401 || response.status == 403) {
        throw ConnectionError(
            "authentication rejected by " + config_.host + ":" +
            std::to_string(config_.port) + " (HTTP " +
            std::to_string(response.status) + ")"
        );
    }
    if (response.status < 200 || response.status >= 300) {
        throw QueryError(
            "HTTP request failed with code " + std::to_string(response.status) +
            ": " + response.body
        );
    }

    auto result = parse_neo4j_response(response.body);

    if (config_.verbose) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time
        );
        std::cout << "  Neo4j query answered in " << duration.count() << " ms\n";
    }

    return result;
}

void Neo4jHttpSession::verify_connectivity() {
    try {
        auto result = run("RETURN 1 AS ok");
        if (!result->peek()) {
            throw ConnectionError("connectivity check returned no row");
        }
    } catch (const QueryError& e) {
        throw ConnectionError(
            "cannot use database '" + config_.database + "': " + e.what()
        );
    }
}

// ============================================================================
// Response Parsing
// ============================================================================

std::unique_ptr<QueryResult> parse_neo4j_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw QueryError(std::string("malformed response: ") + e.what());
    }

    if (j.contains("errors") && j["errors"].is_array() && !j["errors"].empty()) {
        const json& error = j["errors"][0];
        std::string code = error.value("code", "");
        std::string message = error.value("message", "");
        if (code.rfind("Neo.ClientError.Security.", 0) == 0) {
            throw ConnectionError(code + ": " + message);
        }
        throw QueryError(code + ": " + message);
    }

    if (!j.contains("results") || !j["results"].is_array() || j["results"].empty()) {
        throw QueryError("response carries no result");
    }

    const json& result = j["results"][0];
    if (!result.contains("columns") || !result.contains("data") || !result["data"].is_array()) {
        throw QueryError("result lacks columns or data");
    }

    std::shared_ptr<const std::vector<std::string>> columns;
    try {
        columns = std::make_shared<const std::vector<std::string>>(
            result["columns"].get<std::vector<std::string>>()
        );
    } catch (const json::type_error& e) {
        throw QueryError(std::string("unexpected column list: ") + e.what());
    }

    std::vector<Record> records;
    records.reserve(result["data"].size());
    for (const auto& entry : result["data"]) {
        if (!entry.contains("row") || !entry["row"].is_array()) {
            throw QueryError("result data entry without row");
        }
        std::vector<std::optional<std::string>> values;
        values.reserve(entry["row"].size());
        for (const auto& value : entry["row"]) {
            values.push_back(value_to_text(value));
        }
        records.emplace_back(columns, std::move(values));
    }

    return std::make_unique<BufferedResult>(std::move(records));
}

} // namespace dbx
