/**
 * @file test_upload_session.cpp
 * @brief Unit tests for upload_session wire format and retry behaviour
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/core/content_address.h>
#include <kcenon/chunked_upload/upload/upload_session.h>

#include "../support/mock_upload_service.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::chunked_upload::test {

class UploadSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_shared<mock_upload_service>();

        transport_config config;
        config.base_url = "https://files.example.com";
        config.credentials = {"user", "token"};
        transport_ = std::make_shared<transport_client>(std::move(config), service_);
    }

    auto make_session(std::size_t attempts = 3, std::string key = "PROJ-1") -> upload_session {
        retry_executor retry(retry_policy::immediate(attempts));
        retry.with_sleep_function([this](std::chrono::milliseconds) {
            ++sleeps_;
            return true;
        });
        return upload_session(transport_, std::move(key), std::move(retry));
    }

    static auto bytes_of(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> out;
        for (char c : text) {
            out.push_back(static_cast<std::byte>(c));
        }
        return out;
    }

    static auto identify(const std::vector<std::byte>& data) -> content_identifier {
        auto id = content_addresser::compute(data);
        EXPECT_TRUE(id.has_value());
        return id.value();
    }

    std::shared_ptr<mock_upload_service> service_;
    std::shared_ptr<transport_client> transport_;
    int sleeps_ = 0;
};

// ============================================================================
// create
// ============================================================================

TEST_F(UploadSessionTest, Create_ReturnsSessionId) {
    auto session = make_session();

    auto id = session.create();

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id.value(), "session-1");
    EXPECT_EQ(session.session_id(), "session-1");
    EXPECT_TRUE(session.is_open());

    auto requests = service_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "https://files.example.com/api/upload/PROJ-1/create");
    EXPECT_TRUE(requests[0].body.empty());
}

TEST_F(UploadSessionTest, Create_TransientFailuresAreRetried) {
    service_->queue_statuses(route::create, {500, 500});
    auto session = make_session(10);

    auto id = session.create();

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(service_->count(route::create), 3u);
    EXPECT_EQ(service_->count_with_status(route::create, 201), 1u);
    EXPECT_EQ(service_->sessions_created(), 1u);
    EXPECT_EQ(sleeps_, 2);
}

TEST_F(UploadSessionTest, Create_UnauthorizedIsNotRetried) {
    service_->queue_statuses(route::create, {401});
    auto session = make_session(10);

    auto id = session.create();

    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::authentication_failed);
    EXPECT_EQ(service_->count(route::create), 1u);
    EXPECT_EQ(sleeps_, 0);
    EXPECT_FALSE(session.is_open());
}

TEST_F(UploadSessionTest, Create_MissingUploadIdIsRetriedUntilExhausted) {
    service_->set_create_body("{\"status\":\"ok\"}");
    auto session = make_session(3);

    auto id = session.create();

    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::retries_exhausted);
    EXPECT_NE(id.error().message.find("uploadId"), std::string::npos);
    EXPECT_EQ(service_->count(route::create), 3u);
}

TEST_F(UploadSessionTest, Create_NonJsonBodyIsMalformed) {
    service_->set_create_body("<html>gateway</html>");
    auto session = make_session(2);

    auto id = session.create();

    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::retries_exhausted);
}

TEST_F(UploadSessionTest, Create_Twice) {
    auto session = make_session();
    ASSERT_TRUE(session.create().has_value());

    auto again = session.create();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(service_->sessions_created(), 1u);
}

TEST_F(UploadSessionTest, ResourceKeyIsUrlEncoded) {
    auto session = make_session(3, "PROJ 1/x");
    ASSERT_TRUE(session.create().has_value());

    auto requests = service_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "https://files.example.com/api/upload/PROJ%201%2Fx/create");
}

// ============================================================================
// probe
// ============================================================================

TEST_F(UploadSessionTest, Probe_BeforeCreateFails) {
    auto session = make_session();
    auto id = identify(bytes_of("hello"));

    auto exists = session.probe(id);

    ASSERT_FALSE(exists.has_value());
    EXPECT_EQ(exists.error().code, error_code::internal_error);
    EXPECT_TRUE(service_->requests().empty());
}

TEST_F(UploadSessionTest, Probe_WireFormat) {
    auto session = make_session();
    ASSERT_TRUE(session.create().has_value());
    auto id = identify(bytes_of("hello world"));

    auto exists = session.probe(id);

    ASSERT_TRUE(exists.has_value());
    EXPECT_FALSE(exists.value());

    auto requests = service_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].url,
              "https://files.example.com/api/upload/PROJ-1/chunk/probe?uploadId=session-1");
    EXPECT_EQ(requests[1].body_string(),
              "{\"chunks\":[{\"hash\":\"" + id.digest + "\",\"size\":\"11\"}]}");
}

TEST_F(UploadSessionTest, Probe_ReportsStoredChunk) {
    auto session = make_session();
    ASSERT_TRUE(session.create().has_value());
    auto id = identify(bytes_of("already there"));
    service_->preload(id);

    auto exists = session.probe(id);

    ASSERT_TRUE(exists.has_value());
    EXPECT_TRUE(exists.value());
}

TEST_F(UploadSessionTest, Probe_UnauthorizedAborts) {
    auto session = make_session(10);
    ASSERT_TRUE(session.create().has_value());
    auto id = identify(bytes_of("secret"));
    service_->fail_probe_for_digest(id.digest, 401);

    auto exists = session.probe(id);

    ASSERT_FALSE(exists.has_value());
    EXPECT_EQ(exists.error().code, error_code::authentication_failed);
    EXPECT_EQ(service_->count(route::probe), 1u);
}

TEST_F(UploadSessionTest, ParseProbeResponse) {
    content_identifier id{std::string(64, 'a'), 5};
    auto key = id.probe_key();

    auto present = upload_session::parse_probe_response(
        "{\"data\":{\"results\":{\"" + key + "\":{\"exists\":true}}}}", id);
    ASSERT_TRUE(present.has_value());
    EXPECT_TRUE(present.value());

    auto absent = upload_session::parse_probe_response(
        "{\"data\":{\"results\":{\"" + key + "\":{\"exists\":false}}}}", id);
    ASSERT_TRUE(absent.has_value());
    EXPECT_FALSE(absent.value());

    auto missing_entry = upload_session::parse_probe_response(
        "{\"data\":{\"results\":{}}}", id);
    ASSERT_TRUE(missing_entry.has_value());
    EXPECT_FALSE(missing_entry.value());

    auto missing_data = upload_session::parse_probe_response("{}", id);
    ASSERT_TRUE(missing_data.has_value());
    EXPECT_FALSE(missing_data.value());

    auto garbage = upload_session::parse_probe_response("not json", id);
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error().code, error_code::malformed_response);
}

// ============================================================================
// upload
// ============================================================================

TEST_F(UploadSessionTest, Upload_WireFormat) {
    auto session = make_session();
    ASSERT_TRUE(session.create().has_value());
    auto data = bytes_of("chunk payload");
    auto id = identify(data);

    auto sent = session.upload(id, data, 3, "archive.tar");

    ASSERT_TRUE(sent.has_value());

    auto requests = service_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].url, "https://files.example.com/api/upload/PROJ-1/chunk/" +
                                   id.to_string() + "?uploadId=session-1&partNumber=3");
    EXPECT_EQ(requests[1].headers.at("Content-Type").rfind("multipart/form-data; boundary=", 0),
              0u);
    EXPECT_NE(requests[1].body_string().find(
                  "name=\"chunk\"; filename=\"archive.tar\""),
              std::string::npos);

    auto parts = service_->uploaded_parts();
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].identifier, id.to_string());
    EXPECT_EQ(parts[0].part_number, 3u);
    EXPECT_EQ(parts[0].session_id, "session-1");
}

TEST_F(UploadSessionTest, Upload_LengthMismatchIsRejectedLocally) {
    auto session = make_session();
    ASSERT_TRUE(session.create().has_value());
    auto data = bytes_of("abc");
    content_identifier id{std::string(64, '0'), 4};

    auto sent = session.upload(id, data, 1, "f");

    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::protocol_invariant_violation);
    EXPECT_EQ(service_->count(route::upload), 0u);
}

TEST_F(UploadSessionTest, Upload_NoResponseIsRetried) {
    service_->queue_statuses(route::upload, {0, 503});
    auto session = make_session(5);
    ASSERT_TRUE(session.create().has_value());
    auto data = bytes_of("retry me");
    auto id = identify(data);

    auto sent = session.upload(id, data, 1, "f");

    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(service_->count(route::upload), 3u);
    EXPECT_EQ(service_->uploaded_parts().size(), 1u);
}

// ============================================================================
// finalize
// ============================================================================

TEST_F(UploadSessionTest, Finalize_Body) {
    auto session = make_session();
    ASSERT_TRUE(session.create().has_value());

    ordered_identifier_list manifest = {
        content_identifier{std::string(64, 'a'), 5},
        content_identifier{std::string(64, 'b'), 2},
    };

    auto committed = session.finalize(manifest, "my \"file\".bin", "application/octet-stream");

    ASSERT_TRUE(committed.has_value());
    EXPECT_TRUE(session.is_finalized());

    auto bodies = service_->finalize_bodies();
    ASSERT_EQ(bodies.size(), 1u);
    EXPECT_EQ(bodies[0],
              "{\"chunks\":[{\"hash\":\"" + std::string(64, 'a') + "\",\"size\":\"5\"},"
              "{\"hash\":\"" + std::string(64, 'b') + "\",\"size\":\"2\"}],"
              "\"name\":\"my \\\"file\\\".bin\","
              "\"mimeType\":\"application/octet-stream\"}");

    auto requests = service_->requests();
    EXPECT_EQ(requests.back().url,
              "https://files.example.com/api/upload/PROJ-1/file/chunked?uploadId=session-1");
}

TEST_F(UploadSessionTest, Finalize_EmptyManifest) {
    auto session = make_session();
    ASSERT_TRUE(session.create().has_value());

    ASSERT_TRUE(session.finalize({}, "empty.txt", "text/plain").has_value());

    auto bodies = service_->finalize_bodies();
    ASSERT_EQ(bodies.size(), 1u);
    EXPECT_EQ(bodies[0], "{\"chunks\":[],\"name\":\"empty.txt\",\"mimeType\":\"text/plain\"}");
}

TEST_F(UploadSessionTest, Finalize_OnlyOnce) {
    auto session = make_session();
    ASSERT_TRUE(session.create().has_value());
    ASSERT_TRUE(session.finalize({}, "f", "text/plain").has_value());

    auto again = session.finalize({}, "f", "text/plain");

    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(service_->finalize_bodies().size(), 1u);
}

TEST_F(UploadSessionTest, Finalize_UnauthorizedIsNotRetried) {
    service_->queue_statuses(route::finalize, {401});
    auto session = make_session(10);
    ASSERT_TRUE(session.create().has_value());

    auto committed = session.finalize({}, "f", "text/plain");

    ASSERT_FALSE(committed.has_value());
    EXPECT_EQ(committed.error().code, error_code::authentication_failed);
    EXPECT_EQ(service_->count(route::finalize), 1u);
    EXPECT_FALSE(session.is_finalized());
}

TEST_F(UploadSessionTest, ChunksJson) {
    std::vector<content_identifier> ids = {content_identifier{"ab", 1}};
    EXPECT_EQ(upload_session::chunks_json(ids), "[{\"hash\":\"ab\",\"size\":\"1\"}]");
    EXPECT_EQ(upload_session::chunks_json({}), "[]");
}

}  // namespace kcenon::chunked_upload::test
