#include "pack/package_writer.hpp"
#include "serve/static_file_server.hpp"
#include "server/host_response.hpp"
#include "storage/archive_storage.hpp"
#include "testing.hpp"
#include "util/http_date.hpp"

#include <gtest/gtest.h>

namespace staticfs {

namespace {

constexpr std::int64_t kMtime = 1700000000;
const std::string kText = "0123456789abcdef";

std::shared_ptr<const IStorage> MakeArchive() {
    PackageWriter writer;
    EXPECT_TRUE(writer.AddMemory("data.txt", kMtime, testutil::Bytes(kText)).ok);
    EXPECT_TRUE(writer.AddMemory("LICENSE", kMtime, testutil::Bytes("MIT")).ok);
    EXPECT_TRUE(writer.AddMemory("empty.txt", kMtime, {}).ok);

    testutil::BufferWriter out;
    EXPECT_TRUE(writer.Write(out).ok);

    auto package = std::make_shared<Package>();
    EXPECT_TRUE(Package::FromBuffer(std::move(out.data), *package).ok);
    return std::make_shared<ArchiveStorage>(package);
}

const std::string* FindHeader(const HostResponse& plan, const std::string& name) {
    for (const auto& [n, v] : plan.headers) {
        if (n == name) return &v;
    }
    return nullptr;
}

class HostResponseTest : public ::testing::Test {
protected:
    Request Make(Method method, std::string path) {
        Request req;
        req.method = method;
        req.path = std::move(path);
        return req;
    }

    // Runs the pipeline the way the host does, starting from the status
    // httplib left on its response.
    Response Serve(const Request& req, int host_status = kStatusNotFound) {
        Response res;
        res.status = PipelineStartStatus(host_status, req);
        EXPECT_TRUE(server.Handle(req, res));
        return res;
    }

    StaticFileServer server{MakeArchive(), "/"};
};

} // namespace

TEST(PipelineStartStatusTest, RangeRejectedByHostIsUnhandled) {
    Request req;
    req.headers["range"] = "bytes=oops";
    EXPECT_EQ(PipelineStartStatus(kStatusRangeNotSatisfiable, req), kStatusNotFound);
    EXPECT_EQ(PipelineStartStatus(kStatusNotFound, req), kStatusNotFound);

    Request plain;
    EXPECT_EQ(PipelineStartStatus(kStatusRangeNotSatisfiable, plain), kStatusRangeNotSatisfiable);
    EXPECT_EQ(PipelineStartStatus(500, plain), 500);
}

TEST_F(HostResponseTest, RangeRejectedByHostServesWholeFile) {
    for (const char* value : {"bytes=oops", "bytes=1-2,4-5", "bytes=-3", "bytes=9-3"}) {
        Request req = Make(Method::Get, "/data.txt");
        req.headers["Range"] = value;

        Response res = Serve(req, kStatusRangeNotSatisfiable);
        EXPECT_EQ(res.status, kStatusOk) << value;
        EXPECT_EQ(res.Header("Content-Range"), nullptr) << value;
        ASSERT_TRUE(res.body) << value;
        EXPECT_EQ(testutil::ReadAll(*res.body), kText) << value;
    }
}

TEST_F(HostResponseTest, RangeUnitRejectedByHostIsHonoured) {
    Request req = Make(Method::Get, "/data.txt");
    req.headers["Range"] = "items=1-2";

    Response res = Serve(req, kStatusRangeNotSatisfiable);
    EXPECT_EQ(res.status, kStatusPartialContent);
    ASSERT_NE(res.Header("Content-Range"), nullptr);
    EXPECT_EQ(*res.Header("Content-Range"), "items 1-2/16");
    ASSERT_TRUE(res.body);
    EXPECT_EQ(testutil::ReadAll(*res.body), "12");
}

TEST_F(HostResponseTest, FullBodyIsSized) {
    Response res = Serve(Make(Method::Get, "/data.txt"));
    const HostResponse plan = PlanHostResponse(Make(Method::Get, "/data.txt"), res);

    EXPECT_EQ(plan.status, kStatusOk);
    EXPECT_EQ(plan.body, BodyMode::Sized);
    EXPECT_EQ(plan.length, kText.size());
    ASSERT_TRUE(plan.content_type.has_value());
    EXPECT_EQ(*plan.content_type, "text/plain; charset=utf-8");
    EXPECT_EQ(FindHeader(plan, "Content-Length"), nullptr);
    EXPECT_EQ(FindHeader(plan, "Content-Type"), nullptr);
    ASSERT_NE(FindHeader(plan, "Last-Modified"), nullptr);
    EXPECT_EQ(*FindHeader(plan, "Last-Modified"), FormatHttpDate(kMtime));
}

TEST_F(HostResponseTest, PartialBodyIsSizedToRange) {
    Request req = Make(Method::Get, "/data.txt");
    req.headers["Range"] = "bytes=2-5";
    Response res = Serve(req);
    const HostResponse plan = PlanHostResponse(req, res);

    EXPECT_EQ(plan.status, kStatusPartialContent);
    EXPECT_EQ(plan.body, BodyMode::Sized);
    EXPECT_EQ(plan.length, 4u);
    ASSERT_NE(FindHeader(plan, "Content-Range"), nullptr);
    EXPECT_EQ(*FindHeader(plan, "Content-Range"), "bytes 2-5/16");
}

TEST_F(HostResponseTest, GzipBodyIsChunked) {
    Request req = Make(Method::Get, "/data.txt");
    req.headers["Accept-Encoding"] = "gzip";
    Response res = Serve(req);
    const HostResponse plan = PlanHostResponse(req, res);

    EXPECT_EQ(plan.body, BodyMode::Chunked);
    EXPECT_EQ(FindHeader(plan, "Content-Length"), nullptr);
    ASSERT_NE(FindHeader(plan, "Content-Encoding"), nullptr);
    EXPECT_EQ(*FindHeader(plan, "Content-Encoding"), "gzip");
}

TEST_F(HostResponseTest, HeadPassesLengthThroughWithoutBody) {
    const Request req = Make(Method::Head, "/data.txt");
    Response res = Serve(req);
    const HostResponse plan = PlanHostResponse(req, res);

    EXPECT_EQ(plan.status, kStatusOk);
    EXPECT_EQ(plan.body, BodyMode::None);
    ASSERT_NE(FindHeader(plan, "Content-Length"), nullptr);
    EXPECT_EQ(*FindHeader(plan, "Content-Length"), "16");
    ASSERT_TRUE(plan.content_type.has_value());
}

TEST_F(HostResponseTest, NotModifiedHasNoBodyOrLength) {
    Request req = Make(Method::Get, "/data.txt");
    req.headers["If-Modified-Since"] = FormatHttpDate(kMtime);
    Response res = Serve(req);
    const HostResponse plan = PlanHostResponse(req, res);

    EXPECT_EQ(plan.status, kStatusNotModified);
    EXPECT_EQ(plan.body, BodyMode::None);
    EXPECT_EQ(FindHeader(plan, "Content-Length"), nullptr);
    EXPECT_TRUE(plan.content_type.has_value());
}

TEST_F(HostResponseTest, EmptyFileSendsZeroLength) {
    const Request req = Make(Method::Get, "/empty.txt");
    Response res = Serve(req);
    const HostResponse plan = PlanHostResponse(req, res);

    EXPECT_EQ(plan.status, kStatusOk);
    EXPECT_EQ(plan.body, BodyMode::None);
    ASSERT_NE(FindHeader(plan, "Content-Length"), nullptr);
    EXPECT_EQ(*FindHeader(plan, "Content-Length"), "0");
}

TEST_F(HostResponseTest, FileWithoutExtensionHasNoContentType) {
    const Request req = Make(Method::Get, "/LICENSE");
    Response res = Serve(req);
    const HostResponse plan = PlanHostResponse(req, res);

    EXPECT_EQ(plan.body, BodyMode::Sized);
    EXPECT_FALSE(plan.content_type.has_value());
}

TEST(HostResponsePlanTest, ForbiddenHasNoBody) {
    Request req;
    Response res;
    res.status = kStatusForbidden;
    const HostResponse plan = PlanHostResponse(req, res);

    EXPECT_EQ(plan.status, kStatusForbidden);
    EXPECT_EQ(plan.body, BodyMode::None);
    EXPECT_TRUE(plan.headers.empty());
    EXPECT_FALSE(plan.content_type.has_value());
}

} // namespace staticfs
