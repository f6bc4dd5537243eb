#include <gtest/gtest.h>
#include "pow_middleware.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include "solver.hpp"

using namespace powgate;

namespace {

// sha256("data11111nonce"), six leading zero bits.
const std::string DATA11111_HASH = "024b6380e07b20023e1b986b250b09bcfaa4551510ac4903a9b052e2b2cf9019";

PowOptions header_options(int difficulty) {
    PowOptions opts;
    opts.difficulty = difficulty;
    opts.extract_data = [](RequestContext& ctx) { return ctx.header("X-Data"); };
    return opts;
}

}

class PowMiddlewareTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset();
    }

    http::request<http::string_body> req{http::verb::get, "/", 11};
};

TEST(BodyFormatTest, Negotiation) {
    EXPECT_EQ(negotiate_body_format(""), BodyFormat::Json);
    EXPECT_EQ(negotiate_body_format("application/json"), BodyFormat::Json);
    EXPECT_EQ(negotiate_body_format("*/*"), BodyFormat::Json);
    EXPECT_EQ(negotiate_body_format("application/*"), BodyFormat::Json);
    EXPECT_EQ(negotiate_body_format("application/xml"), BodyFormat::Xml);
    EXPECT_EQ(negotiate_body_format("text/xml"), BodyFormat::Xml);
    EXPECT_EQ(negotiate_body_format("text/html"), BodyFormat::Unacceptable);
    EXPECT_EQ(negotiate_body_format("text/html, application/xml;q=0.9"), BodyFormat::Xml);
    EXPECT_EQ(negotiate_body_format("application/json;q=0.5, application/xml"), BodyFormat::Xml);
    EXPECT_EQ(negotiate_body_format("application/json, application/xml"), BodyFormat::Json);
    EXPECT_EQ(negotiate_body_format("application/json;q=0"), BodyFormat::Unacceptable);
    EXPECT_EQ(negotiate_body_format(" Application/JSON "), BodyFormat::Json);
}

TEST_F(PowMiddlewareTest, ConstructionValidatesOptions) {
    EXPECT_THROW(PowMiddleware bad{PowOptions{}}, ConfigurationError);
    PowMiddleware pow(header_options(5));
    EXPECT_EQ(pow.difficulty(), 5);
}

TEST_F(PowMiddlewareTest, IssuesJsonBody) {
    PowOptions opts = header_options(7);
    opts.check = true;
    opts.secret = "secret";
    PowMiddleware pow(std::move(opts));
    RequestContext ctx(req);

    pow.handle_nonce_request(ctx);
    ASSERT_FALSE(ctx.is_aborted());
    EXPECT_EQ(ctx.response().result_int(), 200u);
    EXPECT_EQ(ctx.response()[http::field::content_type], "application/json");

    json::object body = json::parse(ctx.response().body()).as_object();
    std::string nonce(body.at("nonce").as_string());
    EXPECT_EQ(nonce.size(), DEFAULT_NONCE_LENGTH);
    EXPECT_EQ(body.at("difficulty").as_int64(), 7);
    EXPECT_EQ(std::string(body.at("nonce_checksum").as_string()),
              InputValidator::hex_encode(ChecksumEngine::compute("secret", nonce)));
}

TEST_F(PowMiddlewareTest, JsonBodyOmitsChecksumWhenUnchecked) {
    PowMiddleware pow(header_options(3));
    RequestContext ctx(req);
    pow.handle_nonce_request(ctx);

    json::object body = json::parse(ctx.response().body()).as_object();
    EXPECT_TRUE(body.contains("nonce"));
    EXPECT_FALSE(body.contains("nonce_checksum"));
}

TEST_F(PowMiddlewareTest, IssuesXmlBody) {
    PowOptions opts = header_options(4);
    opts.nonce_generator = [](std::size_t len) { return std::string(len, 'x'); };
    PowMiddleware pow(std::move(opts));
    req.set(http::field::accept, "application/xml");
    RequestContext ctx(req);

    pow.handle_nonce_request(ctx);
    EXPECT_EQ(ctx.response().result_int(), 200u);
    EXPECT_EQ(ctx.response()[http::field::content_type], "application/xml; charset=utf-8");
    EXPECT_NE(ctx.response().body().find("<nonce>xxxxxxxxxx</nonce>"), std::string::npos);
    EXPECT_NE(ctx.response().body().find("<difficulty>4</difficulty>"), std::string::npos);
}

TEST_F(PowMiddlewareTest, UnacceptableFormatIs406) {
    PowMiddleware pow(header_options(4));
    req.set(http::field::accept, "text/html");
    RequestContext ctx(req);

    pow.handle_nonce_request(ctx);
    EXPECT_TRUE(ctx.is_aborted());
    EXPECT_EQ(ctx.response().result_int(), 406u);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("pow_nonces_issued"), 0.0);
}

TEST_F(PowMiddlewareTest, CustomDataKeys) {
    PowOptions opts = header_options(2);
    opts.nonce_data_key = "challenge";
    opts.hash_difficulty_data_key = "bits";
    PowMiddleware pow(std::move(opts));
    RequestContext ctx(req);

    pow.handle_nonce_request(ctx);
    json::object body = json::parse(ctx.response().body()).as_object();
    EXPECT_TRUE(body.contains("challenge"));
    EXPECT_EQ(body.at("bits").as_int64(), 2);
}

TEST_F(PowMiddlewareTest, IssuesHeaders) {
    PowOptions opts = header_options(9);
    opts.check = true;
    opts.secret = "secret";
    PowMiddleware pow(std::move(opts));
    RequestContext ctx(req);

    pow.set_nonce_headers(ctx);
    auto& res = ctx.response();
    std::string nonce(res["X-Nonce"]);
    EXPECT_EQ(nonce.size(), DEFAULT_NONCE_LENGTH);
    EXPECT_EQ(res["X-Hash-Difficulty"], "9");
    EXPECT_EQ(std::string(res["X-Nonce-Checksum"]),
              InputValidator::hex_encode(ChecksumEngine::compute("secret", nonce)));
}

TEST_F(PowMiddlewareTest, HeadersOmitChecksumWhenUnchecked) {
    PowMiddleware pow(header_options(9));
    RequestContext ctx(req);
    pow.set_nonce_headers(ctx);
    EXPECT_TRUE(ctx.response().find("X-Nonce-Checksum") == ctx.response().end());
}

TEST_F(PowMiddlewareTest, GeneratedNonceIsReusedByLaterSteps) {
    PowOptions opts = header_options(1);
    opts.check = true;
    opts.secret = "secret";
    PowMiddleware pow(std::move(opts));
    RequestContext ctx(req);

    pow.generate_nonce(ctx);
    ASSERT_TRUE(ctx.values().contains("nonce"));
    std::string nonce(ctx.values().at("nonce").as_string());
    EXPECT_EQ(ctx.values().at("hashDifficulty").as_int64(), 1);
    EXPECT_TRUE(ctx.values().contains("nonceChecksum"));

    pow.set_nonce_headers(ctx);
    pow.handle_nonce_request(ctx);

    json::object body = json::parse(ctx.response().body()).as_object();
    EXPECT_EQ(std::string(ctx.response()["X-Nonce"]), nonce);
    EXPECT_EQ(std::string(body.at("nonce").as_string()), nonce);
    EXPECT_EQ(std::string(body.at("nonce_checksum").as_string()),
              std::string(ctx.values().at("nonceChecksum").as_string()));
    EXPECT_EQ(MetricsRegistry::instance().get_counter("pow_nonces_issued"), 1.0);
}

TEST_F(PowMiddlewareTest, EachRequestGetsItsOwnNonce) {
    PowMiddleware pow(header_options(1));
    http::request<http::string_body> other{http::verb::get, "/", 11};
    RequestContext a(req);
    RequestContext b(other);

    pow.set_nonce_headers(a);
    pow.set_nonce_headers(b);
    EXPECT_NE(a.response()["X-Nonce"], b.response()["X-Nonce"]);
}

TEST_F(PowMiddlewareTest, IssuanceFailureIs500) {
    PowOptions opts = header_options(1);
    opts.nonce_generator = [](std::size_t) -> std::string { throw std::runtime_error("entropy exhausted"); };
    PowMiddleware pow(std::move(opts));

    RequestContext ctx(req);
    pow.handle_nonce_request(ctx);
    EXPECT_TRUE(ctx.is_aborted());
    EXPECT_EQ(ctx.response().result_int(), 500u);
    ASSERT_EQ(ctx.errors().size(), 1u);
    EXPECT_EQ(ctx.errors()[0], "entropy exhausted");

    http::request<http::string_body> other{http::verb::get, "/", 11};
    RequestContext gen_ctx(other);
    pow.generate_nonce(gen_ctx);
    EXPECT_EQ(gen_ctx.response().result_int(), 500u);
    EXPECT_FALSE(gen_ctx.values().contains("nonce"));
    EXPECT_EQ(MetricsRegistry::instance().get_counter("pow_issuance_failures"), 2.0);
}

TEST_F(PowMiddlewareTest, AcceptsValidProof) {
    PowMiddleware pow(header_options(6));
    req.set("X-Nonce", "nonce");
    req.set("X-Data", "data11111");
    req.set("X-Hash", DATA11111_HASH);
    RequestContext ctx(req);

    EXPECT_TRUE(pow.verify_request(ctx));
    EXPECT_FALSE(ctx.is_aborted());
    EXPECT_EQ(MetricsRegistry::instance().get_counter("pow_verify_accepted"), 1.0);
}

TEST_F(PowMiddlewareTest, MalformedRequestIs400WithoutHook) {
    bool hook_called = false;
    PowOptions opts = header_options(0);
    opts.on_failed_verification = [&](RequestContext&, const VerificationError&) { hook_called = true; };
    PowMiddleware pow(std::move(opts));
    req.set("X-Hash", "ff");
    RequestContext ctx(req);

    EXPECT_FALSE(pow.verify_request(ctx));
    EXPECT_TRUE(ctx.is_aborted());
    EXPECT_EQ(ctx.response().result_int(), 400u);
    EXPECT_EQ(ctx.response().body(), "no nonce in request");
    EXPECT_FALSE(hook_called);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("pow_verify_malformed"), 1.0);
}

TEST_F(PowMiddlewareTest, NonHexHashIs400) {
    PowMiddleware pow(header_options(0));
    req.set("X-Nonce", "nonce");
    req.set("X-Hash", "xyz!");
    RequestContext ctx(req);

    EXPECT_FALSE(pow.verify_request(ctx));
    EXPECT_EQ(ctx.response().result_int(), 400u);
    EXPECT_EQ(ctx.response().body(), "received hash is not a valid hex string");
}

TEST_F(PowMiddlewareTest, ExtractionFailureIs500WithoutHook) {
    bool hook_called = false;
    PowOptions opts;
    opts.extract_all = [](RequestContext&) -> Extraction { throw std::runtime_error("backend down"); };
    opts.on_failed_verification = [&](RequestContext&, const VerificationError&) { hook_called = true; };
    PowMiddleware pow(std::move(opts));
    RequestContext ctx(req);

    EXPECT_FALSE(pow.verify_request(ctx));
    EXPECT_EQ(ctx.response().result_int(), 500u);
    EXPECT_FALSE(hook_called);
    ASSERT_EQ(ctx.errors().size(), 1u);
    EXPECT_EQ(ctx.errors()[0], "backend down");
    EXPECT_EQ(MetricsRegistry::instance().get_counter("pow_verify_extraction_failed"), 1.0);
}

TEST_F(PowMiddlewareTest, ExtractorResponseIsKept) {
    PowOptions opts;
    opts.extract_all = [](RequestContext& ctx) -> Extraction {
        ctx.abort_with_status(413, "too large");
        throw ExtractionError("body too large");
    };
    PowMiddleware pow(std::move(opts));
    RequestContext ctx(req);

    EXPECT_FALSE(pow.verify_request(ctx));
    EXPECT_EQ(ctx.response().result_int(), 413u);
    EXPECT_EQ(ctx.response().body(), "too large");
}

TEST_F(PowMiddlewareTest, DifficultyNotMetIs428) {
    PowMiddleware pow(header_options(7));
    req.set("X-Nonce", "nonce");
    req.set("X-Data", "data11111");
    req.set("X-Hash", DATA11111_HASH);
    RequestContext ctx(req);

    EXPECT_FALSE(pow.verify_request(ctx));
    EXPECT_EQ(ctx.response().result_int(), 428u);
    EXPECT_NE(ctx.response().body().find("hash does not meet difficulty"), std::string::npos);
    EXPECT_EQ(ctx.response().body().find("data11111"), std::string::npos);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("pow_verify_difficulty_not_met"), 1.0);
}

TEST_F(PowMiddlewareTest, InvalidChecksumIs428) {
    PowOptions opts = header_options(0);
    opts.check = true;
    opts.secret = "secret";
    PowMiddleware pow(std::move(opts));
    req.set("X-Nonce", "nonce");
    req.set("X-Nonce-Checksum", "00");
    req.set("X-Hash", "ff");
    RequestContext ctx(req);

    EXPECT_FALSE(pow.verify_request(ctx));
    EXPECT_EQ(ctx.response().result_int(), 428u);
    EXPECT_NE(ctx.response().body().find("invalid nonce checksum"), std::string::npos);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("pow_verify_checksum_invalid"), 1.0);
}

TEST_F(PowMiddlewareTest, CustomFailureStatus) {
    PowOptions opts = header_options(7);
    opts.failure_status_code = 403;
    PowMiddleware pow(std::move(opts));
    req.set("X-Nonce", "nonce");
    req.set("X-Hash", "ff");
    RequestContext ctx(req);

    EXPECT_FALSE(pow.verify_request(ctx));
    EXPECT_EQ(ctx.response().result_int(), 403u);
}

TEST_F(PowMiddlewareTest, CustomHookReceivesError) {
    VerificationError seen;
    PowOptions opts = header_options(7);
    opts.on_failed_verification = [&](RequestContext& ctx, const VerificationError& err) {
        seen = err;
        ctx.abort_with_status(429, "slow down");
    };
    PowMiddleware pow(std::move(opts));
    req.set("X-Nonce", "nonce");
    req.set("X-Hash", "ff");
    RequestContext ctx(req);

    EXPECT_FALSE(pow.verify_request(ctx));
    EXPECT_EQ(ctx.response().result_int(), 429u);
    EXPECT_EQ(ctx.response().body(), "slow down");
    EXPECT_EQ(seen.nonce, "nonce");
    EXPECT_EQ(seen.hash, "ff");
    EXPECT_EQ(seen.difficulty, 7);
    EXPECT_EQ(seen.reason, "hash does not meet difficulty");
}

TEST_F(PowMiddlewareTest, HookThatDoesNotAbortStillStopsPipeline) {
    PowOptions opts = header_options(7);
    opts.on_failed_verification = [](RequestContext& ctx, const VerificationError&) {
        ctx.response().result(http::status::forbidden);
    };
    PowMiddleware pow(std::move(opts));
    req.set("X-Nonce", "nonce");
    req.set("X-Hash", "ff");
    RequestContext ctx(req);

    EXPECT_FALSE(pow.verify_request(ctx));
    EXPECT_TRUE(ctx.is_aborted());
    EXPECT_EQ(ctx.response().result_int(), 403u);
}

TEST_F(PowMiddlewareTest, IssueSolveVerifyRoundTrip) {
    PowOptions opts = header_options(8);
    opts.check = true;
    opts.verify_digest = true;
    PowMiddleware pow(std::move(opts));

    RequestContext issue_ctx(req);
    pow.set_nonce_headers(issue_ctx);
    std::string nonce(issue_ctx.response()["X-Nonce"]);
    std::string checksum(issue_ctx.response()["X-Nonce-Checksum"]);

    auto solution = solve(nonce, "order-17:", 8);
    ASSERT_TRUE(solution.has_value());

    http::request<http::string_body> verify_req{http::verb::post, "/", 11};
    verify_req.set("X-Nonce", nonce);
    verify_req.set("X-Nonce-Checksum", checksum);
    verify_req.set("X-Data", solution->data);
    verify_req.set("X-Hash", solution->hash_hex);
    RequestContext verify_ctx(verify_req);
    EXPECT_TRUE(pow.verify_request(verify_ctx));

    // Same proof presented for different data.
    http::request<http::string_body> forged_req = verify_req;
    forged_req.set("X-Data", "order-18:0");
    RequestContext forged_ctx(forged_req);
    EXPECT_FALSE(pow.verify_request(forged_ctx));
    EXPECT_EQ(forged_ctx.response().result_int(), 428u);
}

TEST_F(PowMiddlewareTest, NonceFromAnotherInstanceFailsChecksum) {
    PowOptions a = header_options(0);
    a.check = true;
    PowOptions b = a;
    PowMiddleware issuer(std::move(a));
    PowMiddleware verifier(std::move(b));

    RequestContext issue_ctx(req);
    issuer.set_nonce_headers(issue_ctx);

    http::request<http::string_body> verify_req{http::verb::post, "/", 11};
    verify_req.set("X-Nonce", std::string(issue_ctx.response()["X-Nonce"]));
    verify_req.set("X-Nonce-Checksum", std::string(issue_ctx.response()["X-Nonce-Checksum"]));
    verify_req.set("X-Hash", "ff");
    RequestContext verify_ctx(verify_req);

    EXPECT_TRUE(issuer.verify_request(verify_ctx));
    RequestContext cross_ctx(verify_req);
    EXPECT_FALSE(verifier.verify_request(cross_ctx));
    EXPECT_NE(cross_ctx.response().body().find("invalid nonce checksum"), std::string::npos);
}

TEST_F(PowMiddlewareTest, GeneratingTwiceReplacesStash) {
    PowMiddleware pow(header_options(1));
    RequestContext ctx(req);

    pow.generate_nonce(ctx);
    std::string first(ctx.values().at("nonce").as_string());
    pow.generate_nonce(ctx);
    std::string second(ctx.values().at("nonce").as_string());
    EXPECT_NE(first, second);

    pow.set_nonce_headers(ctx);
    EXPECT_EQ(std::string(ctx.response()["X-Nonce"]), second);
}
