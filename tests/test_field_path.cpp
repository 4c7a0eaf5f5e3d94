/**
 * @file test_field_path.cpp
 * @brief Tests for affinity key extraction over protobuf reflection.
 *
 * Validates:
 *  - Nested string and integer leaves, proto and lowerCamel field names
 *  - Every failure yields "" plus one key_resolution_failed diagnostic
 *  - Extraction never mutates the message (no sub-message materialization)
 *  - Compile errors are reported before any message is seen
 */

#include <gtest/gtest.h>
#include <string>

#include "sticky/demo/session.pb.h"
#include "sticky/message/field_path.hpp"
#include "test_support.hpp"

using sticky::message::AffinityKeyResolver;
using sticky::message::FieldPath;
using sticky::message::PathError;
using sticky::message::resolve_affinity_key;
using sticky::message::split_path;
using sticky::testing::RecordingObserver;
namespace demo = sticky::demo;

static demo::ExecuteSqlRequest sample_request() {
  demo::ExecuteSqlRequest req;
  req.set_session("sessions/alpha");
  req.set_sql("SELECT 1");
  req.mutable_header()->mutable_session()->set_name("sessions/nested");
  req.mutable_header()->mutable_session()->set_shard(42);
  req.mutable_header()->set_trace_id("trace-7");
  req.add_params("p0");
  return req;
}

// --------------------------- split_path ------------------------------------

/**
 * @test Split_Preserves_Empty_Segments
 * @brief Empty segments survive splitting so they can be rejected later.
 */
TEST(FieldPath, Split_Preserves_Empty_Segments) {
  EXPECT_TRUE(split_path("").empty());
  EXPECT_EQ(split_path("a").size(), 1u);
  auto parts = split_path("a..b");
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_TRUE(parts[1].empty());
  EXPECT_EQ(parts[2], "b");
  EXPECT_EQ(split_path(".a").size(), 2u);
  EXPECT_EQ(split_path("a.").size(), 2u);
}

// --------------------------- Successful resolution -------------------------

/**
 * @test Resolve_Top_Level_String
 * @brief Single-segment path returns the field's string value.
 */
TEST(FieldPath, Resolve_Top_Level_String) {
  RecordingObserver obs;
  auto req = sample_request();
  EXPECT_EQ(resolve_affinity_key(&req, "session", &obs), "sessions/alpha");
  EXPECT_EQ(obs.snapshot().key_resolution_failures, 0u);
}

/**
 * @test Resolve_Nested_String
 * @brief Dotted path walks sub-messages.
 */
TEST(FieldPath, Resolve_Nested_String) {
  RecordingObserver obs;
  auto req = sample_request();
  EXPECT_EQ(resolve_affinity_key(&req, "header.session.name", &obs), "sessions/nested");
}

/**
 * @test Resolve_Integer_Leaf_As_Decimal
 * @brief Integer leaves are rendered in decimal.
 */
TEST(FieldPath, Resolve_Integer_Leaf_As_Decimal) {
  RecordingObserver obs;
  auto req = sample_request();
  EXPECT_EQ(resolve_affinity_key(&req, "header.session.shard", &obs), "42");
}

/**
 * @test Resolve_Camel_Case_Segment
 * @brief lowerCamelCase names (JSON mapping) are accepted.
 */
TEST(FieldPath, Resolve_Camel_Case_Segment) {
  RecordingObserver obs;
  auto req = sample_request();
  EXPECT_EQ(resolve_affinity_key(&req, "header.traceId", &obs), "trace-7");
}

// --------------------------- Failures --------------------------------------

/**
 * @test Resolve_Failures_Return_Empty
 * @brief Each malformed path or missing value yields "" and one diagnostic.
 */
TEST(FieldPath, Resolve_Failures_Return_Empty) {
  const char* bad_paths[] = {
    "",                        // zero-length path is never identity
    "header..session",         // empty segment
    ".session",
    "session.",
    "nope",                    // unknown field
    "sql.length",              // scalar in the middle
    "params",                  // repeated leaf
    "header.session.labels",   // map leaf
    "header",                  // message leaf
  };
  auto req = sample_request();
  for (const char* p : bad_paths) {
    RecordingObserver obs;
    EXPECT_EQ(resolve_affinity_key(&req, p, &obs), "") << "path=" << p;
    EXPECT_EQ(obs.snapshot().key_resolution_failures, 1u) << "path=" << p;
  }
}

/**
 * @test Resolve_Null_Message
 * @brief Absent message behaves like an absent field.
 */
TEST(FieldPath, Resolve_Null_Message) {
  RecordingObserver obs;
  EXPECT_EQ(resolve_affinity_key(nullptr, "session", &obs), "");
  EXPECT_EQ(obs.snapshot().key_resolution_failures, 1u);
}

/**
 * @test Resolve_Unset_Intermediate_Is_Absent_And_Not_Created
 * @brief An unset sub-message fails resolution and is not materialized.
 */
TEST(FieldPath, Resolve_Unset_Intermediate_Is_Absent_And_Not_Created) {
  RecordingObserver obs;
  demo::ExecuteSqlRequest req;
  req.set_session("s");
  const std::string before = req.SerializeAsString();

  EXPECT_EQ(resolve_affinity_key(&req, "header.session.name", &obs), "");
  EXPECT_FALSE(req.has_header());
  EXPECT_EQ(req.SerializeAsString(), before);

  auto ev = obs.events();
  ASSERT_EQ(ev.size(), 1u);
  EXPECT_EQ(ev[0].kind, sticky::obs::EventKind::KeyResolutionFailed);
  EXPECT_EQ(ev[0].field_path, "header.session.name");
  EXPECT_EQ(ev[0].reason, sticky::message::to_string(PathError::AbsentMessage));
}

/**
 * @test Resolve_Empty_String_Value_Fails
 * @brief An unset/empty string leaf is not a usable key.
 */
TEST(FieldPath, Resolve_Empty_String_Value_Fails) {
  RecordingObserver obs;
  demo::Session s;
  EXPECT_EQ(resolve_affinity_key(&s, "name", &obs), "");
  EXPECT_EQ(obs.snapshot().key_resolution_failures, 1u);
}

// --------------------------- Compilation -----------------------------------

/**
 * @test Compile_Reports_Structural_Errors
 * @brief FieldPath::compile rejects paths that cannot fit the schema.
 */
TEST(FieldPath, Compile_Reports_Structural_Errors) {
  const auto* d = demo::ExecuteSqlRequest::descriptor();

  auto expect_err = [&](const char* path, PathError want) {
    auto fp = FieldPath::compile(d, path);
    ASSERT_FALSE(fp.has_value()) << path;
    EXPECT_EQ(fp.error(), want) << path;
  };
  expect_err("",                      PathError::Empty);
  expect_err("a..b",                  PathError::EmptySegment);
  expect_err("missing",               PathError::UnknownField);
  expect_err("sql.x",                 PathError::NotAMessage);
  expect_err("params",                PathError::RepeatedField);
  expect_err("header",                PathError::UnsupportedLeaf);

  std::string deep = "header";
  for (int i = 0; i < 20; ++i) deep += ".session";
  expect_err(deep.c_str(),            PathError::TooDeep);

  auto none = FieldPath::compile(nullptr, "session");
  ASSERT_FALSE(none.has_value());
  EXPECT_EQ(none.error(), PathError::NoSchema);
}

/**
 * @test Compile_Then_Extract
 * @brief A compiled path reports its depth and extracts repeatedly.
 */
TEST(FieldPath, Compile_Then_Extract) {
  auto fp = FieldPath::compile(demo::ExecuteSqlRequest::descriptor(), "header.session.name");
  ASSERT_TRUE(fp.has_value());
  EXPECT_EQ(fp->depth(), 3u);
  EXPECT_EQ(fp->root(), demo::ExecuteSqlRequest::descriptor());

  auto req = sample_request();
  for (int i = 0; i < 3; ++i) {
    auto key = fp->extract(req);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, "sessions/nested");
  }
}

// --------------------------- Resolver --------------------------------------

/**
 * @test Resolver_Serves_Several_Message_Types
 * @brief One configured path is compiled per message type it meets.
 */
TEST(AffinityKeyResolver, Resolver_Serves_Several_Message_Types) {
  RecordingObserver obs;
  AffinityKeyResolver resolver("name");

  demo::Session s;
  s.set_name("sessions/1");
  demo::DeleteSessionRequest d;
  d.set_name("sessions/2");

  EXPECT_EQ(resolver.resolve(&s, &obs), "sessions/1");
  EXPECT_EQ(resolver.resolve(&d, &obs), "sessions/2");
  EXPECT_EQ(resolver.resolve(&s, &obs), "sessions/1");
  EXPECT_EQ(obs.snapshot().key_resolution_failures, 0u);
}

/**
 * @test Resolver_Prepare_Validates_Early
 * @brief prepare() surfaces schema mismatches before the first call.
 */
TEST(AffinityKeyResolver, Resolver_Prepare_Validates_Early) {
  AffinityKeyResolver ok("name");
  EXPECT_TRUE(ok.prepare(demo::Session::descriptor()).has_value());

  AffinityKeyResolver bad("session.name");
  auto r = bad.prepare(demo::ExecuteSqlRequest::descriptor());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), PathError::NotAMessage);
}

/**
 * @test Resolver_Labels_Diagnostics_With_Method
 * @brief Failure diagnostics carry the method path given by the caller.
 */
TEST(AffinityKeyResolver, Resolver_Labels_Diagnostics_With_Method) {
  RecordingObserver obs;
  AffinityKeyResolver resolver("missing");
  demo::Session s;
  s.set_name("x");

  EXPECT_EQ(resolver.resolve(&s, &obs, sticky::testing::kExecute), "");
  EXPECT_EQ(resolver.resolve(&s, &obs, sticky::testing::kExecute), "");

  auto ev = obs.events();
  ASSERT_EQ(ev.size(), 2u);
  EXPECT_EQ(ev[0].method_path, sticky::testing::kExecute);
  EXPECT_EQ(ev[0].reason, sticky::message::to_string(PathError::UnknownField));
}
