#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "docgraph/annotate/payload.hpp"
#include "docgraph/test_support/parse_helpers.hpp"

using namespace docgraph;
using nlohmann::json;
using docgraph::test_support::index_source;

namespace
{

const char * const k_source = R"java(
package p;
import java.util.List;
public class Stack {
  private int size;
  public void push(int v) { size++; }
  public int pop() { return --size; }
  static class Node { }
}
)java";

Class & stack_class(Project & project)
{
  return *project.registry().lookup_class("p.Stack");
}

json good_response(std::string_view id)
{
  return json{
    {"id", id},
    {"description", "A stack."},
    {"confidence", 70},
    {"methods",
     json::array(
       {json{{"method_index", 0}, {"description", "Pushes."}, {"confidence", 60}},
        json{{"method_index", 1}, {"description", "Pops."}, {"confidence", 65}}})}};
}

}  // namespace

TEST(AnnotatePayload, ColdRequestSendsCodeAndEveryMethodSignature)
{
  auto project = index_source(k_source);
  Class & cls = stack_class(*project);

  const AnnotationRequest req = build_request(cls, project->files()[0]->imports);
  EXPECT_FALSE(req.warm);
  EXPECT_EQ(req.requested, (std::vector<size_t>{0, 1}));

  const json & p = req.payload;
  EXPECT_EQ(p["mode"], "cold");
  EXPECT_EQ(p["id"], "p.Stack");
  EXPECT_EQ(p["kind"], "class");
  EXPECT_EQ(p["signature"], "public class Stack");
  EXPECT_EQ(p["code"], cls.body);
  EXPECT_EQ(p["imports"], json::array({"java.util.List"}));
  EXPECT_EQ(p["methods"]["0"], "public void push(int v)");
  EXPECT_EQ(p["methods"]["1"], "public int pop()");
  EXPECT_FALSE(p.contains("regenerate"));
}

TEST(AnnotatePayload, WarmRequestRegeneratesOnlyDirtyMethods)
{
  auto project = index_source(k_source);
  Class & cls = stack_class(*project);
  cls.methods[0]->description = "Pushes a value.";
  cls.classes[0]->description = "A node.";

  const AnnotationRequest req = build_request(cls, project->files()[0]->imports);
  EXPECT_TRUE(req.warm);
  EXPECT_EQ(req.requested, (std::vector<size_t>{1}));

  const json & p = req.payload;
  EXPECT_EQ(p["mode"], "warm");
  EXPECT_FALSE(p.contains("code"));
  EXPECT_EQ(p["fields"], json::array({"private int size"}));
  EXPECT_EQ(p["cached"], json({{"0", "Pushes a value."}}));
  EXPECT_EQ(p["regenerate"], json({{"1", "{ return --size; }"}}));
  ASSERT_EQ(p["children"].size(), 1u);
  EXPECT_EQ(p["children"][0]["id"], "p.Stack.Node");
  EXPECT_EQ(p["children"][0]["description"], "A node.");
}

TEST(AnnotatePayload, NeedsAnnotation)
{
  auto project = index_source(k_source);
  Class & cls = stack_class(*project);
  EXPECT_TRUE(needs_annotation(cls));

  cls.description = "d";
  for (auto & m : cls.methods) m->description = "m";
  EXPECT_FALSE(needs_annotation(cls));

  cls.methods[1]->description.clear();
  EXPECT_TRUE(needs_annotation(cls));
}

TEST(AnnotatePayload, ValidResponseMerges)
{
  auto project = index_source(k_source);
  Class & cls = stack_class(*project);
  const AnnotationRequest req = build_request(cls, {});

  const ResponseCheck check = validate_response(good_response("p.Stack"), req);
  ASSERT_TRUE(check.success) << check.error;
  merge_annotation(req, check.annotation);

  EXPECT_EQ(cls.description, "A stack.");
  EXPECT_EQ(cls.confidence, 70);
  EXPECT_EQ(cls.annotation_status, AnnotationStatus::Ok);
  EXPECT_EQ(cls.methods[0]->description, "Pushes.");
  EXPECT_EQ(cls.methods[1]->confidence, 65);
}

TEST(AnnotatePayload, WarmMergeIgnoresEntriesThatWereNotRequested)
{
  auto project = index_source(k_source);
  Class & cls = stack_class(*project);
  cls.methods[0]->description = "cached push";
  const AnnotationRequest req = build_request(cls, {});

  const ResponseCheck check = validate_response(good_response("p.Stack"), req);
  ASSERT_TRUE(check.success) << check.error;
  merge_annotation(req, check.annotation);

  EXPECT_EQ(cls.methods[0]->description, "cached push");
  EXPECT_EQ(cls.methods[1]->description, "Pops.");
}

TEST(AnnotatePayload, SchemaMismatches)
{
  auto project = index_source(k_source);
  Class & cls = stack_class(*project);
  const AnnotationRequest req = build_request(cls, {});

  auto expect_mismatch = [&](const json & response) {
    const ResponseCheck check = validate_response(response, req);
    EXPECT_FALSE(check.success) << response.dump();
    EXPECT_EQ(check.error.rfind("schema mismatch", 0), 0u) << check.error;
  };

  expect_mismatch(json::array());
  expect_mismatch(good_response("p.Other"));

  json r = good_response("p.Stack");
  r["confidence"] = 101;
  expect_mismatch(r);

  r = good_response("p.Stack");
  r["confidence"] = "high";
  expect_mismatch(r);

  r = good_response("p.Stack");
  r.erase("description");
  expect_mismatch(r);

  r = good_response("p.Stack");
  r["methods"][0]["method_index"] = 2;
  expect_mismatch(r);

  r = good_response("p.Stack");
  r["methods"][1]["confidence"] = -1;
  expect_mismatch(r);

  r = good_response("p.Stack");
  r["methods"] = json::object();
  expect_mismatch(r);

  // Nothing was written by the failed checks.
  EXPECT_TRUE(cls.description.empty());
  EXPECT_EQ(cls.annotation_status, AnnotationStatus::Pending);
}
