// tests/unit/graph/test_graph_json.cpp - Unit tests for graph serialization
//

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "qk_graph/graph/graph_builder.hpp"
#include "qk_graph/graph/graph_json.hpp"

using namespace qk_graph;

namespace
{

Graph small_graph()
{
  CallSiteRecord declare;
  declare.relation = Relation::Declares;
  declare.operation = "useQuery";
  declare.file = "/virtual/app/src/todos.tsx";
  declare.line = 4;
  declare.column = 17;
  declare.queryKey = make_array_key({{"todos", true}}, MatchMode::Exact);
  declare.resolution = Resolution::Static;
  declare.declaresDirectly = true;

  return build_graph(
    {{"app", "/virtual/app"}}, {declare},
    {FileParseFailure{"/virtual/app/src/bad.ts", "Syntax error at 2:1"}});
}

}  // namespace

TEST(GraphJson, TopLevelShape)
{
  const nlohmann::json j = to_json(small_graph());

  ASSERT_TRUE(j.contains("nodes"));
  ASSERT_TRUE(j.contains("edges"));
  EXPECT_EQ(j["nodes"].size(), 3U);
  EXPECT_EQ(j["edges"].size(), 2U);
  EXPECT_EQ(j["summary"]["files"], 1);
  EXPECT_EQ(j["summary"]["actions"], 1);
  EXPECT_EQ(j["summary"]["queryKeys"], 1);
  EXPECT_EQ(j["summary"]["parseErrors"], 1);
  EXPECT_EQ(j["parseErrors"][0]["file"], "src/bad.ts");
  EXPECT_EQ(j["parseErrors"][0]["message"], "Syntax error at 2:1");
}

TEST(GraphJson, NodeFields)
{
  const nlohmann::json j = to_json(small_graph());

  const nlohmann::json & file = j["nodes"][0];
  EXPECT_EQ(file["kind"], "file");
  EXPECT_EQ(file["label"], "src/todos.tsx");
  EXPECT_EQ(file["file"], "/virtual/app/src/todos.tsx");
  EXPECT_FALSE(file.contains("loc"));
  EXPECT_EQ(file["metrics"]["affectedKeys"], 1);

  const nlohmann::json & action = j["nodes"][1];
  EXPECT_EQ(action["kind"], "action");
  EXPECT_EQ(action["label"], "useQuery");
  EXPECT_EQ(action["loc"]["line"], 4);
  EXPECT_EQ(action["loc"]["column"], 17);
  EXPECT_EQ(action["metrics"]["relation"], "declares");
  EXPECT_EQ(action["metrics"]["declaresDirectly"], 1);

  const nlohmann::json & key = j["nodes"][2];
  EXPECT_EQ(key["id"], "qk:app:src::todos");
  EXPECT_EQ(key["kind"], "queryKey");
  EXPECT_EQ(key["resolution"], "static");
  EXPECT_FALSE(key.contains("file"));
  EXPECT_EQ(key["metrics"]["matchMode"], "exact");
  EXPECT_EQ(key["metrics"]["rootSegment"], "todos");
  EXPECT_EQ(key["metrics"]["projectScope"], "app:src");
}

TEST(GraphJson, EdgeFields)
{
  const nlohmann::json j = to_json(small_graph());
  const nlohmann::json & edge = j["edges"][1];
  EXPECT_EQ(edge["relation"], "declares");
  EXPECT_EQ(edge["resolution"], "static");
  EXPECT_EQ(edge["target"], "qk:app:src::todos");
  EXPECT_EQ(
    edge["id"].get<std::string>(),
    edge["source"].get<std::string>() + "->qk:app:src::todos:declares");
}

TEST(GraphJson, KeyAndRecord)
{
  const NormalizedKey key = make_array_key({{"todos", true}, {"$id", false}}, MatchMode::Prefix);
  const nlohmann::json jk = to_json(key);
  EXPECT_EQ(jk["id"], "todos|$id");
  EXPECT_EQ(jk["display"], "[todos, $id]");
  EXPECT_EQ(jk["segments"], nlohmann::json::array({"todos", "$id"}));
  EXPECT_EQ(jk["matchMode"], "prefix");
  EXPECT_EQ(jk["resolution"], "dynamic");
  EXPECT_EQ(jk["source"], "expression");

  CallSiteRecord rec;
  rec.relation = Relation::Removes;
  rec.operation = "removeQueries";
  rec.file = "/virtual/a.ts";
  rec.queryKey = key;
  const nlohmann::json jr = to_json(rec);
  EXPECT_EQ(jr["relation"], "removes");
  EXPECT_EQ(jr["operation"], "removeQueries");
  EXPECT_EQ(jr["loc"]["line"], 1);
  EXPECT_EQ(jr["queryKey"]["id"], "todos|$id");
  EXPECT_EQ(jr["declaresDirectly"], false);
}
