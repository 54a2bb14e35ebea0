#include <gtest/gtest.h>
#include "llmtools/tool_registry.hpp"
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace llmtools;

namespace {

ToolDefinition def(const std::string& name, const std::string& description = "") {
    ToolDefinition d;
    d.name = name;
    d.description = description;
    return d;
}

ToolHandler constant(const std::string& text) {
    return [text](const nlohmann::json&) { return text; };
}

} // anonymous namespace

TEST(ToolRegistry, EmptyInitially) {
    ToolRegistry r;
    EXPECT_EQ(r.size(), 0u);
    EXPECT_TRUE(r.list().empty());
    EXPECT_FALSE(r.find("x").has_value());
}

TEST(ToolRegistry, AddAndFind) {
    ToolRegistry r;
    r.add(def("echo"), constant("hello"));
    EXPECT_TRUE(r.contains("echo"));
    auto h = r.find("echo");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ((*h)(nlohmann::json::object()), "hello");
}

TEST(ToolRegistry, AddOverwritesByName) {
    ToolRegistry r;
    r.add(def("t", "first"), constant("1"));
    r.add(def("t", "second"), constant("2"));
    EXPECT_EQ(r.size(), 1u);
    EXPECT_EQ((*r.find("t"))(nullptr), "2");
    EXPECT_EQ(r.list().front().description, "second");
}

TEST(ToolRegistry, Remove) {
    ToolRegistry r;
    r.add(def("t"), constant("1"));
    EXPECT_TRUE(r.remove("t"));
    EXPECT_FALSE(r.remove("t"));
    EXPECT_FALSE(r.contains("t"));
}

TEST(ToolRegistry, ListReturnsAllDefinitions) {
    ToolRegistry r;
    r.add(def("a"), constant("a"));
    r.add(def("b"), constant("b"));
    r.add(def("c"), constant("c"));

    auto tools = r.list();
    std::vector<std::string> names;
    for (const auto& t : tools) names.push_back(t.name);
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(ToolRegistry, RejectsEmptyNameOrHandler) {
    ToolRegistry r;
    EXPECT_THROW(r.add(def(""), constant("x")), std::invalid_argument);
    EXPECT_THROW(r.add(def("t"), ToolHandler()), std::invalid_argument);
    EXPECT_EQ(r.size(), 0u);
}

TEST(ToolRegistry, FoundHandlerOutlivesRemoval) {
    ToolRegistry r;
    r.add(def("t"), constant("still here"));
    auto h = r.find("t");
    r.remove("t");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ((*h)(nullptr), "still here");
}

TEST(ToolRegistry, ConcurrentReadersAndWriters) {
    ToolRegistry r;
    r.add(def("stable"), constant("s"));

    std::atomic<bool> stop{false};
    std::atomic<int> lookups{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop) {
                if (r.find("stable")) ++lookups;
                (void)r.list();
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        std::string name = "t" + std::to_string(i % 10);
        r.add(def(name), constant(name));
        if (i % 3 == 0) r.remove(name);
    }
    stop = true;
    for (auto& t : readers) t.join();

    EXPECT_TRUE(r.contains("stable"));
    EXPECT_GT(lookups.load(), 0);
}
