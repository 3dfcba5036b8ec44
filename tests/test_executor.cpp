#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/issues.hpp"
#include "operation_graph/compiler.hpp"
#include "operation_graph/executor.hpp"
#include "structure_graph/graph_builder.hpp"

using namespace MLC;
using namespace MLC::Operations;
using nlohmann::json;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

// Mock operation to observe calls and inputs
// Opération mock pour observer les appels et les entrées
class MockOperation : public Operation {
public:
    explicit MockOperation(const std::string& uid) : Operation(OperationKind::DATA, uid) {}
    MOCK_METHOD(OperationOutput, call, (const std::vector<OperationOutput>& inputs), (const, override));
};

namespace {

Table singleCell(const std::string& column, const json& value) {
    Table table({column});
    table.addRow({value});
    return table;
}

} // namespace

class ExecutorTest : public ::testing::Test {
protected:
    std::shared_ptr<MockOperation> add(const std::string& uid, OperationId& id) {
        auto operation = std::make_shared<MockOperation>(uid);
        id = graph.addOperation(operation);
        return operation;
    }
    
    OperationGraph graph;
};

TEST_F(ExecutorTest, RunsEachOperationOnceInDependencyOrder) {
    OperationId a_id, b_id, c_id;
    auto c = add("c", c_id);
    auto a = add("a", a_id);
    auto b = add("b", b_id);
    graph.addEdge(a_id, b_id);
    graph.addEdge(a_id, c_id);
    graph.addEdge(b_id, c_id);
    
    EXPECT_CALL(*a, call(_)).Times(1).WillOnce(Return(OperationOutput(singleCell("a", 1))));
    EXPECT_CALL(*b, call(_)).Times(1).WillOnce(Return(OperationOutput(singleCell("b", 2))));
    EXPECT_CALL(*c, call(_)).Times(1).WillOnce(Invoke([](const std::vector<OperationOutput>& inputs) {
        // Inputs arrive in edge order
        // Les entrées arrivent dans l'ordre des arêtes
        EXPECT_EQ(inputs.size(), 2u);
        EXPECT_TRUE(std::get<Table>(inputs[0]).hasColumn("a"));
        EXPECT_TRUE(std::get<Table>(inputs[1]).hasColumn("b"));
        return OperationOutput(singleCell("c", 3));
    }));
    
    Executor executor(graph);
    executor.run();
    executor.run();
    
    EXPECT_TRUE(executor.hasRun());
    EXPECT_EQ(executor.getExecutionOrder(), (std::vector<OperationId>{a_id, b_id, c_id}));
    EXPECT_EQ(std::get<Table>(executor.getOutput(c_id)).at(0, "c"), 3);
}

TEST_F(ExecutorTest, DuplicateEdgesAreIgnored) {
    OperationId a_id, b_id;
    add("a", a_id);
    add("b", b_id);
    graph.addEdge(a_id, b_id);
    graph.addEdge(a_id, b_id);
    EXPECT_EQ(graph.getPredecessors(b_id).size(), 1u);
    EXPECT_THROW(graph.addEdge(a_id, 42), ExecutionError);
}

TEST_F(ExecutorTest, CycleIsReported) {
    OperationId a_id, b_id;
    auto a = add("a", a_id);
    auto b = add("b", b_id);
    graph.addEdge(a_id, b_id);
    graph.addEdge(b_id, a_id);
    
    EXPECT_CALL(*a, call(_)).Times(0);
    EXPECT_CALL(*b, call(_)).Times(0);
    
    Executor executor(graph);
    try {
        executor.run();
        FAIL() << "Expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_NE(std::string(e.what()).find("The operation graph has a cycle between: Data(a), Data(b)"),
                  std::string::npos);
    }
    EXPECT_FALSE(executor.hasRun());
}

TEST_F(ExecutorTest, FailureStopsExecution) {
    OperationId a_id, b_id;
    auto a = add("a", a_id);
    auto b = add("b", b_id);
    graph.addEdge(a_id, b_id);
    
    EXPECT_CALL(*a, call(_)).WillOnce(::testing::Throw(ExecutionError("boom")));
    EXPECT_CALL(*b, call(_)).Times(0);
    
    Executor executor(graph);
    EXPECT_THROW(executor.run(), ExecutionError);
    EXPECT_THROW(executor.getOutput(b_id), ExecutionError);
}

// Tests for compilation of a structure graph into operations
// Tests pour la compilation d'un graphe de structure en opérations
class CompilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        json document = {
            {"@type", "sc:Dataset"},
            {"name", "shop"},
            {"distribution", json::array({
                file("users.csv", "text/csv"),
                file("orders.csv", "text/csv"),
                file("archive.tar.gz", "application/x-gzip"),
                {{"@type", "ml:FileSet"}, {"name", "images"}, {"containedIn", "archive.tar.gz"},
                 {"includes", "*.csv"}, {"encodingFormat", "text/csv"}}
            })},
            {"recordSet", json::array({
                {{"@type", "ml:RecordSet"}, {"name", "purchases"}, {"field", json::array({
                    field("user_id", "sc:Integer", "#{users.csv/id}"),
                    joinField(),
                    field("total", "sc:Float", "#{orders.csv/total}")
                })}},
                {{"@type", "ml:RecordSet"}, {"name", "image_files"}, {"field", json::array({
                    field("filename", "sc:Text", "#{images/filename}")
                })}}
            })}
        };
        
        Issues issues;
        graph = Graph::GraphBuilder(issues).build(document, "/datasets/shop");
    }
    
    static json file(const std::string& name, const std::string& format) {
        return {{"@type", "sc:FileObject"}, {"name", name}, {"contentUrl", name}, {"encodingFormat", format},
                {"sha256", "abc"}};
    }
    
    static json field(const std::string& name, const std::string& type, const std::string& source) {
        return {{"@type", "ml:Field"}, {"name", name}, {"dataType", type}, {"source", source}};
    }
    
    static json joinField() {
        json result = field("order_user", "sc:Integer", "#{orders.csv/user_id}");
        result["references"] = "#{users.csv/id}";
        return result;
    }
    
    std::vector<std::string> names(const OperationGraph& plan) const {
        std::vector<std::string> result;
        for (OperationId id : plan.topologicalSort()) {
            result.push_back(plan.getOperation(id).getName());
        }
        return result;
    }
    
    static size_t position(const std::vector<std::string>& order, const std::string& name) {
        return static_cast<size_t>(std::find(order.begin(), order.end(), name) - order.begin());
    }
    
    std::shared_ptr<Graph::StructureGraph> graph;
};

TEST_F(CompilerTest, JoinedRecordSet) {
    Compiler compiler(graph, nullptr, "/tmp/mlc-work");
    auto plan = compiler.compile({"purchases"});
    auto order = names(*plan);
    
    EXPECT_THAT(order, ::testing::UnorderedElementsAre(
        "Download(users.csv)", "Read(users.csv)", "Download(orders.csv)", "Read(orders.csv)",
        "Join(purchases/order_user)", "ReadField(purchases/user_id)", "ReadField(purchases/order_user)",
        "ReadField(purchases/total)", "Assemble(purchases)"));
    EXPECT_LT(position(order, "Read(orders.csv)"), position(order, "Join(purchases/order_user)"));
    EXPECT_LT(position(order, "Join(purchases/order_user)"), position(order, "ReadField(purchases/total)"));
    
    auto output = plan->getRecordSetOutput("purchases");
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(plan->getOperation(*output).getName(), "Assemble(purchases)");
    
    // The join reads the accumulated table first
    // La jointure lit d'abord la table accumulée
    OperationId join = 0;
    for (OperationId id = 0; id < plan->size(); ++id) {
        if (plan->getOperation(id).getKind() == OperationKind::JOIN) join = id;
    }
    const auto& inputs = plan->getPredecessors(join);
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(plan->getOperation(inputs[0]).getName(), "Read(users.csv)");
}

TEST_F(CompilerTest, FileSetInsideArchive) {
    Compiler compiler(graph, nullptr, "/tmp/mlc-work");
    auto order = names(*compiler.compile({"image_files"}));
    
    ASSERT_EQ(order.size(), 7u);
    EXPECT_EQ(order[0], "Download(archive.tar.gz)");
    EXPECT_EQ(order[1], "Extract(archive.tar.gz)");
    EXPECT_EQ(order[2], "FilterFiles(images)");
    EXPECT_EQ(order[3], "Concatenate(images)");
    EXPECT_EQ(order[4], "Read(images)");
    EXPECT_EQ(order[5], "ReadField(image_files/filename)");
    EXPECT_EQ(order[6], "Assemble(image_files)");
}

TEST_F(CompilerTest, SharedNodesCompileOnce) {
    Compiler compiler(graph, nullptr, "/tmp/mlc-work");
    auto plan = compiler.compile({"purchases", "image_files", "purchases"});
    auto order = names(*plan);
    EXPECT_EQ(order.size(), 16u);
    EXPECT_EQ(std::count(order.begin(), order.end(), "Download(users.csv)"), 1);
}

TEST_F(CompilerTest, UnknownRecordSet) {
    Compiler compiler(graph, nullptr, "/tmp/mlc-work");
    try {
        compiler.compile({"missing"});
        FAIL() << "Expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(std::string(e.what()), "Did not find any record set with the name \"missing\". "
                                         "Possible record sets: [\"purchases\", \"image_files\"]");
    }
}
