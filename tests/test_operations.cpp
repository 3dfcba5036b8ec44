#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/issues.hpp"
#include "operation_graph/operations.hpp"

using namespace MLC;
using namespace MLC::Operations;
using MLC::Graph::DataType;
using nlohmann::json;

namespace {

Graph::Source source(const std::string& reference) {
    std::string error;
    auto parsed = Graph::parseSource(reference, error);
    if (!parsed) {
        throw std::invalid_argument(error);
    }
    return *parsed;
}

Graph::Source sourceWithRegex(const std::string& reference, const std::string& regex) {
    Graph::Source result = source(reference);
    result.transforms.push_back(Graph::makeRegexTransform(regex));
    return result;
}

const Table& asTable(const OperationOutput& output) {
    return std::get<Table>(output);
}

} // namespace

// Tests for the join operation
// Tests pour l'opération de jointure
class JoinTest : public ::testing::Test {
protected:
    void SetUp() override {
        users = Table({"id", "name"});
        users.addRow({1, "alice"});
        users.addRow({2, "bob"});
        users.addRow({3, "carol"});
        
        orders = Table({"order_id", "user_id", "total"});
        orders.addRow({10, 1, 5.0});
        orders.addRow({11, 1, 7.5});
        orders.addRow({12, 2, 3.0});
        
        users.addOrigin("users.csv");
        orders.addOrigin("orders.csv");
    }
    
    Table users;
    Table orders;
};

TEST_F(JoinTest, LeftOuterJoin) {
    Join join("purchases", source("#{users.csv/id}"), source("#{orders.csv/user_id}"));
    Table result = asTable(join.call({users, orders}));
    
    EXPECT_EQ(result.getColumns(), (std::vector<std::string>{"id", "name", "order_id", "user_id", "total"}));
    ASSERT_EQ(result.getRowCount(), 4u);
    EXPECT_EQ(result.rowToJson(0), (json{{"id", 1}, {"name", "alice"}, {"order_id", 10}, {"user_id", 1}, {"total", 5.0}}));
    EXPECT_EQ(result.rowToJson(1)["order_id"], 11);
    EXPECT_EQ(result.rowToJson(2)["order_id"], 12);
    
    // Unmatched left rows are kept with empty right cells
    // Les lignes de gauche sans correspondance sont gardées avec des cellules droites vides
    EXPECT_EQ(result.at(3, "name"), "carol");
    EXPECT_TRUE(result.at(3, "order_id").is_null());
}

TEST_F(JoinTest, InputOrderDoesNotMatter) {
    Join join("purchases", source("#{users.csv/id}"), source("#{orders.csv/user_id}"));
    EXPECT_EQ(asTable(join.call({users, orders})), asTable(join.call({orders, users})));
}

TEST_F(JoinTest, SameNamedKeysKeepEverySourceRow) {
    Table tickets({"id", "subject"});
    tickets.addRow({1, "login"});
    tickets.addRow({7, "billing"});
    tickets.addOrigin("tickets.csv");
    
    // The left side is the source node whatever the input order
    // Le côté gauche est le nœud source quel que soit l'ordre des entrées
    Join join("tickets", source("#{tickets.csv/id}"), source("#{users.csv/id}"));
    Table forward = asTable(join.call({users, tickets}));
    Table backward = asTable(join.call({tickets, users}));
    EXPECT_EQ(forward, backward);
    
    EXPECT_EQ(forward.getColumns(), (std::vector<std::string>{"id", "subject", "name"}));
    ASSERT_EQ(forward.getRowCount(), 2u);
    EXPECT_EQ(forward.rowToJson(0), (json{{"id", 1}, {"subject", "login"}, {"name", "alice"}}));
    EXPECT_EQ(forward.at(1, "id"), 7);
    EXPECT_TRUE(forward.at(1, "name").is_null());
}

TEST_F(JoinTest, ResultCarriesBothOrigins) {
    Join join("purchases", source("#{users.csv/id}"), source("#{orders.csv/user_id}"));
    Table result = asTable(join.call({orders, users}));
    EXPECT_TRUE(result.hasOrigin("users.csv"));
    EXPECT_TRUE(result.hasOrigin("orders.csv"));
    EXPECT_EQ(result.getColumns().front(), "id");
}

TEST_F(JoinTest, SameNamedKeyIsNotDuplicated) {
    Table profiles({"id", "country"});
    profiles.addRow({2, "FR"});
    
    Join join("profiles", source("#{users.csv/id}"), source("#{profiles.csv/id}"));
    Table result = asTable(join.call({users, profiles}));
    EXPECT_EQ(result.getColumns(), (std::vector<std::string>{"id", "name", "country"}));
    EXPECT_EQ(result.at(1, "country"), "FR");
}

TEST_F(JoinTest, CollidingColumnsAreQualified) {
    Table pets({"owner", "name"});
    pets.addRow({1, "rex"});
    
    Join join("pets", source("#{users.csv/id}"), source("#{pets.csv/owner}"));
    Table result = asTable(join.call({users, pets}));
    EXPECT_EQ(result.getColumns(), (std::vector<std::string>{"id", "name", "owner", "pets.csv/name"}));
    EXPECT_EQ(result.at(0, "name"), "alice");
    EXPECT_EQ(result.at(0, "pets.csv/name"), "rex");
}

TEST_F(JoinTest, KeysCompareAsText) {
    Table external({"user", "score"});
    external.addRow({"2", 0.5});
    
    Join join("scores", source("#{users.csv/id}"), source("#{scores.csv/user}"));
    Table result = asTable(join.call({users, external}));
    EXPECT_EQ(result.at(1, "score"), 0.5);
}

TEST_F(JoinTest, LeftKeyTransforms) {
    Table logins({"login"});
    logins.addRow({"user_1"});
    logins.addRow({"user_9"});
    
    Join join("logins", sourceWithRegex("#{logins.csv/login}", "^user_(\\d+)$"), source("#{users.csv/id}"));
    Table result = asTable(join.call({logins, users}));
    ASSERT_EQ(result.getRowCount(), 2u);
    EXPECT_EQ(result.at(0, "login"), "1");
    EXPECT_EQ(result.at(0, "name"), "alice");
    EXPECT_TRUE(result.at(1, "name").is_null());
}

TEST_F(JoinTest, MissingKeyColumn) {
    Join join("purchases", source("#{users.csv/uid}"), source("#{orders.csv/user_id}"));
    try {
        join.call({users, orders});
        FAIL() << "Expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_NE(std::string(e.what()).find("Column \"uid\" does not exist in node \"users.csv\""),
                  std::string::npos);
    }
}

TEST_F(JoinTest, RequiresExactlyTwoTables) {
    Join join("purchases", source("#{users.csv/id}"), source("#{orders.csv/user_id}"));
    try {
        join.call({users, orders, users});
        FAIL() << "Expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(std::string(e.what()), "Unsupported: trying to join 3 tables in Join(purchases).");
    }
    EXPECT_THROW(join.call({users}), ExecutionError);
}

// Tests for file listing operations
// Tests pour les opérations sur les listes de fichiers
class FileOperationsTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
               (std::string("mlc_operations_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / "train");
        write(root / "train" / "b.csv", "x\n2\n");
        write(root / "train" / "a.csv", "x\n1\n");
        write(root / "notes.txt", "hello");
    }
    
    void TearDown() override {
        std::filesystem::remove_all(root);
    }
    
    static void write(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }
    
    std::filesystem::path root;
};

TEST_F(FileOperationsTest, FilterFilesMatchesAndSorts) {
    FilterFiles filter("csv-files", "train/*.csv", root);
    auto files = std::get<std::vector<FilePath>>(filter.call({}));
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].fullpath, "train/a.csv");
    EXPECT_EQ(files[0].filename, "a.csv");
    EXPECT_EQ(files[1].fullpath, "train/b.csv");
    
    FilterFiles from_input("csv-files", "*.csv", root);
    auto from_dir = std::get<std::vector<FilePath>>(from_input.call({root / "train"}));
    EXPECT_EQ(from_dir.size(), 2u);
}

TEST_F(FileOperationsTest, ConcatenateAndRead) {
    FilterFiles filter("csv-files", "**/*.csv", root);
    Concatenate concatenate("csv-files");
    Read read("csv-files", "text/csv");
    
    Table paths = asTable(concatenate.call({filter.call({})}));
    ASSERT_EQ(paths.getRowCount(), 2u);
    EXPECT_EQ(paths.getColumns(), (std::vector<std::string>{"filepath", "filename", "fullpath"}));
    
    Table content = asTable(read.call({paths}));
    ASSERT_EQ(content.getRowCount(), 2u);
    EXPECT_EQ(content.at(0, "x"), "1");
    EXPECT_EQ(content.at(1, "x"), "2");
    EXPECT_EQ(content.at(1, "filename"), "b.csv");
    EXPECT_EQ(content.getOrigins(), (std::vector<std::string>{"csv-files"}));
}

TEST_F(FileOperationsTest, NonTabularFileSetKeepsPaths) {
    Concatenate concatenate("notes");
    Read read("notes", "text/plain");
    Table paths = asTable(concatenate.call({std::vector<FilePath>{{root / "notes.txt", "notes.txt", "notes.txt"}}}));
    EXPECT_EQ(asTable(read.call({paths})), paths);
}

TEST(ConcatenateTest, NoPathToConcatenate) {
    Concatenate concatenate("empty");
    try {
        concatenate.call({});
        FAIL() << "Expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(std::string(e.what()), "No path to concatenate.");
    }
    EXPECT_THROW(concatenate.call({std::vector<FilePath>{}}), ExecutionError);
}

TEST(ConcatenateTest, OneRowPerPath) {
    Concatenate concatenate("files");
    std::vector<FilePath> files = {{"/data/a.csv", "a.csv", "a.csv"}, {"/data/sub/b.csv", "b.csv", "sub/b.csv"}};
    Table table = asTable(concatenate.call({files, std::filesystem::path("/data/c.csv")}));
    ASSERT_EQ(table.getRowCount(), 3u);
    EXPECT_EQ(table.at(1, "fullpath"), "sub/b.csv");
    EXPECT_EQ(table.at(2, "filename"), "c.csv");
}

TEST(GlobTest, Patterns) {
    EXPECT_TRUE(globMatch("*.csv", "a.csv"));
    EXPECT_FALSE(globMatch("*.csv", "dir/a.csv"));
    EXPECT_TRUE(globMatch("**/*.csv", "a.csv"));
    EXPECT_TRUE(globMatch("**/*.csv", "dir/sub/a.csv"));
    EXPECT_TRUE(globMatch("data/?.json", "data/1.json"));
    EXPECT_FALSE(globMatch("data/?.json", "data/10.json"));
    EXPECT_FALSE(globMatch("*.csv", "a.csv.gz"));
}

// Tests for value coercion
// Tests pour la conversion des valeurs
TEST(CoerceValueTest, Integers) {
    EXPECT_EQ(coerceValue("42", DataType::INTEGER, "rs/f"), 42);
    EXPECT_EQ(coerceValue(7.0, DataType::INTEGER, "rs/f"), 7);
    EXPECT_TRUE(coerceValue("", DataType::INTEGER, "rs/f").is_null());
    EXPECT_THROW(coerceValue("4.2", DataType::INTEGER, "rs/f"), ExecutionError);
}

TEST(CoerceValueTest, Floats) {
    EXPECT_DOUBLE_EQ(coerceValue("3.5", DataType::FLOAT, "rs/f").get<double>(), 3.5);
    EXPECT_DOUBLE_EQ(coerceValue(2, DataType::FLOAT, "rs/f").get<double>(), 2.0);
    EXPECT_THROW(coerceValue("abc", DataType::FLOAT, "rs/f"), ExecutionError);
}

TEST(CoerceValueTest, Booleans) {
    EXPECT_EQ(coerceValue("Yes", DataType::BOOLEAN, "rs/f"), true);
    EXPECT_EQ(coerceValue("0", DataType::BOOLEAN, "rs/f"), false);
    EXPECT_EQ(coerceValue(1, DataType::BOOLEAN, "rs/f"), true);
    EXPECT_THROW(coerceValue("maybe", DataType::BOOLEAN, "rs/f"), ExecutionError);
}

TEST(CoerceValueTest, TextAndDates) {
    EXPECT_EQ(coerceValue(12, DataType::TEXT, "rs/f"), "12");
    EXPECT_EQ(coerceValue("", DataType::TEXT, "rs/f"), "");
    EXPECT_EQ(coerceValue("2023-05-17T10:00:00", DataType::DATE, "rs/f"), "2023-05-17");
    EXPECT_THROW(coerceValue("2023-13-01", DataType::DATE, "rs/f"), ExecutionError);
    EXPECT_TRUE(coerceValue(nullptr, DataType::DATE, "rs/f").is_null());
}

TEST(CoerceValueTest, ImagesBecomeBytes) {
    json image = coerceValue("not a path", DataType::IMAGE_OBJECT, "rs/f");
    ASSERT_TRUE(image.is_binary());
    EXPECT_EQ(image.get_binary().size(), std::string("not a path").size());
}

// Tests for field reading and assembly
// Tests pour la lecture des champs et l'assemblage
class ReadFieldTest : public ::testing::Test {
protected:
    void SetUp() override {
        table = Table({"id", "name", "pets.csv/name", "born"});
        table.addRow({"1", "alice", "rex", "2001-02-03"});
        table.addRow({"2", "bob", nullptr, ""});
    }
    
    FieldSpec spec(const std::string& name, const std::string& reference, std::optional<DataType> type) {
        FieldSpec field;
        field.name = name;
        field.uid = "people/" + name;
        field.source = source(reference);
        field.data_type = type;
        return field;
    }
    
    Table table;
};

TEST_F(ReadFieldTest, TypedColumn) {
    ReadField read(spec("id", "#{people.csv/id}", DataType::INTEGER));
    Table result = asTable(read.call({table}));
    EXPECT_EQ(result.getColumns(), std::vector<std::string>{"id"});
    EXPECT_EQ(result.getColumn("id"), (std::vector<json>{1, 2}));
}

TEST_F(ReadFieldTest, QualifiedColumnIsPreferred) {
    ReadField read(spec("pet", "#{pets.csv/name}", DataType::TEXT));
    Table result = asTable(read.call({table}));
    EXPECT_EQ(result.at(0, "pet"), "rex");
    EXPECT_TRUE(result.at(1, "pet").is_null());
}

TEST_F(ReadFieldTest, SubFieldsBuildObjects) {
    FieldSpec person;
    person.name = "person";
    person.uid = "people/person";
    person.sub_fields = {spec("name", "#{people.csv/name}", DataType::TEXT),
                         spec("born", "#{people.csv/born}", DataType::DATE)};
    
    Table result = asTable(ReadField(person).call({table}));
    EXPECT_EQ(result.at(0, "person"), (json{{"name", "alice"}, {"born", "2001-02-03"}}));
    EXPECT_TRUE(result.at(1, "person")["born"].is_null());
}

TEST_F(ReadFieldTest, TransformsApplyBeforeTypes) {
    FieldSpec year = spec("year", "#{people.csv/born}", DataType::INTEGER);
    year.source->transforms.push_back(Graph::makeRegexTransform("^(\\d{4})"));
    Table result = asTable(ReadField(year).call({table}));
    EXPECT_EQ(result.at(0, "year"), 2001);
    EXPECT_TRUE(result.at(1, "year").is_null());
}

TEST_F(ReadFieldTest, MissingColumn) {
    ReadField read(spec("email", "#{people.csv/email}", DataType::TEXT));
    EXPECT_THROW(read.call({table}), ExecutionError);
}

TEST(AssembleTest, ColumnsInFieldOrder) {
    Table ids({"id"});
    ids.addRow({1});
    ids.addRow({2});
    Table names({"name"});
    names.addRow({"alice"});
    names.addRow({"bob"});
    
    Assemble assemble("people", {"name", "id"});
    Table result = asTable(assemble.call({names, ids}));
    EXPECT_EQ(result.getColumns(), (std::vector<std::string>{"name", "id"}));
    EXPECT_EQ(result.rowToJson(1), (json{{"name", "bob"}, {"id", 2}}));
    EXPECT_TRUE(result.hasOrigin("people"));
}

TEST(AssembleTest, RowCountMismatch) {
    Table ids({"id"});
    ids.addRow({1});
    Table names({"name"});
    
    Assemble assemble("people", {"id", "name"});
    EXPECT_THROW(assemble.call({ids, names}), ExecutionError);
}

TEST(DataTest, InlineRecords) {
    Data data("splits", json::array({{{"name", "train"}}, {{"name", "test"}}}));
    Table result = asTable(data.call({}));
    EXPECT_EQ(result.getColumn("name"), (std::vector<json>{"train", "test"}));
    EXPECT_TRUE(result.hasOrigin("splits"));
    
    Data broken("broken", json::array({"train"}));
    EXPECT_THROW(broken.call({}), ExecutionError);
}
