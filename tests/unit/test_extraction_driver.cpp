#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "pipeline/extraction_driver.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <map>

using namespace dbx;
using namespace dbx::testing_support;

namespace fs = std::filesystem;

namespace {

const std::string kStatementQuery = "statements SKIP $skip LIMIT $limit";
const std::string kLabelQuery = "label $uri";

}  // namespace

class ExtractionDriverTest : public ::testing::Test {
protected:
    fs::path dir;
    FakeSession session;
    std::vector<Statement> source;
    std::map<std::string, LabelRecord> known_labels;
    DatasetProfile profile;
    ExtractorConfig config;

    void SetUp() override {
        dir = make_temp_dir("driver");

        profile.name = "test";
        profile.paginated = true;
        profile.progress_interval = 2;

        config.data_dir = dir.string();
        config.page_size = 2;
        config.verbose = false;

        session.handler = [this](const std::string& query, const QueryParameters& params)
                -> std::unique_ptr<QueryResult> {
            if (query == kLabelQuery) {
                auto it = known_labels.find(params["uri"].get<std::string>());
                if (it == known_labels.end()) return no_rows();
                return label_row(it->second.label, it->second.description, it->second.depiction);
            }
            return page_of(source, params);
        };
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    DatasetQueries queries() const {
        return DatasetQueries{kLabelQuery, kStatementQuery};
    }

    std::vector<std::string> lines(const std::string& file) const {
        return read_gzip_lines((dir / file).string());
    }
};

// ==========================================
// End-to-End Tests
// ==========================================

TEST_F(ExtractionDriverTest, TwoStatementScenario) {
    source = {{"A", "P", "B"}, {"C", "P", "A"}};

    ExtractionDriver driver(session, profile, queries(), config);
    ExtractionStatistics stats = driver.run();

    EXPECT_EQ(lines("index.tsv.gz"), (std::vector<std::string>{"0\tA", "1\tP", "2\tB", "3\tC"}));
    EXPECT_EQ(lines("relevant_entities.tsv.gz"), (std::vector<std::string>{"0", "2", "3"}));
    EXPECT_EQ(lines("statements.tsv.gz"), (std::vector<std::string>{"0\t1\t2", "3\t1\t0"}));
    EXPECT_EQ(lines("statements.nt.gz"),
              (std::vector<std::string>{"<A> <P> <B> .", "<C> <P> <A> ."}));

    EXPECT_EQ(stats.statements, 2u);
    EXPECT_EQ(stats.entities, 4u);
    EXPECT_EQ(stats.relevant_entities, 3u);
    EXPECT_EQ(driver.state(), DriverState::Completed);
}

TEST_F(ExtractionDriverTest, EmptySourceStillProducesAllFiles) {
    ExtractionDriver driver(session, profile, queries(), config);
    ExtractionStatistics stats = driver.run();

    for (const char* name : {"index.tsv.gz", "relevant_entities.tsv.gz", "index_labels.tsv.gz",
                             "statements.tsv.gz", "statements.nt.gz"}) {
        ASSERT_TRUE(fs::exists(dir / name)) << name;
        EXPECT_TRUE(lines(name).empty()) << name;
    }
    EXPECT_EQ(stats.statements, 0u);
    EXPECT_EQ(stats.entities, 0u);
}

TEST_F(ExtractionDriverTest, CreatesMissingDataDirectory) {
    config.data_dir = (dir / "deep" / "dbpedia1m").string();
    source = {{"A", "P", "B"}};

    ExtractionDriver driver(session, profile, queries(), config);
    driver.run();

    EXPECT_TRUE(fs::exists(dir / "deep" / "dbpedia1m" / "statements.nt.gz"));
}

TEST_F(ExtractionDriverTest, StatementTablesHaveSameLength) {
    source = {{"A", "P", "B"}, {"A", "P", "B"}, {"B", "Q", "C"}, {"C", "P", "D"}, {"D", "Q", "A"}};

    ExtractionDriver driver(session, profile, queries(), config);
    driver.run();

    EXPECT_EQ(lines("statements.tsv.gz").size(), source.size());
    EXPECT_EQ(lines("statements.nt.gz").size(), source.size());
    EXPECT_EQ(lines("statements.tsv.gz")[0], lines("statements.tsv.gz")[1]);
}

// ==========================================
// Label Tests
// ==========================================

TEST_F(ExtractionDriverTest, LabelsSubjectsAndObjectsOnce) {
    source = {{"A", "P", "B"}, {"B", "P", "A"}, {"A", "P", "B"}};
    known_labels["A"] = {"Alpha", "First letter", "http://img/a.png"};
    known_labels["B"] = {"Beta", "", ""};
    known_labels["P"] = {"pred", "never asked", ""};

    ExtractionDriver driver(session, profile, queries(), config);
    ExtractionStatistics stats = driver.run();

    EXPECT_EQ(lines("index_labels.tsv.gz"),
              (std::vector<std::string>{"0\tAlpha\tFirst letter\thttp://img/a.png", "2\tBeta\t\t"}));
    EXPECT_EQ(session.count_calls(kLabelQuery), 2u);
    EXPECT_EQ(stats.label_lookups, 2u);
    EXPECT_EQ(stats.labels_written, 2u);
}

TEST_F(ExtractionDriverTest, PredicatesAreNeverLabeled) {
    source = {{"A", "P", "B"}};
    known_labels["P"] = {"pred", "", ""};

    ExtractionDriver driver(session, profile, queries(), config);
    driver.run();

    for (const auto& call : session.calls) {
        if (call.first == kLabelQuery) {
            EXPECT_NE(call.second["uri"], "P");
        }
    }
}

TEST_F(ExtractionDriverTest, EntityWithoutLabelIsLookedUpOnce) {
    source = {{"A", "P", "B"}, {"A", "P", "C"}, {"C", "P", "A"}};
    known_labels["B"] = {"Beta", "", ""};

    ExtractionDriver driver(session, profile, queries(), config);
    ExtractionStatistics stats = driver.run();

    EXPECT_EQ(lines("index_labels.tsv.gz"), (std::vector<std::string>{"2\tBeta\t\t"}));
    EXPECT_EQ(session.count_calls(kLabelQuery), 3u);
    EXPECT_EQ(stats.labels_missing, 2u);
}

TEST_F(ExtractionDriverTest, NullLabelFieldsAreWrittenEmpty) {
    source = {{"A", "P", "B"}};
    session.handler = [this](const std::string& query, const QueryParameters& params)
            -> std::unique_ptr<QueryResult> {
        if (query == kLabelQuery) return label_row(std::string("x"), std::nullopt, std::nullopt);
        return page_of(source, params);
    };

    ExtractionDriver driver(session, profile, queries(), config);
    driver.run();

    EXPECT_EQ(lines("index_labels.tsv.gz"), (std::vector<std::string>{"0\tx\t\t", "2\tx\t\t"}));
}

TEST_F(ExtractionDriverTest, UsesProfileLabelFileName) {
    profile.labels_file = "labels.tsv.gz";
    source = {{"A", "P", "B"}};
    known_labels["A"] = {"Alpha", "", ""};

    ExtractionDriver driver(session, profile, queries(), config);
    driver.run();

    EXPECT_EQ(lines("labels.tsv.gz"), (std::vector<std::string>{"0\tAlpha\t\t"}));
    EXPECT_FALSE(fs::exists(dir / "index_labels.tsv.gz"));
}

// ==========================================
// Fetching and Progress Tests
// ==========================================

TEST_F(ExtractionDriverTest, PaginatedProfileUsesCursor) {
    source = {{"A", "P", "B"}, {"B", "P", "C"}, {"C", "P", "D"}};

    ExtractionDriver driver(session, profile, queries(), config);
    ExtractionStatistics stats = driver.run();

    EXPECT_EQ(session.count_calls(kStatementQuery), 3u);
    EXPECT_EQ(stats.pages_fetched, 2u);
    EXPECT_EQ(stats.queries_issued, 3u);
}

TEST_F(ExtractionDriverTest, SingleQueryProfileRunsStatementQueryOnce) {
    profile.paginated = false;
    source = {{"A", "P", "B"}, {"B", "P", "C"}, {"C", "P", "D"}};

    ExtractionDriver driver(session, profile, queries(), config);
    ExtractionStatistics stats = driver.run();

    EXPECT_EQ(session.count_calls(kStatementQuery), 1u);
    EXPECT_EQ(stats.statements, 3u);
    EXPECT_EQ(lines("statements.tsv.gz").size(), 3u);
}

TEST_F(ExtractionDriverTest, ReportsProgressAtInterval) {
    source = {{"A", "P", "B"}, {"B", "P", "C"}, {"C", "P", "D"}, {"D", "P", "E"}, {"E", "P", "F"}};

    std::vector<std::pair<std::string, size_t>> events;
    ExtractionDriver driver(session, profile, queries(), config);
    driver.set_progress_callback([&events](const std::string& stage, size_t count, const std::string&) {
        events.emplace_back(stage, count);
    });
    driver.run();

    std::vector<std::pair<std::string, size_t>> expected = {
        {"Extracting", 0}, {"Loaded", 2}, {"Loaded", 4}, {"Completed", 5}
    };
    EXPECT_EQ(events, expected);
}

// ==========================================
// Failure Tests
// ==========================================

TEST_F(ExtractionDriverTest, QueryFailureMarksDriverFailedAndKeepsOutput) {
    source = {{"A", "P", "B"}, {"B", "P", "C"}, {"C", "P", "D"}};
    session.handler = [this](const std::string& query, const QueryParameters& params)
            -> std::unique_ptr<QueryResult> {
        if (query == kLabelQuery) return no_rows();
        if (params["skip"].get<size_t>() > 0) {
            throw QueryError("Neo.DatabaseError.General.UnknownError: backend fault");
        }
        return page_of(source, params);
    };

    ExtractionDriver driver(session, profile, queries(), config);
    EXPECT_THROW(driver.run(), QueryError);
    EXPECT_EQ(driver.state(), DriverState::Failed);

    // Rows of the first page were flushed when the files were closed
    EXPECT_EQ(lines("statements.tsv.gz").size(), 2u);
    EXPECT_EQ(lines("index.tsv.gz").size(), 4u);

    ExtractionStatistics stats = driver.get_statistics();
    EXPECT_EQ(stats.statements, 2u);
    EXPECT_EQ(stats.entities, 4u);
    EXPECT_EQ(stats.relevant_entities, 3u);
    EXPECT_EQ(stats.labels_written, 0u);
    EXPECT_EQ(stats.labels_missing, 3u);
    EXPECT_EQ(stats.pages_fetched, 1u);
    EXPECT_EQ(stats.queries_issued, 1u);
}

TEST_F(ExtractionDriverTest, ContractViolationFailsRun) {
    session.handler = [](const std::string& query, const QueryParameters&)
            -> std::unique_ptr<QueryResult> {
        if (query == kLabelQuery) return no_rows();
        auto columns = std::make_shared<const std::vector<std::string>>(
            std::vector<std::string>{"subject", "predicate", "object"});
        std::vector<Record> records;
        records.emplace_back(columns, std::vector<std::optional<std::string>>{
            std::string("A"), std::string("P"), std::string("B")});
        return std::make_unique<BufferedResult>(std::move(records));
    };

    ExtractionDriver driver(session, profile, queries(), config);
    EXPECT_THROW(driver.run(), DataContractError);
    EXPECT_EQ(driver.state(), DriverState::Failed);
    EXPECT_TRUE(fs::exists(dir / "statements.nt.gz"));
}

TEST_F(ExtractionDriverTest, UnwritableDataDirectoryFails) {
    fs::create_directories(dir);
    fs::path blocker = dir / "file";
    { std::ofstream(blocker.string()) << "x"; }
    config.data_dir = (blocker / "sub").string();

    ExtractionDriver driver(session, profile, queries(), config);
    EXPECT_THROW(driver.run(), OutputError);
    EXPECT_EQ(driver.state(), DriverState::Failed);
}

TEST_F(ExtractionDriverTest, DriverRunsOnlyOnce) {
    source = {{"A", "P", "B"}};
    ExtractionDriver driver(session, profile, queries(), config);
    driver.run();
    EXPECT_THROW(driver.run(), std::logic_error);
    EXPECT_EQ(driver.state(), DriverState::Completed);
}

TEST_F(ExtractionDriverTest, FailedDriverCannotBeRestarted) {
    session.handler = [](const std::string&, const QueryParameters&) -> std::unique_ptr<QueryResult> {
        throw ConnectionError("localhost:7474: Couldn't connect to server");
    };
    ExtractionDriver driver(session, profile, queries(), config);
    EXPECT_THROW(driver.run(), ConnectionError);
    EXPECT_THROW(driver.run(), std::logic_error);
}

TEST_F(ExtractionDriverTest, RequiresDataDirectory) {
    config.data_dir.clear();
    EXPECT_THROW(ExtractionDriver(session, profile, queries(), config), std::invalid_argument);
}
