#include "result_io.hpp"
#include "test_utils.hpp"
#include <cmath>
#include <filesystem>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

using namespace glv_em;

TEST(ConfigJsonTest, MissingKeysKeepDefaults) {
    const EMConfig config = config_from_json(nlohmann::json::object());
    const EMConfig defaults;
    EXPECT_EQ(config.num_threads, defaults.num_threads);
    EXPECT_EQ(config.max_iterations, 30);
    EXPECT_DOUBLE_EQ(config.biomass_scaling, 10000.0);
    EXPECT_TRUE(std::isinf(config.outlier_deviation));
    EXPECT_FALSE(config.warmup_iterations.has_value());
    EXPECT_EQ(config.mask_refresh_period, 3);
}

TEST(ConfigJsonTest, ReadsValuesAndInfinity) {
    const nlohmann::json j = {
        { "outlier_deviation", 3.5 }, { "max_iterations", 12 },  { "warmup_iterations", 4 },
        { "alpha", 0.5 },             { "penalty_blend", 0.25 }, { "verbose", false },
        { "unknown_key", "ignored" },
    };
    const EMConfig config = config_from_json(j);
    EXPECT_DOUBLE_EQ(config.outlier_deviation, 3.5);
    EXPECT_EQ(config.max_iterations, 12);
    ASSERT_TRUE(config.warmup_iterations.has_value());
    EXPECT_EQ(*config.warmup_iterations, 4);
    EXPECT_DOUBLE_EQ(config.alpha, 0.5);
    EXPECT_DOUBLE_EQ(config.penalty_blend, 0.25);
    EXPECT_FALSE(config.verbose);

    const EMConfig infinite = config_from_json({ { "outlier_deviation", "inf" } });
    EXPECT_TRUE(std::isinf(infinite.outlier_deviation));
}

TEST(ConfigJsonTest, RejectsBadTypesAndValues) {
    EXPECT_THROW(config_from_json({ { "max_iterations", "many" } }), std::invalid_argument);
    EXPECT_THROW(config_from_json({ { "max_iterations", 2.5 } }), std::invalid_argument);
    EXPECT_THROW(config_from_json({ { "alpha", 2.0 } }), std::invalid_argument);
    EXPECT_THROW(config_from_json({ { "center", 1 } }), std::invalid_argument);
    EXPECT_THROW(config_from_json(nlohmann::json::array()), std::invalid_argument);
}

TEST(ConfigJsonTest, WrittenConfigReadsBack) {
    EMConfig config;
    config.warmup_iterations = 7;
    config.center = true;
    config.num_threads = 3;
    const nlohmann::json j = config_to_json(config);
    EXPECT_EQ(j.at("outlier_deviation"), "inf");

    const EMConfig back = config_from_json(j);
    EXPECT_EQ(back.num_threads, 3);
    EXPECT_EQ(back.warmup_iterations, std::optional<int>(7));
    EXPECT_TRUE(back.center);
    EXPECT_TRUE(std::isinf(back.outlier_deviation));
}

TEST(CountTableJsonTest, ReadsNamedTable) {
    const nlohmann::json j = { { "taxa", { "a", "b" } }, { "counts", { { 1, 2, 3 }, { 4, 5, 6 } } } };
    const CountTable table = count_table_from_json(j);
    EXPECT_EQ(table.num_taxa(), 2u);
    EXPECT_EQ(table.num_samples(), 3u);
    EXPECT_EQ(table.taxon_names[1], "b");
    EXPECT_DOUBLE_EQ(table.counts(1, 2), 6.0);
}

TEST(CountTableJsonTest, GeneratesNamesAndRejectsRaggedRows) {
    const CountTable unnamed = count_table_from_json({ { "counts", { { 1, 2 }, { 3, 4 } } } });
    EXPECT_EQ(unnamed.taxon_names[0], "taxon_1");

    EXPECT_THROW(count_table_from_json({ { "counts", { { 1, 2 }, { 3 } } } }), std::invalid_argument);
    EXPECT_THROW(count_table_from_json({ { "taxa", { "a" } }, { "counts", { { 1, 2 }, { 3, 4 } } } }),
                 std::invalid_argument);
    EXPECT_THROW(count_table_from_json({ { "rows", 2 } }), std::invalid_argument);
}

TEST(ResultJsonTest, SerializesTraceResidualsAndStatus) {
    EMResult result;
    result.taxon_names = { "a", "b" };
    ParameterEstimate params;
    params.growth_rates = Eigen::Vector2d(0.5, 0.7);
    params.interactions = test_utils::make_matrix({ { -1.0, 0.2 }, { 0.0, -1.0 } });
    result.trace.biomass = { Eigen::Vector3d(1.0, 2.0, 3.0), Eigen::Vector3d(1.5, 2.0, 2.5) };
    result.trace.parameters = { params };
    result.trace.penalties = { Eigen::Vector2d(0.01, 0.02) };
    result.e_step_residuals = test_utils::make_matrix(
      { { 0.1, std::numeric_limits<double>::quiet_NaN(), 0.3 }, { 0.4, 0.5, 0.6 } });
    result.m_step_residuals = Eigen::MatrixXd::Zero(2, 3);
    result.coefficient_entropy = Eigen::MatrixXd::Zero(2, 2);
    result.final_mask = ExclusionMask::Constant(2, 3, false);
    result.final_mask(0, 2) = true;
    result.final_mask(1, 2) = true;
    result.excluded_samples = { 2 };
    result.iterations = 1;
    result.converged = true;
    result.termination = TerminationReason::Converged;

    const nlohmann::json j = result_to_json(result);
    EXPECT_EQ(j.at("termination"), "Converged");
    EXPECT_TRUE(j.at("converged").get<bool>());
    EXPECT_EQ(j.at("iterations"), 1);
    EXPECT_DOUBLE_EQ(j.at("interactions")[0][1].get<double>(), 0.2);
    EXPECT_DOUBLE_EQ(j.at("growth_rates")[1].get<double>(), 0.7);
    EXPECT_DOUBLE_EQ(j.at("biomass")[2].get<double>(), 2.5);
    EXPECT_EQ(j.at("trace").at("biomass").size(), 2u);
    EXPECT_EQ(j.at("trace").at("penalties").size(), 1u);
    EXPECT_TRUE(j.at("e_step_residuals")[0][1].is_null());
    EXPECT_TRUE(j.at("final_mask")[1][2].get<bool>());
    EXPECT_EQ(j.at("excluded_samples")[0], 2);
    EXPECT_EQ(j.at("taxa")[0], "a");
}

TEST(JsonFileTest, WriteThenRead) {
    const std::string path = (std::filesystem::temp_directory_path() / "glv_em_result_io_test.json").string();
    const nlohmann::json j = { { "counts", { { 1, 2 }, { 3, 4 } } } };
    write_json_file(j, path);
    EXPECT_EQ(read_json_file(path), j);
    std::filesystem::remove(path);

    EXPECT_THROW(read_json_file(path), std::runtime_error);
}
