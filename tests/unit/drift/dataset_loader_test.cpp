/// @file dataset_loader_test.cpp
/// @brief Tests for dataset loading and feature schema derivation

#include <gtest/gtest.h>

#include "common/error.h"
#include "drift/dataset_loader.h"
#include "test_helpers.h"

namespace driftscope::drift {
namespace {

class DatasetLoaderTest : public driftscope::testing::TempDirTest {};

TEST_F(DatasetLoaderTest, KeepsSharedNumericColumnsInReferenceOrder) {
    auto ref = WriteFile("ref.csv", "CreditScore,Age,OnlyRef,Exited\n600,30,1,0\n700,40,2,1\n");
    auto prod = WriteFile("prod.csv", "Age,OnlyProd,CreditScore,Exited\n35,9,650,0\n45,9,720,1\n");

    DatasetLoader loader;
    auto loaded = loader.Load(ref, prod);
    ASSERT_TRUE(loaded.ok()) << loaded.status().message();

    ASSERT_EQ(loaded->schema.features.size(), 2u);
    EXPECT_EQ(loaded->schema.features[0].name, "CreditScore");
    EXPECT_EQ(loaded->schema.features[1].name, "Age");
    EXPECT_EQ(loaded->schema.excluded, (std::vector<std::string>{"Exited"}));
    EXPECT_EQ(loaded->reference_rows, 2u);
    EXPECT_EQ(loaded->production_rows, 2u);

    ASSERT_EQ(loaded->samples.size(), 2u);
    EXPECT_EQ(loaded->samples[0].reference, (std::vector<double>{600, 700}));
    EXPECT_EQ(loaded->samples[0].production, (std::vector<double>{650, 720}));
}

TEST_F(DatasetLoaderTest, CustomExclusionList) {
    auto ref = WriteFile("ref.csv", "a,b,Exited\n1,2,0\n");
    auto prod = WriteFile("prod.csv", "a,b,Exited\n1,2,1\n");

    DatasetLoader loader({"a"});
    auto loaded = loader.Load(ref, prod);
    ASSERT_TRUE(loaded.ok());

    ASSERT_EQ(loaded->schema.features.size(), 2u);
    EXPECT_EQ(loaded->schema.features[0].name, "b");
    EXPECT_EQ(loaded->schema.features[1].name, "Exited");
    EXPECT_EQ(loaded->schema.features[1].kind, FeatureKind::kBinary);
}

TEST_F(DatasetLoaderTest, MissingValuesDroppedPerSample) {
    auto ref = WriteFile("ref.csv", "x,y\n1,NA\n2,5\n,6\n");
    auto prod = WriteFile("prod.csv", "x,y\nnull,1\n3,2\n4,NaN\n");

    DatasetLoader loader;
    auto loaded = loader.Load(ref, prod);
    ASSERT_TRUE(loaded.ok());

    ASSERT_EQ(loaded->samples.size(), 2u);
    EXPECT_EQ(loaded->samples[0].reference, (std::vector<double>{1, 2}));
    EXPECT_EQ(loaded->samples[0].production, (std::vector<double>{3, 4}));
    EXPECT_EQ(loaded->samples[1].reference, (std::vector<double>{5, 6}));
    EXPECT_EQ(loaded->samples[1].production, (std::vector<double>{1, 2}));
}

TEST_F(DatasetLoaderTest, NonNumericColumnsAreSkipped) {
    auto ref = WriteFile("ref.csv", "Geography,Balance\nFrance,10.5\nSpain,0\n");
    auto prod = WriteFile("prod.csv", "Geography,Balance\nGermany,3.25\nFrance,7\n");

    DatasetLoader loader;
    auto loaded = loader.Load(ref, prod);
    ASSERT_TRUE(loaded.ok());

    EXPECT_EQ(loaded->schema.skipped, (std::vector<std::string>{"Geography"}));
    ASSERT_EQ(loaded->schema.features.size(), 1u);
    EXPECT_EQ(loaded->schema.features[0].name, "Balance");
    EXPECT_EQ(loaded->schema.features[0].kind, FeatureKind::kNumerical);
}

TEST_F(DatasetLoaderTest, BinaryColumnsDetected) {
    auto ref = WriteFile("ref.csv", "HasCrCard,IsActiveMember\n1,true\n0,false\n");
    auto prod = WriteFile("prod.csv", "HasCrCard,IsActiveMember\n1,1\n1,2\n");

    DatasetLoader loader;
    auto loaded = loader.Load(ref, prod);
    ASSERT_TRUE(loaded.ok());

    ASSERT_EQ(loaded->schema.features.size(), 2u);
    EXPECT_EQ(loaded->schema.features[0].kind, FeatureKind::kBinary);
    EXPECT_EQ(loaded->schema.features[1].kind, FeatureKind::kNumerical);
}

TEST_F(DatasetLoaderTest, AllMissingColumnIsNumericalWithEmptySample) {
    auto ref = WriteFile("ref.csv", "a,b\n1,2\n3,4\n");
    auto prod = WriteFile("prod.csv", "a,b\n1,\n3,NA\n");

    DatasetLoader loader;
    auto loaded = loader.Load(ref, prod);
    ASSERT_TRUE(loaded.ok());

    ASSERT_EQ(loaded->samples.size(), 2u);
    EXPECT_EQ(loaded->samples[1].spec.name, "b");
    EXPECT_TRUE(loaded->samples[1].production.empty());
    EXPECT_EQ(loaded->samples[1].reference.size(), 2u);
}

TEST_F(DatasetLoaderTest, NoSharedColumnsGivesEmptySchema) {
    auto ref = WriteFile("ref.csv", "a,b\n1,2\n");
    auto prod = WriteFile("prod.csv", "c,d\n1,2\n");

    DatasetLoader loader;
    auto loaded = loader.Load(ref, prod);
    ASSERT_TRUE(loaded.ok());
    EXPECT_TRUE(loaded->schema.Empty());
    EXPECT_TRUE(loaded->samples.empty());
}

TEST_F(DatasetLoaderTest, MissingReferenceFile) {
    auto prod = WriteFile("prod.csv", "a\n1\n");

    DatasetLoader loader;
    auto loaded = loader.Load(dir_ / "missing.csv", prod);
    ASSERT_FALSE(loaded.ok());
    EXPECT_TRUE(HasErrorCode(loaded.status(), ErrorCode::kInputNotFound));
}

TEST_F(DatasetLoaderTest, MissingProductionFile) {
    auto ref = WriteFile("ref.csv", "a\n1\n");

    DatasetLoader loader;
    auto loaded = loader.Load(ref, dir_ / "missing.csv");
    ASSERT_FALSE(loaded.ok());
    EXPECT_TRUE(HasErrorCode(loaded.status(), ErrorCode::kInputNotFound));
}

TEST(DatasetLoaderStaticTest, MissingValueTokens) {
    EXPECT_TRUE(DatasetLoader::IsMissingValue(""));
    EXPECT_TRUE(DatasetLoader::IsMissingValue("NA"));
    EXPECT_TRUE(DatasetLoader::IsMissingValue("N/A"));
    EXPECT_TRUE(DatasetLoader::IsMissingValue("null"));
    EXPECT_TRUE(DatasetLoader::IsMissingValue("None"));
    EXPECT_FALSE(DatasetLoader::IsMissingValue("0"));
    EXPECT_FALSE(DatasetLoader::IsMissingValue("France"));
}

TEST(DatasetLoaderStaticTest, ParseNumeric) {
    EXPECT_EQ(DatasetLoader::ParseNumeric("42"), 42.0);
    EXPECT_EQ(DatasetLoader::ParseNumeric("-1.5e2"), -150.0);
    EXPECT_EQ(DatasetLoader::ParseNumeric("TRUE"), 1.0);
    EXPECT_EQ(DatasetLoader::ParseNumeric("false"), 0.0);
    EXPECT_FALSE(DatasetLoader::ParseNumeric("Female").has_value());
    EXPECT_FALSE(DatasetLoader::ParseNumeric("12abc").has_value());
}

}  // namespace
}  // namespace driftscope::drift
