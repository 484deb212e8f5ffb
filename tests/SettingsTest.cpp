
#include "Settings.h"

#include <QSettings>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace {

class SettingsTest : public ::testing::Test {
protected:
	void SetUp() override {
		ASSERT_TRUE(dir_.isValid());
		Settings::Reset();
	}

	void TearDown() override {
		Settings::Reset();
	}

	QString file(const char *name) const {
		return dir_.filePath(QLatin1String(name));
	}

private:
	QTemporaryDir dir_;
};

}

TEST_F(SettingsTest, Defaults) {
	EXPECT_EQ(Settings::strategy, RegVM::Strategy::Parallel);
	EXPECT_EQ(Settings::anchoring, RegVM::Anchoring::Full);
	EXPECT_EQ(Settings::stepLimit, 1000000);
	EXPECT_EQ(Settings::cacheSize, 64);
}

TEST_F(SettingsTest, SaveAndLoad) {
	const QString filename = file("config.ini");

	Settings::strategy  = RegVM::Strategy::Backtracking;
	Settings::anchoring = RegVM::Anchoring::Prefix;
	Settings::stepLimit = 500;
	Settings::cacheSize = 3;
	ASSERT_TRUE(Settings::Save(filename));

	Settings::Reset();
	EXPECT_EQ(Settings::strategy, RegVM::Strategy::Parallel);

	Settings::Load(filename);
	EXPECT_EQ(Settings::strategy, RegVM::Strategy::Backtracking);
	EXPECT_EQ(Settings::anchoring, RegVM::Anchoring::Prefix);
	EXPECT_EQ(Settings::stepLimit, 500);
	EXPECT_EQ(Settings::cacheSize, 3);
}

TEST_F(SettingsTest, MissingFileGivesDefaults) {
	Settings::stepLimit = 7;
	Settings::Load(file("missing.ini"));

	EXPECT_EQ(Settings::strategy, RegVM::Strategy::Parallel);
	EXPECT_EQ(Settings::stepLimit, 1000000);
}

TEST_F(SettingsTest, InvalidValuesFallBackToDefaults) {
	const QString filename = file("invalid.ini");

	{
		QSettings settings(filename, QSettings::IniFormat);
		settings.setValue(QLatin1String("regvm.strategy"), 7);
		settings.setValue(QLatin1String("regvm.anchoring"), -1);
		settings.setValue(QLatin1String("regvm.stepLimit"), -5);
		settings.setValue(QLatin1String("regvm.cacheSize"), QLatin1String("lots"));
	}

	Settings::Load(filename);
	EXPECT_EQ(Settings::strategy, RegVM::Strategy::Parallel);
	EXPECT_EQ(Settings::anchoring, RegVM::Anchoring::Full);
	EXPECT_EQ(Settings::stepLimit, 1000000);
	EXPECT_EQ(Settings::cacheSize, 64);
}

TEST_F(SettingsTest, EvalOptions) {
	Settings::strategy  = RegVM::Strategy::Backtracking;
	Settings::anchoring = RegVM::Anchoring::Prefix;
	Settings::stepLimit = 0;

	const RegVM::EvalOptions options = Settings::CurrentEvalOptions();
	EXPECT_EQ(options.strategy, RegVM::Strategy::Backtracking);
	EXPECT_EQ(options.anchoring, RegVM::Anchoring::Prefix);
	EXPECT_EQ(options.stepLimit, 0u);
}

TEST(FromIntegerTest, Enums) {
	EXPECT_EQ(FromInteger<RegVM::Strategy>(0), RegVM::Strategy::Backtracking);
	EXPECT_EQ(FromInteger<RegVM::Strategy>(1), RegVM::Strategy::Parallel);
	EXPECT_EQ(FromInteger<RegVM::Strategy>(42), RegVM::Strategy::Parallel);
	EXPECT_EQ(FromInteger<RegVM::Anchoring>(1), RegVM::Anchoring::Prefix);
	EXPECT_EQ(FromInteger<RegVM::Anchoring>(42), RegVM::Anchoring::Full);
}

TEST(ToStringTest, Enums) {
	EXPECT_STREQ(RegVM::ToString(RegVM::Strategy::Backtracking).data(), "backtrack");
	EXPECT_STREQ(RegVM::ToString(RegVM::Anchoring::Prefix).data(), "prefix");
}
