/**
 * @file test_access_filter.cpp
 * @brief SecurityLabel parsing and AccessFilter decisions.
 */
#include "test_patterns.h"
#include "fed_transfer.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

using namespace federator::transfer;
using ::testing::HasSubstr;

namespace
{

Record labelled(int64_t offset, std::string label)
{
    Record r;
    r.offset = offset;
    r.headers["security-label"] = std::move(label);
    r.payload = "body";
    return r;
}

} // namespace

class SecurityLabelTest : public federator::tests::PureApiTest
{
};

TEST_F(SecurityLabelTest, ParsesBothSeparatorsAndUppercases)
{
    auto parsed = SecurityLabel::parse(" nationality = gbr , Classification:secret ");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error_message();
    const auto &label = parsed.content();
    EXPECT_EQ(label.size(), 2u);
    EXPECT_EQ(label.get("NATIONALITY"), "GBR");
    EXPECT_EQ(label.get("classification"), "SECRET");
    EXPECT_EQ(label.to_string(), "NATIONALITY=GBR,CLASSIFICATION=SECRET");
}

TEST_F(SecurityLabelTest, BlankSegmentsAreSkipped)
{
    auto parsed = SecurityLabel::parse(",,nationality=FRA, ,");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.content().to_string(), "NATIONALITY=FRA");

    auto empty = SecurityLabel::parse("");
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.content().empty());
}

TEST_F(SecurityLabelTest, RepeatedKeyLastWriteWins)
{
    auto parsed = SecurityLabel::parse("nationality=GBR,sensitivity=low,nationality=FRA");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.content().get("nationality"), "FRA");
    // First-appearance position is kept.
    EXPECT_EQ(parsed.content().to_string(), "NATIONALITY=FRA,SENSITIVITY=LOW");
}

TEST_F(SecurityLabelTest, MalformedSegmentsAreLabelParseErrors)
{
    for (const char *raw : {"nationality", "nationality=GBR=FRA", "a:b=c", "=GBR", "nationality= ",
                            "ok=1,broken"})
    {
        auto parsed = SecurityLabel::parse(raw);
        ASSERT_TRUE(parsed.is_error()) << raw;
        EXPECT_EQ(parsed.error(), TransferError::LabelParse) << raw;
    }
}

TEST_F(SecurityLabelTest, RecordHeaderLookupIgnoresCase)
{
    const Record r = labelled(0, "nationality=GBR");
    EXPECT_EQ(r.header(kSecurityLabelHeader), "nationality=GBR");
    EXPECT_EQ(r.header("SECURITY-LABEL"), "nationality=GBR");
    EXPECT_FALSE(r.header("missing").has_value());
}

class AccessFilterTest : public federator::tests::PureApiTest
{
  protected:
    static AccessGrant gbr_fra_secret()
    {
        AccessGrant grant;
        grant.require("nationality", {"gbr", "FRA"}).require("classification", {"secret"});
        return grant;
    }
};

TEST_F(AccessFilterTest, GrantNormalizesKeysAndValues)
{
    AccessGrant grant;
    grant.require(" Nationality ", {"gbr"}).require("NATIONALITY", {"fra"});
    ASSERT_EQ(grant.requirements().size(), 1u);
    EXPECT_THAT(grant.requirements().at("NATIONALITY"), ::testing::ElementsAre("FRA", "GBR"));
}

TEST_F(AccessFilterTest, AllowsWhenEveryKeyHasAnAllowedValue)
{
    auto label = SecurityLabel::parse("nationality=FRA,classification=SECRET,extra=x").content();
    const auto detail = AccessFilter::decide(label, gbr_fra_secret());
    EXPECT_TRUE(detail.allowed());
    EXPECT_TRUE(detail.reason.empty());
}

TEST_F(AccessFilterTest, DeniesDisallowedValue)
{
    auto label = SecurityLabel::parse("nationality=USA,classification=SECRET").content();
    const auto detail = AccessFilter::decide(label, gbr_fra_secret());
    EXPECT_FALSE(detail.allowed());
    EXPECT_THAT(detail.reason, HasSubstr("'NATIONALITY' is 'USA'"));
    EXPECT_THAT(detail.reason, HasSubstr("FRA, GBR"));
}

TEST_F(AccessFilterTest, DeniesMissingAttribute)
{
    auto label = SecurityLabel::parse("nationality=GBR").content();
    const auto detail = AccessFilter::decide(label, gbr_fra_secret());
    EXPECT_FALSE(detail.allowed());
    EXPECT_EQ(detail.reason, "label has no 'CLASSIFICATION' attribute");
}

TEST_F(AccessFilterTest, EmptyGrantAllowsEverything)
{
    const AccessFilter filter("client-a", AccessGrant{});
    EXPECT_TRUE(filter.evaluate(labelled(1, "nationality=USA")).allowed());
    Record unlabelled;
    EXPECT_TRUE(filter.evaluate(unlabelled).allowed());
}

TEST_F(AccessFilterTest, UnlabelledRecordDeniedWhenGrantRequiresSomething)
{
    const AccessFilter filter("client-a", gbr_fra_secret());
    Record unlabelled;
    EXPECT_FALSE(filter.evaluate(unlabelled).allowed());
}

TEST_F(AccessFilterTest, UnparseableLabelIsDenied)
{
    const AccessFilter filter("client-a", AccessGrant{});
    const auto detail = filter.evaluate(labelled(3, "nationality"));
    EXPECT_FALSE(detail.allowed());
    EXPECT_THAT(detail.reason, HasSubstr("cannot map security label segment"));
}

TEST_F(AccessFilterTest, FilterOutReportsDecisionOrParseError)
{
    const AccessFilter filter("client-a", gbr_fra_secret());

    auto keep = filter.filter_out(labelled(1, "nationality=GBR,classification=SECRET"));
    ASSERT_TRUE(keep.is_ok());
    EXPECT_FALSE(keep.content());

    auto drop = filter.filter_out(labelled(2, "nationality=DEU,classification=SECRET"));
    ASSERT_TRUE(drop.is_ok());
    EXPECT_TRUE(drop.content());

    auto broken = filter.filter_out(labelled(3, "classification"));
    ASSERT_TRUE(broken.is_error());
    EXPECT_EQ(broken.error(), TransferError::LabelParse);
}

TEST_F(AccessFilterTest, OrderedStreamKeepsOnlyAdmittedOffsets)
{
    const AccessFilter filter("client-a", gbr_fra_secret());
    const std::vector<Record> records = {
        labelled(0, "nationality=GBR,classification=SECRET"),
        labelled(1, "nationality=USA,classification=SECRET"),
        labelled(2, "nationality=FRA,classification=SECRET"),
        labelled(3, "nationality=FRA"),
        labelled(4, "bad label"),
    };
    std::vector<int64_t> admitted;
    for (const auto &r : records)
        if (filter.evaluate(r).allowed())
            admitted.push_back(r.offset);
    EXPECT_EQ(admitted, (std::vector<int64_t>{0, 2}));
}
