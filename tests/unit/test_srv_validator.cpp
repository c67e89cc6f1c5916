#include "validation/SrvRecordValidator.hpp"

#include <gtest/gtest.h>

using zonekeeper::validation::SrvRecordValidator;

class SrvValidatorTest : public ::testing::Test {
 protected:
  SrvRecordValidator _srv;
};

TEST_F(SrvValidatorTest, ValidRecordEchoesNameAndContent) {
  auto vr = _srv.validate("20 5060 sip.example.com", "_sip._tcp.example.com", "10", "3600",
                          86400);
  ASSERT_TRUE(vr.isValid());
  EXPECT_TRUE(vr.errors().empty());
  EXPECT_EQ(vr.data().sContent, "20 5060 sip.example.com");
  EXPECT_EQ(vr.data().sName, "_sip._tcp.example.com");
  EXPECT_EQ(vr.data().iPriority, 10);
  EXPECT_EQ(vr.data().uTtl, 3600u);
}

TEST_F(SrvValidatorTest, FourFieldsAreRejected) {
  auto vr = _srv.validate("10 20 5060 sip.example.com", "_sip._tcp.example.com", "10", "3600",
                          86400);
  EXPECT_FALSE(vr.isValid());
  EXPECT_FALSE(vr.errors().empty());
}

TEST_F(SrvValidatorTest, TwoFieldsAreRejected) {
  auto vr = _srv.validate("5060 sip.example.com", "_sip._tcp.example.com", "10", "3600", 86400);
  EXPECT_FALSE(vr.isValid());
}

TEST_F(SrvValidatorTest, WeightOutOfRange) {
  auto vr = _srv.validate("70000 5060 sip.example.com", "_sip._tcp.example.com", "10", "3600",
                          86400);
  ASSERT_FALSE(vr.isValid());
  EXPECT_NE(vr.errors().front().find("weight"), std::string::npos);
}

TEST_F(SrvValidatorTest, PortOutOfRangeAndNonNumeric) {
  EXPECT_FALSE(
      _srv.validate("20 65536 sip.example.com", "_sip._tcp.example.com", "", "", 86400).isValid());
  EXPECT_FALSE(
      _srv.validate("20 sip sip.example.com", "_sip._tcp.example.com", "", "", 86400).isValid());
}

TEST_F(SrvValidatorTest, RootTargetIsAccepted) {
  EXPECT_TRUE(_srv.validate("0 0 .", "_sip._tcp.example.com", "", "", 86400).isValid());
}

TEST_F(SrvValidatorTest, InvalidTargetHostname) {
  EXPECT_FALSE(
      _srv.validate("20 5060 sip..example.com", "_sip._tcp.example.com", "", "", 86400).isValid());
}

TEST_F(SrvValidatorTest, EmptyPriorityDefaultsToTen) {
  auto vr = _srv.validate("20 5060 sip.example.com", "_sip._tcp.example.com", "", "3600", 86400);
  ASSERT_TRUE(vr.isValid());
  EXPECT_EQ(vr.data().iPriority, 10);
}

TEST_F(SrvValidatorTest, EmptyTtlDefaultsToSuppliedDefault) {
  auto vr = _srv.validate("20 5060 sip.example.com", "_sip._tcp.example.com", "10", "", 7200);
  ASSERT_TRUE(vr.isValid());
  EXPECT_EQ(vr.data().uTtl, 7200u);
}

TEST_F(SrvValidatorTest, NameNeedsServiceAndProtocolLabels) {
  EXPECT_FALSE(_srv.validate("20 5060 sip.example.com", "sip.tcp.example.com", "", "", 86400)
                   .isValid());
  EXPECT_FALSE(
      _srv.validate("20 5060 sip.example.com", "_sip.example.com", "", "", 86400).isValid());
  EXPECT_FALSE(
      _srv.validate("20 5060 sip.example.com", "_sip._tcp", "", "", 86400).isValid());
  EXPECT_FALSE(_srv.validate("20 5060 sip.example.com", "_s!p._tcp.example.com", "", "", 86400)
                   .isValid());
  EXPECT_TRUE(_srv.validate("20 5269 xmpp.example.com", "_xmpp-server._tcp.example.com", "", "",
                            86400)
                  .isValid());
}

TEST_F(SrvValidatorTest, PriorityOutOfRange) {
  EXPECT_FALSE(_srv.validate("20 5060 sip.example.com", "_sip._tcp.example.com", "65536", "",
                             86400)
                   .isValid());
}
