#include "TestSupport.hpp"

#include "core/registry/AuditEventLog.hpp"

using namespace pcr;
using namespace pcr::test;

class AuditEventLogTest : public DbTest {};

TEST_F(AuditEventLogTest, EmptyLogHasSequenceZero) {
  AuditEventLog log(db().reader());
  EXPECT_EQ(log.lastSequence(), 0);
  EXPECT_TRUE(log.since(0, 10).empty());
}

TEST_F(AuditEventLogTest, AppendAssignsIncreasingSequenceNumbers) {
  AuditEventLog log(db().writer());
  const int64_t a = log.append(ProductRegistered{"SN-001", kManufacturer, kT0, "ipfs://x"});
  const int64_t b = log.append(StatusUpdated{"SN-001", kManufacturer, kDistributor, "Shipped", kT0 + 5});
  EXPECT_LT(a, b);
  EXPECT_EQ(log.lastSequence(), b);
}

TEST_F(AuditEventLogTest, EventsRoundTripWithAllFields) {
  AuditEventLog log(db().writer());
  log.append(ProductRegistered{"SN-001", kManufacturer, kT0, "ipfs://x"});
  log.append(StatusUpdated{"SN-001", kManufacturer, kDistributor, "Shipped", kT0 + 5});

  auto events = log.forProduct("SN-001");
  ASSERT_EQ(events.size(), 2u);

  ASSERT_EQ(events[0].kind(), EventKind::ProductRegistered);
  const auto& reg = std::get<ProductRegistered>(events[0].body);
  EXPECT_EQ(reg.id, "SN-001");
  EXPECT_EQ(reg.authority_id, kManufacturer);
  EXPECT_EQ(reg.timestamp, kT0);
  EXPECT_EQ(reg.details_uri, "ipfs://x");

  ASSERT_EQ(events[1].kind(), EventKind::StatusUpdated);
  const auto& upd = std::get<StatusUpdated>(events[1].body);
  EXPECT_EQ(upd.id, "SN-001");
  EXPECT_EQ(upd.old_owner, kManufacturer);
  EXPECT_EQ(upd.new_owner, kDistributor);
  EXPECT_EQ(upd.new_status, "Shipped");
  EXPECT_EQ(upd.timestamp, kT0 + 5);
  EXPECT_EQ(events[1].productId(), "SN-001");
  EXPECT_EQ(events[1].timestamp(), kT0 + 5);
}

TEST_F(AuditEventLogTest, ForProductFiltersById) {
  AuditEventLog log(db().writer());
  log.append(ProductRegistered{"SN-001", kManufacturer, kT0, "ipfs://a"});
  log.append(ProductRegistered{"SN-002", kManufacturer, kT0, "ipfs://b"});
  log.append(StatusUpdated{"SN-001", kManufacturer, kDistributor, "Shipped", kT0 + 1});

  auto events = log.forProduct("SN-002");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].productId(), "SN-002");
  EXPECT_TRUE(log.forProduct("SN-404").empty());
}

TEST_F(AuditEventLogTest, InvolvingOwnerMatchesEitherSideOfATransfer) {
  AuditEventLog log(db().writer());
  log.append(ProductRegistered{"SN-001", kManufacturer, kT0, "ipfs://a"});
  log.append(StatusUpdated{"SN-001", kManufacturer, kDistributor, "Shipped", kT0 + 1});
  log.append(StatusUpdated{"SN-001", kDistributor, kCustomer, "Delivered", kT0 + 2});

  auto distributor = log.involvingOwner(kDistributor);
  ASSERT_EQ(distributor.size(), 2u);
  EXPECT_LT(distributor[0].seq, distributor[1].seq);

  EXPECT_EQ(log.involvingOwner(kManufacturer).size(), 2u);
  EXPECT_EQ(log.involvingOwner(kCustomer).size(), 1u);
}

TEST_F(AuditEventLogTest, SinceReturnsTailInCommitOrder) {
  AuditEventLog log(db().writer());
  const int64_t first = log.append(ProductRegistered{"SN-001", kManufacturer, kT0, "u"});
  log.append(ProductRegistered{"SN-002", kManufacturer, kT0, "u"});
  log.append(ProductRegistered{"SN-003", kManufacturer, kT0, "u"});

  auto tail = log.since(first, 10);
  ASSERT_EQ(tail.size(), 2u);
  EXPECT_EQ(tail[0].productId(), "SN-002");
  EXPECT_EQ(tail[1].productId(), "SN-003");

  auto page = log.since(0, 1);
  ASSERT_EQ(page.size(), 1u);
  EXPECT_EQ(page[0].seq, first);
}

TEST_F(AuditEventLogTest, StoredEventsCannotBeRewrittenOrDeleted) {
  AuditEventLog log(db().writer());
  log.append(ProductRegistered{"SN-001", kManufacturer, kT0, "ipfs://x"});

  EXPECT_THROW(db().writer().exec("UPDATE audit_events SET details_uri = 'forged'"), std::runtime_error);
  EXPECT_THROW(db().writer().exec("DELETE FROM audit_events"), std::runtime_error);
  EXPECT_EQ(std::get<ProductRegistered>(log.forProduct("SN-001")[0].body).details_uri, "ipfs://x");
}

TEST(EventKindTest, NamesMatchPersistedKinds) {
  EXPECT_STREQ(eventKindName(EventKind::ProductRegistered), "ProductRegistered");
  EXPECT_STREQ(eventKindName(EventKind::StatusUpdated), "StatusUpdated");
}
